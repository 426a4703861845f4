#include "core/audio_compliance.hpp"
#include <algorithm>
#include <cctype>

namespace
{
    std::string toUpper(std::string text)
    {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });
        return text;
    }

    std::string joinRates(const std::vector<int> &rates)
    {
        std::string joined;
        for (size_t i = 0; i < rates.size(); ++i)
        {
            if (i > 0)
                joined += (i + 1 == rates.size()) ? " or " : ", ";
            joined += std::to_string(rates[i]);
        }
        return joined;
    }

    std::string rangeText(int low, int high)
    {
        return "(" + std::to_string(low) + "-" + std::to_string(high) + ")";
    }

    void addDrmIssue(const std::string &path, const AudioAnalysis &analysis, std::vector<IssueRecord> &issues)
    {
        if (analysis.drm_detected)
        {
            issues.emplace_back(path, IssueCategory::EncodingMode, IssueSeverity::Error,
                                "File is likely DRM-protected, will not play");
        }
    }
}

std::vector<IssueRecord> AudioCompliance::evaluate(const std::string &relative_path, const AudioProbeResult &result,
                                                   const ScanLimits &limits)
{
    std::vector<IssueRecord> issues;

    if (!result.is_audio)
        return issues;

    if (result.unsupported)
    {
        issues.emplace_back(relative_path, IssueCategory::UnsupportedFormat, IssueSeverity::Error,
                            "Unsupported format " + toUpper(result.extension) + ", convert to MP3");
        return issues;
    }

    if (result.failure)
    {
        issues.emplace_back(relative_path, IssueCategory::ReadError, IssueSeverity::Warning,
                            describeFailure(*result.failure));
        return issues;
    }

    const AudioAnalysis &analysis = result.analysis;
    switch (analysis.container)
    {
    case ContainerFormat::MP3:
        evaluateMp3(relative_path, analysis, limits, issues);
        break;
    case ContainerFormat::AAC:
    case ContainerFormat::M4A:
    case ContainerFormat::M4B:
        evaluateMp4(relative_path, analysis, limits, issues);
        break;
    case ContainerFormat::WMA:
        evaluateWma(relative_path, analysis, limits, issues);
        break;
    default:
        break;
    }

    return issues;
}

std::string AudioCompliance::describeFailure(const ProbeFailure &failure)
{
    if (failure.kind == ProbeFailureKind::FileUnreadable)
        return "Could not read file: " + failure.detail;
    return "Malformed audio header: " + failure.detail;
}

void AudioCompliance::evaluateMp3(const std::string &path, const AudioAnalysis &analysis, const ScanLimits &limits,
                                  std::vector<IssueRecord> &issues)
{
    if (analysis.encoding_mode && *analysis.encoding_mode == EncodingMode::VBR)
    {
        issues.emplace_back(path, IssueCategory::EncodingMode, IssueSeverity::Warning,
                            "VBR instead of CBR strongly discouraged");
    }

    if (analysis.bitrate_kbps)
    {
        int kbps = *analysis.bitrate_kbps;
        const auto &forbidden = limits.forbidden_bitrates_kbps;
        if (std::find(forbidden.begin(), forbidden.end(), kbps) != forbidden.end())
        {
            issues.emplace_back(path, IssueCategory::Bitrate, IssueSeverity::Error,
                                std::to_string(kbps) + " kbps is explicitly not supported");
        }
        else if (kbps < limits.min_bitrate_kbps || kbps > limits.max_bitrate_kbps)
        {
            issues.emplace_back(path, IssueCategory::Bitrate, IssueSeverity::Error,
                                "Bitrate " + std::to_string(kbps) + " kbps outside supported range " +
                                    rangeText(limits.min_bitrate_kbps, limits.max_bitrate_kbps));
        }
    }

    if (analysis.sample_rate_hz)
    {
        const auto &rates = limits.mp3_sample_rates;
        if (std::find(rates.begin(), rates.end(), *analysis.sample_rate_hz) == rates.end())
        {
            issues.emplace_back(path, IssueCategory::SampleRate, IssueSeverity::Warning,
                                "Sample rate " + std::to_string(*analysis.sample_rate_hz) +
                                    " Hz not supported (use " + joinRates(rates) + " Hz)");
        }
    }

    if (analysis.tag_version)
    {
        switch (*analysis.tag_version)
        {
        case TagVersion::ID3v23:
            break;
        case TagVersion::ID3v24:
            issues.emplace_back(path, IssueCategory::TagVersion, IssueSeverity::Warning,
                                "ID3v2.4 problematic, ID3v2.3 recommended");
            break;
        case TagVersion::ID3v22:
        case TagVersion::Other:
            issues.emplace_back(path, IssueCategory::TagVersion, IssueSeverity::Warning,
                                "Unusual ID3 version 2." + std::to_string(analysis.tag_major_version.value_or(0)) +
                                    ", ID3v2.3 recommended");
            break;
        case TagVersion::ID3v1Only:
            issues.emplace_back(path, IssueCategory::TagVersion, IssueSeverity::Warning,
                                "No ID3v2 tags (ID3v1 only)");
            break;
        case TagVersion::None:
            issues.emplace_back(path, IssueCategory::TagVersion, IssueSeverity::Warning, "No ID3 tags found");
            break;
        }
    }

    evaluateAlbumArt(path, analysis, limits, issues);
}

void AudioCompliance::evaluateMp4(const std::string &path, const AudioAnalysis &analysis, const ScanLimits &limits,
                                  std::vector<IssueRecord> &issues)
{
    addDrmIssue(path, analysis, issues);

    if (analysis.sample_rate_hz &&
        (*analysis.sample_rate_hz < limits.aac_min_sample_rate || *analysis.sample_rate_hz > limits.aac_max_sample_rate))
    {
        issues.emplace_back(path, IssueCategory::SampleRate, IssueSeverity::Warning,
                            "Sample rate " + std::to_string(*analysis.sample_rate_hz) +
                                " Hz outside supported range " +
                                rangeText(limits.aac_min_sample_rate, limits.aac_max_sample_rate) + " Hz");
    }

    evaluateAlbumArt(path, analysis, limits, issues);
}

void AudioCompliance::evaluateWma(const std::string &path, const AudioAnalysis &analysis, const ScanLimits &limits,
                                  std::vector<IssueRecord> &issues)
{
    addDrmIssue(path, analysis, issues);

    if (analysis.bitrate_kbps &&
        (*analysis.bitrate_kbps < limits.min_bitrate_kbps || *analysis.bitrate_kbps > limits.max_bitrate_kbps))
    {
        issues.emplace_back(path, IssueCategory::Bitrate, IssueSeverity::Warning,
                            "Bitrate " + std::to_string(*analysis.bitrate_kbps) + " kbps outside typical range " +
                                rangeText(limits.min_bitrate_kbps, limits.max_bitrate_kbps));
    }
}

void AudioCompliance::evaluateAlbumArt(const std::string &path, const AudioAnalysis &analysis, const ScanLimits &limits,
                                       std::vector<IssueRecord> &issues)
{
    if (analysis.album_art_bytes && *analysis.album_art_bytes > limits.max_album_art_bytes)
    {
        issues.emplace_back(path, IssueCategory::AlbumArtSize, IssueSeverity::Warning,
                            "Large embedded artwork (" + std::to_string(*analysis.album_art_bytes / 1024) +
                                " KB, keep under ~" + std::to_string(limits.max_album_art_bytes / 1000) + " KB)");
    }
}
