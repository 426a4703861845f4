#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "core/audio_formats.hpp"
#include "core/scan_limits.hpp"

enum class ContainerFormat
{
    MP3,
    WMA,
    AAC,
    M4A,
    M4B,
    FLAC,
    OGG,
    WAV,
    APE,
    Unknown
};

enum class EncodingMode
{
    CBR,
    VBR,
    Unknown
};

enum class TagVersion
{
    None,
    ID3v1Only,
    ID3v22,
    ID3v23,
    ID3v24,
    Other
};

/**
 * @brief Encoding parameters read from one audio file
 */
struct AudioAnalysis
{
    ContainerFormat container = ContainerFormat::Unknown;
    std::optional<int> bitrate_kbps;
    std::optional<EncodingMode> encoding_mode;
    std::optional<int> sample_rate_hz;
    std::optional<TagVersion> tag_version;
    std::optional<int> tag_major_version; // raw ID3v2 major, set with tag_version
    std::optional<int64_t> album_art_bytes;
    bool drm_detected = false;
};

enum class ProbeFailureKind
{
    FileUnreadable,
    MalformedAudioHeader
};

struct ProbeFailure
{
    ProbeFailureKind kind;
    std::string detail;
};

/**
 * @brief Outcome of probing one file
 *
 * Files whose extension is not audio come back with `is_audio == false` and
 * nothing else set. A failure leaves the container Unknown.
 */
struct AudioProbeResult
{
    std::string extension;
    bool is_audio = false;
    bool unsupported = false;
    AudioAnalysis analysis;
    std::optional<ProbeFailure> failure;
};

/**
 * @brief Reads container, bitrate mode, sample rate, tag version and artwork size
 *
 * A pure function of the file's bytes. Reads are bounded windows at chosen
 * offsets, so large files cost a handful of small reads. Malformed or
 * unreadable input is reported through AudioProbeResult::failure, never thrown.
 */
class AudioProbe
{
public:
    explicit AudioProbe(const ScanLimits &limits);

    AudioProbeResult analyze(const std::string &path) const;

    // Container implied by a lower-case extension without the dot
    static ContainerFormat containerForExtension(const std::string &extension);

    static std::string getContainerName(ContainerFormat container);
    static std::string getEncodingModeName(EncodingMode mode);
    static std::string getTagVersionName(TagVersion version);

    // Bytes searched for the first MPEG / ADTS frame after the tag
    static constexpr size_t FRAME_SEARCH_WINDOW = 64 * 1024;
    // Bytes searched forward from each sampling offset
    static constexpr size_t SAMPLE_SEARCH_WINDOW = 16 * 1024;

private:
    ScanLimits limits_;
};
