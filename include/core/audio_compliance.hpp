#pragma once

#include <string>
#include <vector>
#include "core/audio_probe.hpp"
#include "core/issue_record.hpp"
#include "core/scan_limits.hpp"

/**
 * @brief Turns one probe result into the issue records of that file
 */
class AudioCompliance
{
public:
    /**
     * @param relative_path Path of the file relative to the scan root
     * @param result Probe outcome for the file
     * @param limits Player thresholds
     * @return Records for the file, empty for non-audio files and compliant audio
     */
    static std::vector<IssueRecord> evaluate(const std::string &relative_path, const AudioProbeResult &result,
                                             const ScanLimits &limits);

    static std::string describeFailure(const ProbeFailure &failure);

private:
    static void evaluateMp3(const std::string &path, const AudioAnalysis &analysis, const ScanLimits &limits,
                            std::vector<IssueRecord> &issues);
    static void evaluateMp4(const std::string &path, const AudioAnalysis &analysis, const ScanLimits &limits,
                            std::vector<IssueRecord> &issues);
    static void evaluateWma(const std::string &path, const AudioAnalysis &analysis, const ScanLimits &limits,
                            std::vector<IssueRecord> &issues);
    static void evaluateAlbumArt(const std::string &path, const AudioAnalysis &analysis, const ScanLimits &limits,
                                 std::vector<IssueRecord> &issues);
};
