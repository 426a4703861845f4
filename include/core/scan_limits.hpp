#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

class PocoConfigManager;

/**
 * @brief Thresholds of the target player
 *
 * The values are empirically derived from owner reports rather than a
 * published specification, so every one of them can be overridden from the
 * configuration file. Defaults are the documented limits.
 */
struct ScanLimits
{
    // Structure
    size_t max_total_files = 15000;
    size_t max_root_folders = 1000;
    size_t max_files_per_folder = 254;
    int max_nesting_depth = 8;
    size_t max_path_length = 60;
    size_t max_filename_length = 64;
    std::string allowed_punctuation = "-_.,()[]&'!+#";

    // Volume
    uint32_t recommended_cluster_size = 32768;

    // Audio
    int min_bitrate_kbps = 32;
    int max_bitrate_kbps = 320;
    std::vector<int> forbidden_bitrates_kbps = {144};
    std::vector<int> mp3_sample_rates = {32000, 44100, 48000};
    int aac_min_sample_rate = 8000;
    int aac_max_sample_rate = 96000;
    int64_t max_album_art_bytes = 750000;
    int vbr_sample_count = 8;
    std::vector<std::string> unsupported_extensions = {"flac", "ogg", "wav", "ape"};

    static ScanLimits fromConfig(const PocoConfigManager &config);
};
