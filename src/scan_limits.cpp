#include "core/scan_limits.hpp"
#include "core/poco_config_manager.hpp"
#include <algorithm>
#include <cctype>

namespace
{
    size_t positiveOr(int value, size_t def)
    {
        return value > 0 ? static_cast<size_t>(value) : def;
    }
}

ScanLimits ScanLimits::fromConfig(const PocoConfigManager &config)
{
    ScanLimits limits;

    limits.max_total_files = positiveOr(config.getInt("limits.max_total_files", 15000), limits.max_total_files);
    limits.max_root_folders = positiveOr(config.getInt("limits.max_root_folders", 1000), limits.max_root_folders);
    limits.max_files_per_folder = positiveOr(config.getInt("limits.max_files_per_folder", 254), limits.max_files_per_folder);
    limits.max_nesting_depth = config.getInt("limits.max_nesting_depth", limits.max_nesting_depth);
    limits.max_path_length = positiveOr(config.getInt("limits.max_path_length", 60), limits.max_path_length);
    limits.max_filename_length = positiveOr(config.getInt("limits.max_filename_length", 64), limits.max_filename_length);
    limits.allowed_punctuation = config.getString("limits.allowed_punctuation", limits.allowed_punctuation);

    limits.recommended_cluster_size =
        static_cast<uint32_t>(positiveOr(config.getInt("volume.recommended_cluster_size", 32768), limits.recommended_cluster_size));

    limits.min_bitrate_kbps = config.getInt("audio.min_bitrate_kbps", limits.min_bitrate_kbps);
    limits.max_bitrate_kbps = config.getInt("audio.max_bitrate_kbps", limits.max_bitrate_kbps);
    limits.forbidden_bitrates_kbps = config.getIntList("audio.forbidden_bitrates_kbps", "144");
    limits.mp3_sample_rates = config.getIntList("audio.mp3_sample_rates", "32000,44100,48000");
    limits.aac_min_sample_rate = config.getInt("audio.aac_min_sample_rate", limits.aac_min_sample_rate);
    limits.aac_max_sample_rate = config.getInt("audio.aac_max_sample_rate", limits.aac_max_sample_rate);
    limits.max_album_art_bytes = config.getInt("audio.max_album_art_bytes", 750000);
    limits.vbr_sample_count = std::max(1, config.getInt("audio.vbr_sample_count", limits.vbr_sample_count));

    limits.unsupported_extensions.clear();
    for (auto ext : config.getList("audio.unsupported_extensions", "flac,ogg,wav,ape"))
    {
        if (!ext.empty() && ext[0] == '.')
            ext.erase(0, 1);
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        limits.unsupported_extensions.push_back(ext);
    }

    return limits;
}
