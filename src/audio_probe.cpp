#include "core/audio_probe.hpp"
#include "core/file_utils.hpp"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <fstream>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace
{
    /**
     * @brief Bounded positional reads over one file
     *
     * Short reads at end of file are not errors. Any other stream failure
     * latches failed() so the probe can report the file as unreadable.
     */
    class FileReader
    {
    public:
        explicit FileReader(const std::string &path)
        {
            std::error_code ec;
            size_ = fs::file_size(fs::path(path), ec);
            if (ec)
            {
                error_ = ec.message();
                failed_ = true;
                return;
            }

            in_.open(path, std::ios::binary);
            if (!in_.is_open())
            {
                error_ = std::generic_category().message(errno);
                failed_ = true;
            }
        }

        bool isOpen() const { return in_.is_open(); }
        bool failed() const { return failed_; }
        const std::string &error() const { return error_; }
        uint64_t size() const { return size_; }

        bool read(uint64_t offset, size_t length, std::vector<uint8_t> &out)
        {
            out.clear();
            if (failed_)
                return false;
            if (offset >= size_)
                return true;

            length = static_cast<size_t>(std::min<uint64_t>(length, size_ - offset));
            out.resize(length);

            in_.clear();
            in_.seekg(static_cast<std::streamoff>(offset));
            in_.read(reinterpret_cast<char *>(out.data()), static_cast<std::streamsize>(length));
            if (static_cast<size_t>(in_.gcount()) != length)
            {
                out.resize(static_cast<size_t>(in_.gcount()));
                failed_ = true;
                error_ = "read failed at offset " + std::to_string(offset);
                return false;
            }
            return true;
        }

    private:
        std::ifstream in_;
        uint64_t size_ = 0;
        bool failed_ = false;
        std::string error_;
    };

    ProbeFailure malformed(const std::string &detail)
    {
        return ProbeFailure{ProbeFailureKind::MalformedAudioHeader, detail};
    }

    TagVersion tagVersionForMajor(int major)
    {
        switch (major)
        {
        case 2:
            return TagVersion::ID3v22;
        case 3:
            return TagVersion::ID3v23;
        case 4:
            return TagVersion::ID3v24;
        default:
            return TagVersion::Other;
        }
    }

    // ---------------------------------------------------------------- MP3

    struct FrameMatch
    {
        uint64_t offset;
        MpegFrameHeader header;
    };

    // A frame counts only if another frame of the same stream follows it,
    // or if it ends exactly where the audio data ends.
    bool confirmNextFrame(FileReader &reader, uint64_t offset, const MpegFrameHeader &header, uint64_t audio_end)
    {
        uint64_t next = offset + header.frame_length;
        if (next + 4 > audio_end)
            return next == audio_end;

        std::vector<uint8_t> buf;
        if (!reader.read(next, 4, buf))
            return false;
        auto following = AudioFormats::parseMpegFrameHeader(buf.data(), buf.size());
        return following.success && following.value.sameStream(header);
    }

    std::optional<FrameMatch> findFrame(FileReader &reader, uint64_t start, size_t window, uint64_t audio_end,
                                        const MpegFrameHeader *stream)
    {
        if (start >= audio_end)
            return std::nullopt;

        std::vector<uint8_t> buf;
        size_t length = static_cast<size_t>(std::min<uint64_t>(window + 4, audio_end - start));
        if (!reader.read(start, length, buf))
            return std::nullopt;

        for (size_t i = 0; i + 4 <= buf.size(); ++i)
        {
            if (buf[i] != 0xFF || (buf[i + 1] & 0xE0) != 0xE0)
                continue;

            auto parsed = AudioFormats::parseMpegFrameHeader(buf.data() + i, buf.size() - i);
            if (!parsed.success)
                continue;
            if (stream && !parsed.value.sameStream(*stream))
                continue;

            size_t next = i + parsed.value.frame_length;
            bool confirmed;
            if (next + 4 <= buf.size())
            {
                auto following = AudioFormats::parseMpegFrameHeader(buf.data() + next, 4);
                confirmed = following.success && following.value.sameStream(parsed.value);
            }
            else
            {
                confirmed = confirmNextFrame(reader, start + i, parsed.value, audio_end);
            }

            if (confirmed)
                return FrameMatch{start + i, parsed.value};
        }
        return std::nullopt;
    }

    // Largest APIC/PIC image in the tag, nullopt when the tag carries no picture
    std::optional<int64_t> largestPicture(FileReader &reader, const Id3v2Header &tag)
    {
        if (tag.major < 2 || tag.major > 4)
            return std::nullopt;

        uint64_t body_end = std::min<uint64_t>(10 + static_cast<uint64_t>(tag.body_size), reader.size());
        uint64_t pos = 10;
        std::vector<uint8_t> buf;

        if (tag.hasExtendedHeader())
        {
            reader.read(pos, 4, buf);
            auto ext = AudioFormats::parseId3ExtendedHeaderSize(buf.data(), buf.size(), tag.major);
            if (!ext.success)
                return std::nullopt;
            pos += ext.value;
        }

        size_t header_size = tag.major == 2 ? 6 : 10;
        std::optional<int64_t> largest;

        while (pos + header_size <= body_end)
        {
            if (!reader.read(pos, header_size, buf))
                break;
            auto frame = AudioFormats::parseId3FrameHeader(buf.data(), buf.size(), tag.major);
            if (!frame.success || frame.value.isPadding())
                break;

            uint64_t payload = pos + header_size;
            if (payload + frame.value.size > body_end)
                break;

            if (frame.value.isPicture())
            {
                reader.read(payload, static_cast<size_t>(std::min<uint64_t>(frame.value.size, 4096)), buf);
                auto picture = AudioFormats::parsePictureFrame(buf.data(), buf.size(), frame.value.size, tag.major);
                // An unparsable picture prefix still holds roughly frame-size bytes of image
                int64_t image = picture.success ? static_cast<int64_t>(picture.value)
                                                : static_cast<int64_t>(frame.value.size);
                if (!largest || image > *largest)
                    largest = image;
            }

            pos = payload + frame.value.size;
        }
        return largest;
    }

    std::optional<ProbeFailure> analyzeMp3(FileReader &reader, const ScanLimits &limits, AudioAnalysis &analysis)
    {
        std::vector<uint8_t> buf;
        uint64_t size = reader.size();
        uint64_t audio_start = 0;
        uint64_t audio_end = size;

        bool has_v1 = false;
        if (size >= 128 && reader.read(size - 128, 128, buf) && AudioFormats::isId3v1Trailer(buf.data(), buf.size()))
        {
            has_v1 = true;
            audio_end -= 128;
        }

        reader.read(0, 10, buf);
        auto id3 = AudioFormats::parseId3v2Header(buf.data(), buf.size());
        if (id3.success)
        {
            analysis.tag_major_version = id3.value.major;
            analysis.tag_version = tagVersionForMajor(id3.value.major);
            audio_start = id3.value.total_size;
            if (audio_start > size)
                return malformed("ID3v2 tag size " + std::to_string(audio_start) + " exceeds file size " +
                                 std::to_string(size));
            analysis.album_art_bytes = largestPicture(reader, id3.value);
        }
        else if (id3.error == ParseError::BAD_SIGNATURE || id3.error == ParseError::TRUNCATED)
        {
            analysis.tag_version = has_v1 ? TagVersion::ID3v1Only : TagVersion::None;
        }
        else
        {
            return malformed("Invalid ID3v2 header: " + id3.error_message);
        }

        if (audio_start >= audio_end)
            return malformed("No audio data after ID3v2 tag");

        auto first = findFrame(reader, audio_start, AudioProbe::FRAME_SEARCH_WINDOW, audio_end, nullptr);
        if (!first)
            return malformed("No valid MPEG frame header found in the first " +
                             std::to_string(AudioProbe::FRAME_SEARCH_WINDOW / 1024) + " KB of audio data");

        analysis.sample_rate_hz = first->header.sample_rate_hz;

        reader.read(first->offset, std::min<size_t>(first->header.frame_length, 256), buf);
        auto vbr = AudioFormats::parseVbrHeader(buf.data(), buf.size(), first->header);

        // The frame carrying a VBR block holds no audio, sampling starts after it
        uint64_t data_start = first->offset + (vbr.success ? first->header.frame_length : 0);

        std::vector<int> samples;
        int sample_count = std::max(1, limits.vbr_sample_count);
        uint64_t span = audio_end > data_start ? audio_end - data_start : 0;
        for (int i = 0; i < sample_count && span > 0; ++i)
        {
            uint64_t offset = data_start + span * static_cast<uint64_t>(i) / static_cast<uint64_t>(sample_count);
            auto match = findFrame(reader, offset, AudioProbe::SAMPLE_SEARCH_WINDOW, audio_end, &first->header);
            if (match)
                samples.push_back(match->header.bitrate_kbps);
        }

        bool disagree = std::any_of(samples.begin(), samples.end(),
                                    [&samples](int kbps)
                                    { return kbps != samples.front(); });
        bool is_vbr = disagree || (vbr.success && vbr.value.isVbr());
        analysis.encoding_mode = is_vbr ? EncodingMode::VBR : EncodingMode::CBR;

        if (!is_vbr)
        {
            analysis.bitrate_kbps = samples.empty() ? first->header.bitrate_kbps : samples.front();
        }
        else
        {
            int average = vbr.success ? AudioFormats::averageBitrateKbps(vbr.value, first->header) : 0;
            if (average <= 0 && !samples.empty())
            {
                double sum = 0;
                for (int kbps : samples)
                    sum += kbps;
                average = static_cast<int>(std::lround(sum / static_cast<double>(samples.size())));
            }
            analysis.bitrate_kbps = average > 0 ? average : first->header.bitrate_kbps;
        }

        return std::nullopt;
    }

    // ---------------------------------------------------------------- MP4

    const int MAX_BOX_DEPTH = 12;

    struct Mp4Walk
    {
        std::string handler; // hdlr of the current track
        bool has_moov = false;
        bool audio_entry_seen = false;
        int sample_rate_hz = 0;
        std::string sample_rate_error;
        bool drm = false;
        std::optional<int64_t> cover_art;
        std::optional<std::string> error;
    };

    bool isContainerBox(const std::string &type)
    {
        static const char *containers[] = {"moov", "trak", "mdia", "minf", "stbl", "udta", "ilst",
                                           "covr", "sinf", "schi", "edts", "mvex", "moof", "traf", "dinf"};
        for (const char *c : containers)
        {
            if (type == c)
                return true;
        }
        return false;
    }

    bool isAudioSampleEntry(const std::string &type)
    {
        static const char *entries[] = {"mp4a", "enca", "drms", "alac", "ac-3", "ec-3", "samr", "sawb", ".mp3", "Opus", "fLaC"};
        for (const char *e : entries)
        {
            if (type == e)
                return true;
        }
        return false;
    }

    void walkBoxes(FileReader &reader, uint64_t start, uint64_t end, int depth, const std::string &parent, Mp4Walk &walk);

    void walkSampleDescriptions(FileReader &reader, uint64_t start, uint64_t end, int depth, Mp4Walk &walk)
    {
        std::vector<uint8_t> buf;
        if (!reader.read(start, 8, buf) || buf.size() < 8)
        {
            walk.error = "stsd box truncated";
            return;
        }

        uint32_t count = AudioFormats::readBe32(buf.data() + 4);
        uint64_t pos = start + 8;
        for (uint32_t i = 0; i < count && pos + 8 <= end && !walk.error; ++i)
        {
            if (!reader.read(pos, 64, buf))
                return;
            auto entry = AudioFormats::parseBoxHeader(buf.data(), buf.size(), end - pos);
            if (!entry.success)
            {
                walk.error = "sample entry: " + entry.error_message;
                return;
            }

            const std::string &type = entry.value.type;
            if (type == "enca" || type == "drms")
                walk.drm = true;

            bool audio = walk.handler == "soun" || (walk.handler.empty() && isAudioSampleEntry(type));
            if (audio)
            {
                walk.audio_entry_seen = true;
                size_t available = static_cast<size_t>(std::min<uint64_t>(buf.size(), entry.value.size));
                if (walk.sample_rate_hz == 0)
                {
                    auto rate = AudioFormats::parseAudioSampleEntryRate(buf.data(), available);
                    if (rate.success)
                        walk.sample_rate_hz = rate.value;
                    else
                        walk.sample_rate_error = rate.error_message;
                }

                // Child boxes (esds, sinf) follow the version-dependent sound description
                uint16_t version = available >= 18 ? static_cast<uint16_t>((buf[16] << 8) | buf[17]) : 0;
                uint64_t children = pos + (version == 1 ? 52 : (version == 2 ? 72 : 36));
                if (children < pos + entry.value.size)
                    walkBoxes(reader, children, pos + entry.value.size, depth + 1, type, walk);
            }

            pos += entry.value.size;
        }
    }

    void walkBoxes(FileReader &reader, uint64_t start, uint64_t end, int depth, const std::string &parent, Mp4Walk &walk)
    {
        std::vector<uint8_t> buf;
        uint64_t pos = start;

        while (pos + 8 <= end && !walk.error)
        {
            if (!reader.read(pos, 16, buf))
                return;
            auto parsed = AudioFormats::parseBoxHeader(buf.data(), buf.size(), end - pos);
            if (!parsed.success)
            {
                walk.error = parsed.error_message;
                return;
            }

            const BoxHeader &box = parsed.value;
            uint64_t payload = pos + box.header_size;
            uint64_t box_end = pos + box.size;

            if (box.type == "moov")
                walk.has_moov = true;
            if (box.type == "sinf" || box.type == "pssh")
                walk.drm = true;

            if (depth < MAX_BOX_DEPTH)
            {
                if (box.type == "trak")
                {
                    walk.handler.clear();
                    walkBoxes(reader, payload, box_end, depth + 1, box.type, walk);
                }
                else if (isContainerBox(box.type))
                {
                    walkBoxes(reader, payload, box_end, depth + 1, box.type, walk);
                }
                else if (box.type == "meta")
                {
                    // ISO meta is a full box, QuickTime meta is not
                    if (reader.read(payload, 4, buf) && buf.size() == 4 && AudioFormats::readBe32(buf.data()) == 0)
                        payload += 4;
                    walkBoxes(reader, payload, box_end, depth + 1, box.type, walk);
                }
                else if (box.type == "hdlr" && parent == "mdia")
                {
                    if (reader.read(payload, 12, buf) && buf.size() == 12)
                        walk.handler.assign(reinterpret_cast<const char *>(buf.data() + 8), 4);
                }
                else if (box.type == "stsd")
                {
                    walkSampleDescriptions(reader, payload, box_end, depth + 1, walk);
                }
                else if (box.type == "data" && parent == "covr" && box.payloadSize() > 8)
                {
                    // type indicator (4) + locale (4), then the image
                    int64_t image = static_cast<int64_t>(box.payloadSize() - 8);
                    if (!walk.cover_art || image > *walk.cover_art)
                        walk.cover_art = image;
                }
            }

            pos = box_end;
        }
    }

    std::optional<ProbeFailure> analyzeMp4(FileReader &reader, AudioAnalysis &analysis)
    {
        Mp4Walk walk;
        walkBoxes(reader, 0, reader.size(), 0, "", walk);

        if (walk.error)
            return malformed("Invalid MP4 box structure: " + *walk.error);
        if (!walk.has_moov)
            return malformed("No moov box found");
        if (!walk.audio_entry_seen)
            return malformed("No audio track found");
        if (walk.sample_rate_hz == 0)
            return malformed("Unreadable audio sample entry: " + walk.sample_rate_error);

        analysis.sample_rate_hz = walk.sample_rate_hz;
        analysis.drm_detected = walk.drm;
        analysis.album_art_bytes = walk.cover_art;
        return std::nullopt;
    }

    // ---------------------------------------------------------------- ADTS

    std::optional<ProbeFailure> analyzeAdts(FileReader &reader, AudioAnalysis &analysis)
    {
        std::vector<uint8_t> buf;
        uint64_t start = 0;

        reader.read(0, 10, buf);
        auto id3 = AudioFormats::parseId3v2Header(buf.data(), buf.size());
        if (id3.success)
            start = id3.value.total_size;

        uint64_t size = reader.size();
        if (start >= size)
            return malformed("No audio data after ID3v2 tag");

        size_t length = static_cast<size_t>(std::min<uint64_t>(AudioProbe::FRAME_SEARCH_WINDOW + 7, size - start));
        if (!reader.read(start, length, buf))
            return std::nullopt;

        for (size_t i = 0; i + 7 <= buf.size(); ++i)
        {
            if (buf[i] != 0xFF || (buf[i + 1] & 0xF6) != 0xF0)
                continue;
            auto frame = AudioFormats::parseAdtsHeader(buf.data() + i, buf.size() - i);
            if (!frame.success)
                continue;

            uint64_t next = start + i + frame.value.frame_length;
            bool confirmed = next == size;
            if (next + 7 <= size)
            {
                std::vector<uint8_t> following;
                if (!reader.read(next, 7, following))
                    return std::nullopt;
                auto second = AudioFormats::parseAdtsHeader(following.data(), following.size());
                confirmed = second.success && second.value.sample_rate_hz == frame.value.sample_rate_hz;
            }

            if (confirmed)
            {
                analysis.sample_rate_hz = frame.value.sample_rate_hz;
                return std::nullopt;
            }
        }

        return malformed("No ADTS frame header found in the first " +
                         std::to_string(AudioProbe::FRAME_SEARCH_WINDOW / 1024) + " KB");
    }

    // ---------------------------------------------------------------- ASF

    bool sameGuid(const AsfGuid &a, const AsfGuid &b)
    {
        return std::equal(a.begin(), a.end(), b.begin());
    }

    std::optional<ProbeFailure> analyzeAsf(FileReader &reader, AudioAnalysis &analysis)
    {
        std::vector<uint8_t> buf;
        reader.read(0, 30, buf);
        auto header = AudioFormats::parseAsfObjectHeader(buf.data(), buf.size());
        if (!header.success)
            return malformed("Invalid ASF header: " + header.error_message);
        if (!sameGuid(header.value.guid, AudioFormats::asfHeaderGuid()))
            return malformed("Not an ASF file (missing header object)");
        if (buf.size() < 30)
            return malformed("Invalid ASF header: header object truncated");

        uint64_t end = std::min<uint64_t>(header.value.size, reader.size());
        uint64_t pos = 30;
        bool audio_found = false;

        while (pos + 24 <= end)
        {
            if (!reader.read(pos, 24, buf))
                return std::nullopt;
            auto object = AudioFormats::parseAsfObjectHeader(buf.data(), buf.size());
            if (!object.success)
                return malformed("Invalid ASF object: " + object.error_message);
            if (object.value.size > end - pos)
                return malformed("ASF object overruns the header object");

            const AsfGuid &guid = object.value.guid;
            if (!audio_found && sameGuid(guid, AudioFormats::asfStreamPropertiesGuid()))
            {
                if (!reader.read(pos, static_cast<size_t>(std::min<uint64_t>(object.value.size, 512)), buf))
                    return std::nullopt;
                auto stream = AudioFormats::parseAsfStreamProperties(buf.data(), buf.size());
                if (stream.success)
                {
                    audio_found = true;
                    analysis.bitrate_kbps = stream.value.bitrate_kbps;
                    analysis.sample_rate_hz = stream.value.sample_rate_hz;
                }
                else if (stream.error != ParseError::RESERVED_VALUE)
                {
                    return malformed("Invalid stream properties: " + stream.error_message);
                }
            }
            else if (sameGuid(guid, AudioFormats::asfContentEncryptionGuid()) ||
                     sameGuid(guid, AudioFormats::asfExtendedContentEncryptionGuid()))
            {
                analysis.drm_detected = true;
            }

            pos += object.value.size;
        }

        if (!audio_found)
            return malformed("No audio stream properties found");
        return std::nullopt;
    }

    bool looksLikeMp4(FileReader &reader)
    {
        std::vector<uint8_t> buf;
        return reader.read(0, 8, buf) && buf.size() == 8 && std::memcmp(buf.data() + 4, "ftyp", 4) == 0;
    }
}

AudioProbe::AudioProbe(const ScanLimits &limits) : limits_(limits)
{
}

AudioProbeResult AudioProbe::analyze(const std::string &path) const
{
    AudioProbeResult result;
    result.extension = FileUtils::getFileExtension(path);

    ContainerFormat container = containerForExtension(result.extension);

    if (std::find(limits_.unsupported_extensions.begin(), limits_.unsupported_extensions.end(),
                  result.extension) != limits_.unsupported_extensions.end())
    {
        result.is_audio = true;
        result.unsupported = true;
        result.analysis.container = container;
        return result;
    }

    switch (container)
    {
    case ContainerFormat::MP3:
    case ContainerFormat::WMA:
    case ContainerFormat::AAC:
    case ContainerFormat::M4A:
    case ContainerFormat::M4B:
        break;
    default:
        return result;
    }

    result.is_audio = true;

    FileReader reader(path);
    if (reader.failed())
    {
        result.failure = ProbeFailure{ProbeFailureKind::FileUnreadable, reader.error()};
        return result;
    }

    AudioAnalysis analysis;
    analysis.container = container;

    std::optional<ProbeFailure> failure;
    switch (container)
    {
    case ContainerFormat::MP3:
        failure = analyzeMp3(reader, limits_, analysis);
        break;
    case ContainerFormat::WMA:
        failure = analyzeAsf(reader, analysis);
        break;
    case ContainerFormat::AAC:
        // Some .aac files are really MP4 containers
        failure = looksLikeMp4(reader) ? analyzeMp4(reader, analysis) : analyzeAdts(reader, analysis);
        break;
    default:
        failure = analyzeMp4(reader, analysis);
        break;
    }

    if (reader.failed())
        failure = ProbeFailure{ProbeFailureKind::FileUnreadable, reader.error()};

    if (failure)
    {
        result.failure = failure;
        return result;
    }

    if (result.extension == "m4p")
        analysis.drm_detected = true;

    result.analysis = analysis;
    return result;
}

ContainerFormat AudioProbe::containerForExtension(const std::string &extension)
{
    if (extension == "mp3")
        return ContainerFormat::MP3;
    if (extension == "wma")
        return ContainerFormat::WMA;
    if (extension == "aac")
        return ContainerFormat::AAC;
    if (extension == "m4a" || extension == "m4p")
        return ContainerFormat::M4A;
    if (extension == "m4b")
        return ContainerFormat::M4B;
    if (extension == "flac")
        return ContainerFormat::FLAC;
    if (extension == "ogg")
        return ContainerFormat::OGG;
    if (extension == "wav")
        return ContainerFormat::WAV;
    if (extension == "ape")
        return ContainerFormat::APE;
    return ContainerFormat::Unknown;
}

std::string AudioProbe::getContainerName(ContainerFormat container)
{
    switch (container)
    {
    case ContainerFormat::MP3:
        return "MP3";
    case ContainerFormat::WMA:
        return "WMA";
    case ContainerFormat::AAC:
        return "AAC";
    case ContainerFormat::M4A:
        return "M4A";
    case ContainerFormat::M4B:
        return "M4B";
    case ContainerFormat::FLAC:
        return "FLAC";
    case ContainerFormat::OGG:
        return "OGG";
    case ContainerFormat::WAV:
        return "WAV";
    case ContainerFormat::APE:
        return "APE";
    default:
        return "Unknown";
    }
}

std::string AudioProbe::getEncodingModeName(EncodingMode mode)
{
    switch (mode)
    {
    case EncodingMode::CBR:
        return "CBR";
    case EncodingMode::VBR:
        return "VBR";
    default:
        return "Unknown";
    }
}

std::string AudioProbe::getTagVersionName(TagVersion version)
{
    switch (version)
    {
    case TagVersion::None:
        return "None";
    case TagVersion::ID3v1Only:
        return "ID3v1";
    case TagVersion::ID3v22:
        return "ID3v2.2";
    case TagVersion::ID3v23:
        return "ID3v2.3";
    case TagVersion::ID3v24:
        return "ID3v2.4";
    default:
        return "Other";
    }
}
