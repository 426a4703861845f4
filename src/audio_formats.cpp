#include "core/audio_formats.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>

namespace
{
    // Bitrate tables in kbps, indexed by the 4-bit bitrate index
    const int BITRATES_V1_L1[16] = {0, 32, 64, 96, 128, 160, 192, 224, 256, 288, 320, 352, 384, 416, 448, -1};
    const int BITRATES_V1_L2[16] = {0, 32, 48, 56, 64, 80, 96, 112, 128, 160, 192, 224, 256, 320, 384, -1};
    const int BITRATES_V1_L3[16] = {0, 32, 40, 48, 56, 64, 80, 96, 112, 128, 160, 192, 224, 256, 320, -1};
    const int BITRATES_V2_L1[16] = {0, 32, 48, 56, 64, 80, 96, 112, 128, 144, 160, 176, 192, 224, 256, -1};
    const int BITRATES_V2_L23[16] = {0, 8, 16, 24, 32, 40, 48, 56, 64, 80, 96, 112, 128, 144, 160, -1};

    const int SAMPLE_RATES_V1[3] = {44100, 48000, 32000};
    const int SAMPLE_RATES_V2[3] = {22050, 24000, 16000};
    const int SAMPLE_RATES_V25[3] = {11025, 12000, 8000};

    const int ADTS_SAMPLE_RATES[13] = {96000, 88200, 64000, 48000, 44100, 32000, 24000,
                                       22050, 16000, 12000, 11025, 8000, 7350};

    // Offset of the Xing/Info block: 4-byte header plus the Layer III side information
    size_t xingOffset(const MpegFrameHeader &header)
    {
        if (header.version == MpegFrameHeader::Version::MPEG1)
            return 4 + (header.mono ? 17 : 32);
        return 4 + (header.mono ? 9 : 17);
    }

    const size_t VBRI_OFFSET = 4 + 32;

    bool isFrameIdChar(uint8_t c)
    {
        return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
    }

    // Length of a terminated string starting at `pos`, terminator included
    // Returns 0 when no terminator is found before `end`.
    size_t terminatedLength(const uint8_t *data, size_t pos, size_t end, bool wide)
    {
        if (wide)
        {
            for (size_t i = pos; i + 1 < end; i += 2)
            {
                if (data[i] == 0 && data[i + 1] == 0)
                    return i + 2 - pos;
            }
            return 0;
        }
        for (size_t i = pos; i < end; ++i)
        {
            if (data[i] == 0)
                return i + 1 - pos;
        }
        return 0;
    }
}

uint16_t AudioFormats::readLe16(const uint8_t *p)
{
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t AudioFormats::readLe32(const uint8_t *p)
{
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

uint64_t AudioFormats::readLe64(const uint8_t *p)
{
    return static_cast<uint64_t>(readLe32(p)) | (static_cast<uint64_t>(readLe32(p + 4)) << 32);
}

uint32_t AudioFormats::readBe32(const uint8_t *p)
{
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

uint64_t AudioFormats::readBe64(const uint8_t *p)
{
    return (static_cast<uint64_t>(readBe32(p)) << 32) | static_cast<uint64_t>(readBe32(p + 4));
}

ParseResult<MpegFrameHeader> AudioFormats::parseMpegFrameHeader(const uint8_t *data, size_t size)
{
    using Result = ParseResult<MpegFrameHeader>;

    if (size < 4)
        return Result::fail(ParseError::TRUNCATED, "frame header needs 4 bytes");
    if (data[0] != 0xFF || (data[1] & 0xE0) != 0xE0)
        return Result::fail(ParseError::BAD_SIGNATURE, "no frame sync");

    MpegFrameHeader header;

    int version_bits = (data[1] >> 3) & 0x03;
    switch (version_bits)
    {
    case 0:
        header.version = MpegFrameHeader::Version::MPEG25;
        break;
    case 2:
        header.version = MpegFrameHeader::Version::MPEG2;
        break;
    case 3:
        header.version = MpegFrameHeader::Version::MPEG1;
        break;
    default:
        return Result::fail(ParseError::RESERVED_VALUE, "reserved MPEG version");
    }

    int layer_bits = (data[1] >> 1) & 0x03;
    if (layer_bits == 0)
        return Result::fail(ParseError::RESERVED_VALUE, "reserved layer");
    header.layer = 4 - layer_bits;

    int bitrate_index = (data[2] >> 4) & 0x0F;
    if (bitrate_index == 0)
        return Result::fail(ParseError::RESERVED_VALUE, "free-format bitrate");
    if (bitrate_index == 15)
        return Result::fail(ParseError::RESERVED_VALUE, "bad bitrate index");

    bool v1 = header.version == MpegFrameHeader::Version::MPEG1;
    const int *table;
    if (v1)
        table = header.layer == 1 ? BITRATES_V1_L1 : (header.layer == 2 ? BITRATES_V1_L2 : BITRATES_V1_L3);
    else
        table = header.layer == 1 ? BITRATES_V2_L1 : BITRATES_V2_L23;
    header.bitrate_kbps = table[bitrate_index];

    int sr_index = (data[2] >> 2) & 0x03;
    if (sr_index == 3)
        return Result::fail(ParseError::RESERVED_VALUE, "reserved sample rate index");
    switch (header.version)
    {
    case MpegFrameHeader::Version::MPEG1:
        header.sample_rate_hz = SAMPLE_RATES_V1[sr_index];
        break;
    case MpegFrameHeader::Version::MPEG2:
        header.sample_rate_hz = SAMPLE_RATES_V2[sr_index];
        break;
    case MpegFrameHeader::Version::MPEG25:
        header.sample_rate_hz = SAMPLE_RATES_V25[sr_index];
        break;
    }

    header.padding = ((data[2] >> 1) & 0x01) != 0;
    header.mono = ((data[3] >> 6) & 0x03) == 3;

    long bits_per_second = static_cast<long>(header.bitrate_kbps) * 1000;
    int pad = header.padding ? 1 : 0;
    if (header.layer == 1)
        header.frame_length = static_cast<size_t>((12 * bits_per_second / header.sample_rate_hz + pad) * 4);
    else if (header.layer == 3 && !v1)
        header.frame_length = static_cast<size_t>(72 * bits_per_second / header.sample_rate_hz + pad);
    else
        header.frame_length = static_cast<size_t>(144 * bits_per_second / header.sample_rate_hz + pad);

    return Result::ok(header);
}

int AudioFormats::samplesPerFrame(const MpegFrameHeader &header)
{
    if (header.layer == 1)
        return 384;
    if (header.layer == 3 && header.version != MpegFrameHeader::Version::MPEG1)
        return 576;
    return 1152;
}

ParseResult<VbrHeader> AudioFormats::parseVbrHeader(const uint8_t *frame, size_t size, const MpegFrameHeader &header)
{
    using Result = ParseResult<VbrHeader>;

    if (header.layer != 3)
        return Result::fail(ParseError::BAD_SIGNATURE, "VBR blocks only exist in Layer III");

    size_t limit = std::min(size, header.frame_length);

    size_t off = xingOffset(header);
    if (off + 8 <= limit && (std::memcmp(frame + off, "Xing", 4) == 0 || std::memcmp(frame + off, "Info", 4) == 0))
    {
        VbrHeader vbr;
        vbr.marker.assign(reinterpret_cast<const char *>(frame + off), 4);
        uint32_t flags = readBe32(frame + off + 4);
        size_t pos = off + 8;
        if (flags & 0x01)
        {
            if (pos + 4 > limit)
                return Result::fail(ParseError::TRUNCATED, vbr.marker + " frame count truncated");
            vbr.frame_count = readBe32(frame + pos);
            pos += 4;
        }
        if (flags & 0x02)
        {
            if (pos + 4 > limit)
                return Result::fail(ParseError::TRUNCATED, vbr.marker + " byte count truncated");
            vbr.byte_count = readBe32(frame + pos);
        }
        return Result::ok(vbr);
    }

    if (VBRI_OFFSET + 18 <= limit && std::memcmp(frame + VBRI_OFFSET, "VBRI", 4) == 0)
    {
        VbrHeader vbr;
        vbr.marker = "VBRI";
        vbr.byte_count = readBe32(frame + VBRI_OFFSET + 10);
        vbr.frame_count = readBe32(frame + VBRI_OFFSET + 14);
        return Result::ok(vbr);
    }

    return Result::fail(ParseError::BAD_SIGNATURE, "no VBR block");
}

int AudioFormats::averageBitrateKbps(const VbrHeader &vbr, const MpegFrameHeader &first)
{
    if (!vbr.frame_count || !vbr.byte_count || *vbr.frame_count == 0 || *vbr.byte_count == 0)
        return 0;

    double seconds = static_cast<double>(*vbr.frame_count) * samplesPerFrame(first) / first.sample_rate_hz;
    return static_cast<int>(std::lround(static_cast<double>(*vbr.byte_count) * 8.0 / seconds / 1000.0));
}

uint32_t AudioFormats::decodeSynchsafe(const uint8_t *data)
{
    return (static_cast<uint32_t>(data[0] & 0x7F) << 21) | (static_cast<uint32_t>(data[1] & 0x7F) << 14) |
           (static_cast<uint32_t>(data[2] & 0x7F) << 7) | static_cast<uint32_t>(data[3] & 0x7F);
}

ParseResult<Id3v2Header> AudioFormats::parseId3v2Header(const uint8_t *data, size_t size)
{
    using Result = ParseResult<Id3v2Header>;

    if (size < 10)
        return Result::fail(ParseError::TRUNCATED, "ID3v2 header needs 10 bytes");
    if (std::memcmp(data, "ID3", 3) != 0)
        return Result::fail(ParseError::BAD_SIGNATURE, "no ID3v2 identifier");
    if (data[3] == 0xFF || data[4] == 0xFF)
        return Result::fail(ParseError::RESERVED_VALUE, "invalid ID3v2 version bytes");
    for (int i = 6; i < 10; ++i)
    {
        if (data[i] & 0x80)
            return Result::fail(ParseError::INCONSISTENT, "ID3v2 size is not synchsafe");
    }

    Id3v2Header header;
    header.major = data[3];
    header.revision = data[4];
    header.flags = data[5];
    header.body_size = decodeSynchsafe(data + 6);
    header.total_size = 10 + header.body_size + (header.hasFooter() ? 10 : 0);
    return Result::ok(header);
}

ParseResult<uint32_t> AudioFormats::parseId3ExtendedHeaderSize(const uint8_t *data, size_t size, int major)
{
    using Result = ParseResult<uint32_t>;

    if (size < 4)
        return Result::fail(ParseError::TRUNCATED, "extended header size truncated");

    if (major == 3)
        return Result::ok(readBe32(data) + 4);

    uint32_t ext = decodeSynchsafe(data);
    if (ext < 6)
        return Result::fail(ParseError::INCONSISTENT, "extended header smaller than its minimum");
    return Result::ok(ext);
}

ParseResult<Id3FrameHeader> AudioFormats::parseId3FrameHeader(const uint8_t *data, size_t size, int major)
{
    using Result = ParseResult<Id3FrameHeader>;

    size_t header_size = major == 2 ? 6 : 10;
    size_t id_size = major == 2 ? 3 : 4;

    if (size < header_size)
        return Result::fail(ParseError::TRUNCATED, "frame header truncated");

    Id3FrameHeader frame;
    frame.header_size = header_size;

    if (data[0] == 0)
        return Result::ok(frame); // padding

    for (size_t i = 0; i < id_size; ++i)
    {
        if (!isFrameIdChar(data[i]))
            return Result::fail(ParseError::BAD_SIGNATURE, "invalid frame identifier");
    }
    frame.id.assign(reinterpret_cast<const char *>(data), id_size);

    if (major == 2)
        frame.size = (static_cast<uint32_t>(data[3]) << 16) | (static_cast<uint32_t>(data[4]) << 8) | data[5];
    else if (major == 3)
        frame.size = readBe32(data + 4);
    else
        frame.size = decodeSynchsafe(data + 4);

    return Result::ok(frame);
}

ParseResult<uint64_t> AudioFormats::parsePictureFrame(const uint8_t *data, size_t available, uint32_t frame_size, int major)
{
    using Result = ParseResult<uint64_t>;

    size_t end = std::min<size_t>(available, frame_size);
    if (end < 1)
        return Result::fail(ParseError::TRUNCATED, "empty picture frame");

    uint8_t encoding = data[0];
    if (encoding > 3)
        return Result::fail(ParseError::RESERVED_VALUE, "unknown text encoding " + std::to_string(encoding));
    bool wide = encoding == 1 || encoding == 2;

    size_t pos = 1;
    if (major == 2)
    {
        // 3-byte image format instead of a MIME string
        pos += 3;
    }
    else
    {
        size_t mime = terminatedLength(data, pos, end, false);
        if (mime == 0)
            return Result::fail(ParseError::TRUNCATED, "unterminated MIME type");
        pos += mime;
    }

    pos += 1; // picture type
    if (pos > end)
        return Result::fail(ParseError::TRUNCATED, "picture frame truncated");

    size_t description = terminatedLength(data, pos, end, wide);
    if (description == 0)
        return Result::fail(ParseError::TRUNCATED, "unterminated picture description");
    pos += description;

    if (pos > frame_size)
        return Result::fail(ParseError::INCONSISTENT, "picture prefix exceeds frame size");

    return Result::ok(static_cast<uint64_t>(frame_size - pos));
}

bool AudioFormats::isId3v1Trailer(const uint8_t *data, size_t size)
{
    return size >= 128 && std::memcmp(data, "TAG", 3) == 0;
}

ParseResult<AdtsHeader> AudioFormats::parseAdtsHeader(const uint8_t *data, size_t size)
{
    using Result = ParseResult<AdtsHeader>;

    if (size < 7)
        return Result::fail(ParseError::TRUNCATED, "ADTS header needs 7 bytes");
    if (data[0] != 0xFF || (data[1] & 0xF0) != 0xF0)
        return Result::fail(ParseError::BAD_SIGNATURE, "no ADTS sync");
    if (((data[1] >> 1) & 0x03) != 0)
        return Result::fail(ParseError::RESERVED_VALUE, "ADTS layer must be 0");

    AdtsHeader header;
    header.mpeg_version = (data[1] & 0x08) ? 2 : 4;
    header.profile = (data[2] >> 6) & 0x03;

    int sf_index = (data[2] >> 2) & 0x0F;
    if (sf_index > 12)
        return Result::fail(ParseError::RESERVED_VALUE, "reserved sampling frequency index");
    header.sample_rate_hz = ADTS_SAMPLE_RATES[sf_index];

    header.channels = ((data[2] & 0x01) << 2) | ((data[3] >> 6) & 0x03);
    header.frame_length = (static_cast<size_t>(data[3] & 0x03) << 11) | (static_cast<size_t>(data[4]) << 3) |
                          (static_cast<size_t>(data[5]) >> 5);
    if (header.frame_length < 7)
        return Result::fail(ParseError::INCONSISTENT, "ADTS frame shorter than its header");

    return Result::ok(header);
}

ParseResult<BoxHeader> AudioFormats::parseBoxHeader(const uint8_t *data, size_t size, uint64_t remaining)
{
    using Result = ParseResult<BoxHeader>;

    if (size < 8 || remaining < 8)
        return Result::fail(ParseError::TRUNCATED, "box header needs 8 bytes");

    BoxHeader box;
    box.type.assign(reinterpret_cast<const char *>(data + 4), 4);
    uint32_t size32 = readBe32(data);

    if (size32 == 1)
    {
        if (size < 16 || remaining < 16)
            return Result::fail(ParseError::TRUNCATED, "extended box size truncated");
        box.size = readBe64(data + 8);
        box.header_size = 16;
    }
    else if (size32 == 0)
    {
        box.size = remaining;
        box.header_size = 8;
    }
    else
    {
        box.size = size32;
        box.header_size = 8;
    }

    if (box.size < box.header_size)
        return Result::fail(ParseError::INCONSISTENT, "box '" + box.type + "' smaller than its header");
    if (box.size > remaining)
        return Result::fail(ParseError::INCONSISTENT, "box '" + box.type + "' overruns its parent");

    return Result::ok(box);
}

ParseResult<int> AudioFormats::parseAudioSampleEntryRate(const uint8_t *entry, size_t size)
{
    using Result = ParseResult<int>;

    // box header (8) + reserved (6) + data reference index (2)
    const size_t fields = 16;
    if (size < fields + 20)
        return Result::fail(ParseError::TRUNCATED, "audio sample entry truncated");

    uint16_t version = static_cast<uint16_t>((entry[fields] << 8) | entry[fields + 1]);
    if (version == 0 || version == 1)
    {
        int rate = static_cast<int>(readBe32(entry + fields + 16) >> 16);
        if (rate == 0)
            return Result::fail(ParseError::INCONSISTENT, "sample entry declares no sample rate");
        return Result::ok(rate);
    }

    if (version == 2)
    {
        if (size < fields + 32)
            return Result::fail(ParseError::TRUNCATED, "version 2 sound description truncated");
        uint64_t bits = readBe64(entry + fields + 24);
        double rate;
        std::memcpy(&rate, &bits, sizeof(rate));
        if (!(rate > 0.0) || rate > 10000000.0)
            return Result::fail(ParseError::INCONSISTENT, "implausible sample rate in sound description");
        return Result::ok(static_cast<int>(std::lround(rate)));
    }

    return Result::fail(ParseError::RESERVED_VALUE, "unknown sound description version " + std::to_string(version));
}

const AsfGuid &AudioFormats::asfHeaderGuid()
{
    static const AsfGuid guid = {0x30, 0x26, 0xB2, 0x75, 0x8E, 0x66, 0xCF, 0x11,
                                 0xA6, 0xD9, 0x00, 0xAA, 0x00, 0x62, 0xCE, 0x6C};
    return guid;
}

const AsfGuid &AudioFormats::asfStreamPropertiesGuid()
{
    static const AsfGuid guid = {0x91, 0x07, 0xDC, 0xB7, 0xB7, 0xA9, 0xCF, 0x11,
                                 0x8E, 0xE6, 0x00, 0xC0, 0x0C, 0x20, 0x53, 0x65};
    return guid;
}

const AsfGuid &AudioFormats::asfAudioMediaGuid()
{
    static const AsfGuid guid = {0x40, 0x9E, 0x69, 0xF8, 0x4D, 0x5B, 0xCF, 0x11,
                                 0xA8, 0xFD, 0x00, 0x80, 0x5F, 0x5C, 0x44, 0x2B};
    return guid;
}

const AsfGuid &AudioFormats::asfContentEncryptionGuid()
{
    static const AsfGuid guid = {0xFB, 0xB3, 0x11, 0x22, 0x23, 0xBD, 0xD2, 0x11,
                                 0xB4, 0xB7, 0x00, 0xA0, 0xC9, 0x55, 0xFC, 0x6E};
    return guid;
}

const AsfGuid &AudioFormats::asfExtendedContentEncryptionGuid()
{
    static const AsfGuid guid = {0x14, 0xE6, 0x8A, 0x29, 0x22, 0x26, 0x17, 0x4C,
                                 0xB9, 0x35, 0xDA, 0xE0, 0x7E, 0xE9, 0x28, 0x9C};
    return guid;
}

ParseResult<AsfObjectHeader> AudioFormats::parseAsfObjectHeader(const uint8_t *data, size_t size)
{
    using Result = ParseResult<AsfObjectHeader>;

    if (size < 24)
        return Result::fail(ParseError::TRUNCATED, "ASF object header needs 24 bytes");

    AsfObjectHeader object;
    std::memcpy(object.guid.data(), data, 16);
    object.size = readLe64(data + 16);
    if (object.size < 24)
        return Result::fail(ParseError::INCONSISTENT, "ASF object smaller than its header");
    return Result::ok(object);
}

ParseResult<AsfAudioStream> AudioFormats::parseAsfStreamProperties(const uint8_t *object, size_t size)
{
    using Result = ParseResult<AsfAudioStream>;

    // header (24) + stream type (16) + error correction type (16) + time offset (8)
    // + type data length (4) + error correction length (4) + flags (2) + reserved (4)
    const size_t type_data = 78;
    if (size < type_data + 12)
        return Result::fail(ParseError::TRUNCATED, "stream properties object truncated");

    if (std::memcmp(object + 24, asfAudioMediaGuid().data(), 16) != 0)
        return Result::fail(ParseError::RESERVED_VALUE, "not an audio stream");

    uint32_t type_data_length = readLe32(object + 64);
    if (type_data_length < 12)
        return Result::fail(ParseError::INCONSISTENT, "audio stream without WAVEFORMATEX");

    const uint8_t *wfx = object + type_data;
    AsfAudioStream stream;
    stream.format_tag = readLe16(wfx);
    stream.channels = readLe16(wfx + 2);
    stream.sample_rate_hz = static_cast<int>(readLe32(wfx + 4));
    stream.bitrate_kbps = static_cast<int>(static_cast<uint64_t>(readLe32(wfx + 8)) * 8 / 1000);
    return Result::ok(stream);
}
