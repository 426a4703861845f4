#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include "core/parse_result.hpp"

/**
 * @brief Decoded MPEG audio frame header (4 bytes)
 */
struct MpegFrameHeader
{
    enum class Version
    {
        MPEG1,
        MPEG2,
        MPEG25
    };

    Version version = Version::MPEG1;
    int layer = 0; // 1, 2 or 3
    int bitrate_kbps = 0;
    int sample_rate_hz = 0;
    bool padding = false;
    bool mono = false;
    size_t frame_length = 0; // bytes, header included

    // Same stream parameters: frames of one stream must agree on these
    bool sameStream(const MpegFrameHeader &other) const
    {
        return version == other.version && layer == other.layer && sample_rate_hz == other.sample_rate_hz;
    }
};

/**
 * @brief Encoder side-information block in the first frame ("Xing", "Info" or "VBRI")
 */
struct VbrHeader
{
    std::string marker;
    std::optional<uint32_t> frame_count;
    std::optional<uint32_t> byte_count;

    // "Info" is written by LAME for CBR streams
    bool isVbr() const { return marker == "Xing" || marker == "VBRI"; }
};

struct Id3v2Header
{
    int major = 0;
    int revision = 0;
    uint8_t flags = 0;
    uint32_t body_size = 0;  // synchsafe size field: frames, padding, extended header
    uint32_t total_size = 0; // header + body + optional footer

    bool hasExtendedHeader() const { return (flags & 0x40) != 0; }
    bool hasFooter() const { return major >= 4 && (flags & 0x10) != 0; }
};

struct Id3FrameHeader
{
    std::string id;
    uint32_t size = 0;   // payload size
    size_t header_size = 0;

    bool isPadding() const { return id.empty() || id[0] == '\0'; }
    bool isPicture() const { return id == "APIC" || id == "PIC"; }
};

struct AdtsHeader
{
    int mpeg_version = 4; // 2 or 4
    int profile = 0;
    int sample_rate_hz = 0;
    int channels = 0;
    size_t frame_length = 0;
};

/**
 * @brief ISO base media box header (size + type, optional 64-bit size)
 */
struct BoxHeader
{
    std::string type;
    uint64_t size = 0; // whole box, header included
    uint32_t header_size = 0;

    uint64_t payloadSize() const { return size - header_size; }
};

using AsfGuid = std::array<uint8_t, 16>;

struct AsfObjectHeader
{
    AsfGuid guid{};
    uint64_t size = 0; // whole object, 24-byte header included
};

struct AsfAudioStream
{
    uint16_t format_tag = 0;
    int channels = 0;
    int sample_rate_hz = 0;
    int bitrate_kbps = 0;
};

/**
 * @brief Parsers for the binary structures of the supported audio containers
 *
 * Every parser works on an in-memory byte window, never reads past `size`,
 * and reports malformed input through ParseResult instead of throwing.
 */
class AudioFormats
{
public:
    // MPEG audio
    static ParseResult<MpegFrameHeader> parseMpegFrameHeader(const uint8_t *data, size_t size);
    static int samplesPerFrame(const MpegFrameHeader &header);

    /**
     * @brief Look for a Xing/Info or VBRI block inside the first frame
     * @param frame Bytes starting at the frame header
     * @param size Bytes available
     * @param header The decoded header of that frame
     */
    static ParseResult<VbrHeader> parseVbrHeader(const uint8_t *frame, size_t size, const MpegFrameHeader &header);

    // Average bitrate declared by a VBR block, 0 when the counts are missing
    static int averageBitrateKbps(const VbrHeader &vbr, const MpegFrameHeader &first);

    // ID3
    static uint32_t decodeSynchsafe(const uint8_t *data);
    static ParseResult<Id3v2Header> parseId3v2Header(const uint8_t *data, size_t size);

    /**
     * @brief Size of the extended header that follows the 10-byte tag header
     *
     * ID3v2.3 stores the size without the size field itself, ID3v2.4 includes it.
     */
    static ParseResult<uint32_t> parseId3ExtendedHeaderSize(const uint8_t *data, size_t size, int major);

    static ParseResult<Id3FrameHeader> parseId3FrameHeader(const uint8_t *data, size_t size, int major);

    /**
     * @brief Image byte count of an APIC (v2.3/v2.4) or PIC (v2.2) frame
     *
     * @param data Start of the frame payload (after the frame header)
     * @param available Bytes of the payload actually present in `data`
     * @param frame_size Declared payload size of the frame
     * @param major Tag major version
     */
    static ParseResult<uint64_t> parsePictureFrame(const uint8_t *data, size_t available, uint32_t frame_size, int major);

    static bool isId3v1Trailer(const uint8_t *data, size_t size);

    // AAC
    static ParseResult<AdtsHeader> parseAdtsHeader(const uint8_t *data, size_t size);

    // ISO base media (MP4 / M4A)
    /**
     * @param remaining Bytes left in the parent, used for size 0 (box extends to the end)
     */
    static ParseResult<BoxHeader> parseBoxHeader(const uint8_t *data, size_t size, uint64_t remaining);

    /**
     * @brief Sample rate of an audio sample entry (mp4a, enca, alac, ...)
     * @param entry Bytes starting at the sample entry box header
     */
    static ParseResult<int> parseAudioSampleEntryRate(const uint8_t *entry, size_t size);

    // ASF (WMA)
    static const AsfGuid &asfHeaderGuid();
    static const AsfGuid &asfStreamPropertiesGuid();
    static const AsfGuid &asfAudioMediaGuid();
    static const AsfGuid &asfContentEncryptionGuid();
    static const AsfGuid &asfExtendedContentEncryptionGuid();

    static ParseResult<AsfObjectHeader> parseAsfObjectHeader(const uint8_t *data, size_t size);

    /**
     * @brief Decode a Stream Properties object carrying an audio stream
     * @param object Bytes starting at the object header
     * @return RESERVED_VALUE when the stream is not audio
     */
    static ParseResult<AsfAudioStream> parseAsfStreamProperties(const uint8_t *object, size_t size);

    static uint16_t readLe16(const uint8_t *p);
    static uint32_t readLe32(const uint8_t *p);
    static uint64_t readLe64(const uint8_t *p);
    static uint32_t readBe32(const uint8_t *p);
    static uint64_t readBe64(const uint8_t *p);
};
