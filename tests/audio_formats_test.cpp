#include <gtest/gtest.h>
#include <algorithm>
#include "audio_fixtures.hpp"
#include "core/audio_formats.hpp"

using Bytes = AudioFixtures::Bytes;

TEST(AudioFormatsTest, ParsesMpeg1Layer3Header)
{
    Bytes frame = AudioFixtures::frame128();
    auto result = AudioFormats::parseMpegFrameHeader(frame.data(), frame.size());
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.value.version, MpegFrameHeader::Version::MPEG1);
    EXPECT_EQ(result.value.layer, 3);
    EXPECT_EQ(result.value.bitrate_kbps, 128);
    EXPECT_EQ(result.value.sample_rate_hz, 44100);
    EXPECT_FALSE(result.value.padding);
    EXPECT_FALSE(result.value.mono);
    EXPECT_EQ(result.value.frame_length, 417u);
    EXPECT_EQ(AudioFormats::samplesPerFrame(result.value), 1152);
}

TEST(AudioFormatsTest, ParsesMpeg2Header)
{
    Bytes frame = AudioFixtures::frame144();
    auto result = AudioFormats::parseMpegFrameHeader(frame.data(), frame.size());
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.value.version, MpegFrameHeader::Version::MPEG2);
    EXPECT_EQ(result.value.bitrate_kbps, 144);
    EXPECT_EQ(result.value.sample_rate_hz, 22050);
    EXPECT_EQ(result.value.frame_length, 470u);
    EXPECT_EQ(AudioFormats::samplesPerFrame(result.value), 576);
}

TEST(AudioFormatsTest, PaddingAddsOneByte)
{
    Bytes frame = AudioFixtures::mpegFrame(0xFB, 0x92, 0x00, 418);
    auto result = AudioFormats::parseMpegFrameHeader(frame.data(), frame.size());
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.value.padding);
    EXPECT_EQ(result.value.frame_length, 418u);
}

TEST(AudioFormatsTest, RejectsInvalidFrameHeaders)
{
    const uint8_t no_sync[] = {0xFF, 0x1B, 0x90, 0x00};
    EXPECT_EQ(AudioFormats::parseMpegFrameHeader(no_sync, 4).error, ParseError::BAD_SIGNATURE);

    const uint8_t reserved_version[] = {0xFF, 0xEB, 0x90, 0x00};
    EXPECT_EQ(AudioFormats::parseMpegFrameHeader(reserved_version, 4).error, ParseError::RESERVED_VALUE);

    const uint8_t reserved_layer[] = {0xFF, 0xF9, 0x90, 0x00};
    EXPECT_EQ(AudioFormats::parseMpegFrameHeader(reserved_layer, 4).error, ParseError::RESERVED_VALUE);

    const uint8_t bad_bitrate[] = {0xFF, 0xFB, 0xF0, 0x00};
    EXPECT_EQ(AudioFormats::parseMpegFrameHeader(bad_bitrate, 4).error, ParseError::RESERVED_VALUE);

    const uint8_t free_format[] = {0xFF, 0xFB, 0x00, 0x00};
    EXPECT_FALSE(AudioFormats::parseMpegFrameHeader(free_format, 4).success);

    const uint8_t reserved_rate[] = {0xFF, 0xFB, 0x9C, 0x00};
    EXPECT_EQ(AudioFormats::parseMpegFrameHeader(reserved_rate, 4).error, ParseError::RESERVED_VALUE);

    EXPECT_EQ(AudioFormats::parseMpegFrameHeader(no_sync, 3).error, ParseError::TRUNCATED);
}

TEST(AudioFormatsTest, XingAndInfoBlocks)
{
    Bytes xing = AudioFixtures::xingFrame("Xing", 100, 41700);
    auto header = AudioFormats::parseMpegFrameHeader(xing.data(), xing.size());
    ASSERT_TRUE(header.success);

    auto vbr = AudioFormats::parseVbrHeader(xing.data(), xing.size(), header.value);
    ASSERT_TRUE(vbr.success) << vbr.error_message;
    EXPECT_EQ(vbr.value.marker, "Xing");
    EXPECT_TRUE(vbr.value.isVbr());
    EXPECT_EQ(vbr.value.frame_count.value_or(0), 100u);
    EXPECT_EQ(vbr.value.byte_count.value_or(0), 41700u);
    EXPECT_EQ(AudioFormats::averageBitrateKbps(vbr.value, header.value), 128);

    Bytes info = AudioFixtures::xingFrame("Info", 100, 41700);
    auto cbr = AudioFormats::parseVbrHeader(info.data(), info.size(), header.value);
    ASSERT_TRUE(cbr.success);
    EXPECT_FALSE(cbr.value.isVbr());

    Bytes plain = AudioFixtures::frame128();
    EXPECT_EQ(AudioFormats::parseVbrHeader(plain.data(), plain.size(), header.value).error, ParseError::BAD_SIGNATURE);
}

TEST(AudioFormatsTest, VbriBlock)
{
    Bytes frame = AudioFixtures::frame128();
    const char marker[] = "VBRI";
    std::copy(marker, marker + 4, frame.begin() + 36);
    AudioFixtures::putBe32(frame, 36 + 10, 83400);
    AudioFixtures::putBe32(frame, 36 + 14, 200);

    auto header = AudioFormats::parseMpegFrameHeader(frame.data(), frame.size());
    auto vbr = AudioFormats::parseVbrHeader(frame.data(), frame.size(), header.value);
    ASSERT_TRUE(vbr.success);
    EXPECT_EQ(vbr.value.marker, "VBRI");
    EXPECT_EQ(vbr.value.frame_count.value_or(0), 200u);
    EXPECT_EQ(AudioFormats::averageBitrateKbps(vbr.value, header.value), 128);
}

TEST(AudioFormatsTest, Id3v2Header)
{
    Bytes tag = AudioFixtures::id3v2Tag(3, AudioFixtures::textFrame("TIT2", "Song", 3), 100);
    auto header = AudioFormats::parseId3v2Header(tag.data(), tag.size());
    ASSERT_TRUE(header.success);
    EXPECT_EQ(header.value.major, 3);
    EXPECT_EQ(header.value.revision, 0);
    EXPECT_EQ(header.value.body_size, 115u);
    EXPECT_EQ(header.value.total_size, 125u);
    EXPECT_FALSE(header.value.hasExtendedHeader());

    const uint8_t not_synchsafe[] = {'I', 'D', '3', 3, 0, 0, 0x80, 0, 0, 0};
    EXPECT_EQ(AudioFormats::parseId3v2Header(not_synchsafe, 10).error, ParseError::INCONSISTENT);

    const uint8_t no_tag[] = {0xFF, 0xFB, 0x90, 0x00, 0, 0, 0, 0, 0, 0};
    EXPECT_EQ(AudioFormats::parseId3v2Header(no_tag, 10).error, ParseError::BAD_SIGNATURE);
}

TEST(AudioFormatsTest, Id3v24FooterCountsTowardsTotal)
{
    const uint8_t header[] = {'I', 'D', '3', 4, 0, 0x10, 0, 0, 0x01, 0x00};
    auto result = AudioFormats::parseId3v2Header(header, sizeof(header));
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.value.body_size, 128u);
    EXPECT_TRUE(result.value.hasFooter());
    EXPECT_EQ(result.value.total_size, 148u);
}

TEST(AudioFormatsTest, SynchsafeDecoding)
{
    Bytes encoded = AudioFixtures::synchsafe(800000);
    EXPECT_EQ(AudioFormats::decodeSynchsafe(encoded.data()), 800000u);
}

TEST(AudioFormatsTest, Id3FrameHeadersPerVersion)
{
    Bytes v3 = AudioFixtures::id3Frame("APIC", Bytes(300, 0), 3);
    auto f3 = AudioFormats::parseId3FrameHeader(v3.data(), v3.size(), 3);
    ASSERT_TRUE(f3.success);
    EXPECT_EQ(f3.value.id, "APIC");
    EXPECT_EQ(f3.value.size, 300u);
    EXPECT_EQ(f3.value.header_size, 10u);
    EXPECT_TRUE(f3.value.isPicture());

    Bytes v4 = AudioFixtures::id3Frame("TIT2", Bytes(200, 0), 4);
    auto f4 = AudioFormats::parseId3FrameHeader(v4.data(), v4.size(), 4);
    ASSERT_TRUE(f4.success);
    EXPECT_EQ(f4.value.size, 200u);

    Bytes v2 = AudioFixtures::id3Frame("PIC", Bytes(70000, 0), 2);
    auto f2 = AudioFormats::parseId3FrameHeader(v2.data(), v2.size(), 2);
    ASSERT_TRUE(f2.success);
    EXPECT_EQ(f2.value.size, 70000u);
    EXPECT_EQ(f2.value.header_size, 6u);
    EXPECT_TRUE(f2.value.isPicture());

    Bytes padding(10, 0);
    auto pad = AudioFormats::parseId3FrameHeader(padding.data(), padding.size(), 3);
    ASSERT_TRUE(pad.success);
    EXPECT_TRUE(pad.value.isPadding());

    const uint8_t garbage[] = {'t', 'i', 't', '2', 0, 0, 0, 1, 0, 0};
    EXPECT_EQ(AudioFormats::parseId3FrameHeader(garbage, sizeof(garbage), 3).error, ParseError::BAD_SIGNATURE);
}

TEST(AudioFormatsTest, PictureFrameImageSize)
{
    Bytes payload = AudioFixtures::apicPayload(5000);
    auto image = AudioFormats::parsePictureFrame(payload.data(), payload.size(),
                                                 static_cast<uint32_t>(payload.size()), 3);
    ASSERT_TRUE(image.success) << image.error_message;
    EXPECT_EQ(image.value, 5000u);

    // Only the prefix is in memory, the declared size still counts
    auto partial = AudioFormats::parsePictureFrame(payload.data(), 64, static_cast<uint32_t>(payload.size()), 3);
    ASSERT_TRUE(partial.success);
    EXPECT_EQ(partial.value, 5000u);

    // ID3v2.2: fixed 3-byte image format
    Bytes v22 = {0x00, 'J', 'P', 'G', 0x03, 0x00};
    v22.insert(v22.end(), 100, 0x5A);
    auto pic = AudioFormats::parsePictureFrame(v22.data(), v22.size(), static_cast<uint32_t>(v22.size()), 2);
    ASSERT_TRUE(pic.success);
    EXPECT_EQ(pic.value, 100u);

    const uint8_t bad_encoding[] = {0x07, 'x', 0x00};
    EXPECT_EQ(AudioFormats::parsePictureFrame(bad_encoding, 3, 3, 3).error, ParseError::RESERVED_VALUE);
}

TEST(AudioFormatsTest, AdtsHeader)
{
    // AAC LC, 44100 Hz (index 4), stereo, 200-byte frame
    const uint8_t header[] = {0xFF, 0xF1, 0x50, 0x80, 0x19, 0x1F, 0xFC};
    auto result = AudioFormats::parseAdtsHeader(header, sizeof(header));
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.value.mpeg_version, 4);
    EXPECT_EQ(result.value.sample_rate_hz, 44100);
    EXPECT_EQ(result.value.channels, 2);
    EXPECT_EQ(result.value.frame_length, 200u);

    const uint8_t reserved_rate[] = {0xFF, 0xF1, 0x7C, 0x80, 0x19, 0x1F, 0xFC};
    EXPECT_EQ(AudioFormats::parseAdtsHeader(reserved_rate, 7).error, ParseError::RESERVED_VALUE);
}

TEST(AudioFormatsTest, BoxHeaders)
{
    Bytes box = AudioFixtures::box("moov", Bytes(100, 0));
    auto result = AudioFormats::parseBoxHeader(box.data(), box.size(), box.size());
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.value.type, "moov");
    EXPECT_EQ(result.value.size, 108u);
    EXPECT_EQ(result.value.payloadSize(), 100u);

    // Size 0 extends to the end of the parent
    Bytes open_ended = {0, 0, 0, 0, 'm', 'd', 'a', 't'};
    auto to_end = AudioFormats::parseBoxHeader(open_ended.data(), open_ended.size(), 5000);
    ASSERT_TRUE(to_end.success);
    EXPECT_EQ(to_end.value.size, 5000u);

    // 64-bit size
    Bytes large = {0, 0, 0, 1, 'm', 'd', 'a', 't', 0, 0, 0, 0, 0, 0, 0x10, 0};
    auto wide = AudioFormats::parseBoxHeader(large.data(), large.size(), 1u << 20);
    ASSERT_TRUE(wide.success);
    EXPECT_EQ(wide.value.size, 4096u);
    EXPECT_EQ(wide.value.header_size, 16u);

    EXPECT_EQ(AudioFormats::parseBoxHeader(box.data(), box.size(), 50).error, ParseError::INCONSISTENT);

    Bytes tiny = {0, 0, 0, 4, 'f', 'r', 'e', 'e'};
    EXPECT_EQ(AudioFormats::parseBoxHeader(tiny.data(), tiny.size(), 100).error, ParseError::INCONSISTENT);
}

TEST(AudioFormatsTest, AudioSampleEntryRate)
{
    Bytes entry = AudioFixtures::audioSampleEntry("mp4a", 48000);
    auto rate = AudioFormats::parseAudioSampleEntryRate(entry.data(), entry.size());
    ASSERT_TRUE(rate.success) << rate.error_message;
    EXPECT_EQ(rate.value, 48000);

    EXPECT_EQ(AudioFormats::parseAudioSampleEntryRate(entry.data(), 20).error, ParseError::TRUNCATED);
}

TEST(AudioFormatsTest, AsfStreamProperties)
{
    Bytes object = AudioFixtures::asfAudioStream(44100, 192);
    auto header = AudioFormats::parseAsfObjectHeader(object.data(), object.size());
    ASSERT_TRUE(header.success);
    EXPECT_EQ(header.value.size, object.size());
    EXPECT_TRUE(header.value.guid == AudioFormats::asfStreamPropertiesGuid());

    auto stream = AudioFormats::parseAsfStreamProperties(object.data(), object.size());
    ASSERT_TRUE(stream.success) << stream.error_message;
    EXPECT_EQ(stream.value.sample_rate_hz, 44100);
    EXPECT_EQ(stream.value.bitrate_kbps, 192);
    EXPECT_EQ(stream.value.channels, 2);
    EXPECT_EQ(stream.value.format_tag, 0x0161);

    // Same object with a video stream type
    Bytes video = object;
    video[24] ^= 0xFF;
    EXPECT_EQ(AudioFormats::parseAsfStreamProperties(video.data(), video.size()).error, ParseError::RESERVED_VALUE);
}

TEST(AudioFormatsTest, Id3v1Trailer)
{
    Bytes trailer = AudioFixtures::id3v1Trailer();
    EXPECT_TRUE(AudioFormats::isId3v1Trailer(trailer.data(), trailer.size()));
    EXPECT_FALSE(AudioFormats::isId3v1Trailer(trailer.data(), 127));
    trailer[0] = 'X';
    EXPECT_FALSE(AudioFormats::isId3v1Trailer(trailer.data(), trailer.size()));
}
