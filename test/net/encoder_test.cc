#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "../../src/net/compressor.h"
#include "../../src/net/encoder.h"

using namespace Shardcast;

class EncoderTest : public ::testing::Test {
protected:
    std::vector<uint8_t> Frame(const PacketWriteInfo& info) {
        return std::vector<uint8_t>(info.start_ptr, info.start_ptr + info.len);
    }

    Ring ring_{1 << 20};
    Scratch scratch_;
    Compressor compressor_{DEFAULT_COMPRESSION_LEVEL};
};

TEST_F(EncoderTest, UncompressedLayout) {
    PacketEncoder encoder{CompressionThreshold{}};
    PacketWriteInfo info;
    ASSERT_EQ(encoder.AppendPacket(SetCompression{256}, ring_, scratch_, compressor_, &info),
              EncodeStatus::kOk);

    // VarInt(3) 0x03 VarInt(256)=0x80 0x02
    EXPECT_EQ(Frame(info), (std::vector<uint8_t>{0x03, 0x03, 0x80, 0x02}));
    EXPECT_EQ(info.epoch, 0u);
}

TEST_F(EncoderTest, BelowThresholdUsesZeroMarker) {
    PacketEncoder encoder{CompressionThreshold{64}};
    PacketWriteInfo info;
    ASSERT_EQ(encoder.AppendPacket(ChatMessage{"hi"}, ring_, scratch_, compressor_, &info),
              EncodeStatus::kOk);

    // VarInt(len+1) 0x00 id VarInt(2) 'h' 'i'
    EXPECT_EQ(Frame(info), (std::vector<uint8_t>{0x05, 0x00, 0x64, 0x02, 'h', 'i'}));
}

TEST_F(EncoderTest, AboveThresholdIsDeflated) {
    PacketEncoder encoder{CompressionThreshold{64}};
    ChatMessage chat{std::string(1000, 'z')};
    PacketWriteInfo info;
    ASSERT_EQ(encoder.AppendPacket(chat, ring_, scratch_, compressor_, &info), EncodeStatus::kOk);

    std::vector<uint8_t> frame = Frame(info);
    int32_t frame_len = 0;
    size_t n = 0;
    ASSERT_EQ(varint::Read(frame.data(), frame.size(), &frame_len, &n), varint::ReadResult::kOk);
    EXPECT_EQ(static_cast<size_t>(frame_len) + n, frame.size());

    int32_t uncompressed = 0;
    size_t m = 0;
    ASSERT_EQ(varint::Read(frame.data() + n, frame.size() - n, &uncompressed, &m), varint::ReadResult::kOk);
    // id + VarInt(1000) + text
    EXPECT_EQ(uncompressed, 1 + 2 + 1000);
    EXPECT_LT(frame.size(), 200u);

    Decompressor decompressor;
    std::vector<uint8_t> body;
    ASSERT_TRUE(decompressor.Decompress(frame.data() + n + m, frame.size() - n - m,
                                        static_cast<size_t>(uncompressed), &body));
    EXPECT_EQ(body[0], ChatMessage::kId);
    EXPECT_EQ(body.back(), 'z');
}

TEST_F(EncoderTest, ThresholdIsInclusive) {
    // KeepAlive body (id + 8 byte long) is exactly 9 bytes
    PacketEncoder encoder{CompressionThreshold{9}};
    PacketWriteInfo info;
    ASSERT_EQ(encoder.AppendPacket(KeepAlive{7}, ring_, scratch_, compressor_, &info), EncodeStatus::kOk);

    std::vector<uint8_t> frame = Frame(info);
    ASSERT_GE(frame.size(), 2u);
    // Second VarInt is the uncompressed length, not the 0x00 marker
    EXPECT_EQ(frame[1], 9);
}

TEST_F(EncoderTest, MalformedPacketLeavesRingUntouched) {
    PacketEncoder encoder{CompressionThreshold{}};
    PacketWriteInfo info;
    info.len = 1234;
    ChatMessage chat{std::string(ChatMessage::kMaxLength + 1, 'x')};

    EXPECT_EQ(encoder.AppendPacket(chat, ring_, scratch_, compressor_, &info), EncodeStatus::kMalformed);
    EXPECT_EQ(ring_.Head(), 0u);
    EXPECT_EQ(info.len, 1234u);
}

TEST_F(EncoderTest, OversizedPacketIsRejected) {
    PacketEncoder encoder{CompressionThreshold{}};
    RawPacket raw{0x10, std::vector<uint8_t>(MAX_PACKET_SIZE, 1)};
    PacketWriteInfo info;

    EXPECT_EQ(encoder.AppendPacket(raw, ring_, scratch_, compressor_, &info), EncodeStatus::kPacketTooLarge);
    EXPECT_EQ(ring_.Head(), 0u);
}

TEST_F(EncoderTest, LengthPrefixIsNotCountedAgainstLimit) {
    // id byte + body fill the frame length exactly
    Ring ring(4 << 20);
    PacketEncoder encoder{CompressionThreshold{}};
    RawPacket raw{0x10, std::vector<uint8_t>(MAX_PACKET_SIZE - 1, 1)};
    PacketWriteInfo info;

    ASSERT_EQ(encoder.AppendPacket(raw, ring, scratch_, compressor_, &info), EncodeStatus::kOk);
    EXPECT_EQ(info.len, MAX_PACKET_SIZE + varint::EncodedSize(static_cast<uint32_t>(MAX_PACKET_SIZE)));
}

TEST_F(EncoderTest, ZeroMarkerCountsAgainstLimit) {
    Ring ring(4 << 20);
    PacketEncoder encoder{CompressionThreshold{1 << 30}};
    PacketWriteInfo info;

    RawPacket fits{0x10, std::vector<uint8_t>(MAX_PACKET_SIZE - 2, 1)};
    ASSERT_EQ(encoder.AppendPacket(fits, ring, scratch_, compressor_, &info), EncodeStatus::kOk);
    const size_t head = ring.Head();

    RawPacket over{0x10, std::vector<uint8_t>(MAX_PACKET_SIZE - 1, 1)};
    EXPECT_EQ(encoder.AppendPacket(over, ring, scratch_, compressor_, &info), EncodeStatus::kPacketTooLarge);
    EXPECT_EQ(ring.Head(), head);
}

TEST_F(EncoderTest, WithoutCompressionIgnoresEncoderState) {
    PacketWriteInfo info;
    ASSERT_EQ(AppendPacketWithoutCompression(KeepAlive{1}, ring_, scratch_, &info), EncodeStatus::kOk);
    EXPECT_EQ(info.len, 10u);
    EXPECT_EQ(info.start_ptr[0], 9);
    EXPECT_EQ(info.start_ptr[1], KeepAlive::kId);
}

TEST(VarIntTest, KnownEncodings) {
    uint8_t out[varint::kMaxBytes];
    EXPECT_EQ(varint::Write(0, out), 1u);
    EXPECT_EQ(out[0], 0x00);
    EXPECT_EQ(varint::Write(300, out), 2u);
    EXPECT_EQ(out[0], 0xAC);
    EXPECT_EQ(out[1], 0x02);
    EXPECT_EQ(varint::Write(-1, out), 5u);
    EXPECT_EQ(out[4], 0x0F);
    EXPECT_EQ(varint::EncodedSize(2097151), 3u);
}

TEST(VarIntTest, ReadStatuses) {
    int32_t value = 0;
    size_t consumed = 0;
    const uint8_t partial[] = {0x80, 0x80};
    EXPECT_EQ(varint::Read(partial, sizeof(partial), &value, &consumed), varint::ReadResult::kIncomplete);

    const uint8_t too_long[] = {0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x01};
    EXPECT_EQ(varint::Read(too_long, sizeof(too_long), &value, &consumed), varint::ReadResult::kTooLong);

    const uint8_t minus_one[] = {0xFF, 0xFF, 0xFF, 0xFF, 0x0F};
    ASSERT_EQ(varint::Read(minus_one, sizeof(minus_one), &value, &consumed), varint::ReadResult::kOk);
    EXPECT_EQ(value, -1);
    EXPECT_EQ(consumed, 5u);
}
