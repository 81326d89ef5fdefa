/**
 * @file transfer_header_test.cpp
 * @brief Unit tests for the 40-byte chunk header codec
 *
 * (c) 2026 PaceSend Project
 * Licensed under MIT License
 */

#include "pacesend/TransferHeader.h"
#include "pacesend/config.h"
#include <gtest/gtest.h>
#include <algorithm>
#include <cstddef>
#include <vector>

using namespace PaceSend;

//=============================================================================
// Test Fixtures
//=============================================================================

class TransferHeaderTest : public ::testing::Test {
protected:
    TransferHeader header;

    void SetUp() override {
        header.transferId = 0x1122334455667788ULL;
        header.totalSize = 3000;
        header.offset = 1200;
        header.length = 1200;
        header.flags = 0;
        header.timestampNs = 0x0102030405060708ULL;
    }
};

//=============================================================================
// Layout Tests
//=============================================================================

/**
 * @test Fields land at their fixed little-endian offsets
 */
TEST_F(TransferHeaderTest, EncodeUsesFixedLittleEndianLayout) {
    header.setLast(true);
    const auto bytes = header.encode();

    ASSERT_EQ(bytes.size(), CHUNK_HEADER_SIZE);

    // transfer_id at 0
    EXPECT_EQ(bytes[0], 0x88);
    EXPECT_EQ(bytes[7], 0x11);
    // total_size at 8: 3000 = 0x0BB8
    EXPECT_EQ(bytes[8], 0xB8);
    EXPECT_EQ(bytes[9], 0x0B);
    // offset at 16: 1200 = 0x04B0
    EXPECT_EQ(bytes[16], 0xB0);
    EXPECT_EQ(bytes[17], 0x04);
    // length at 24
    EXPECT_EQ(bytes[24], 0xB0);
    EXPECT_EQ(bytes[25], 0x04);
    EXPECT_EQ(bytes[26], 0x00);
    EXPECT_EQ(bytes[27], 0x00);
    // flags at 28, padding 29..31
    EXPECT_EQ(bytes[28], CHUNK_FLAG_LAST);
    EXPECT_EQ(bytes[29], 0x00);
    EXPECT_EQ(bytes[30], 0x00);
    EXPECT_EQ(bytes[31], 0x00);
    // timestamp at 32
    EXPECT_EQ(bytes[32], 0x08);
    EXPECT_EQ(bytes[39], 0x01);
}

/**
 * @test encodeTo writes the same bytes as encode
 */
TEST_F(TransferHeaderTest, EncodeToMatchesEncode) {
    std::vector<uint8_t> buffer(CHUNK_HEADER_SIZE, 0xFF);
    header.encodeTo(buffer.data());

    const auto bytes = header.encode();
    EXPECT_TRUE(std::equal(bytes.begin(), bytes.end(), buffer.begin()));
}

/**
 * @test The last flag toggles only bit 0
 */
TEST_F(TransferHeaderTest, SetLastTogglesBitZero) {
    header.flags = 0x80;
    header.setLast(true);
    EXPECT_EQ(header.flags, 0x81);
    EXPECT_TRUE(header.isLast());

    header.setLast(false);
    EXPECT_EQ(header.flags, 0x80);
    EXPECT_FALSE(header.isLast());
}

//=============================================================================
// Decode Tests
//=============================================================================

/**
 * @test A framed chunk decodes to the original header and payload
 */
TEST_F(TransferHeaderTest, FrameChunkDecodesBack) {
    const std::vector<uint8_t> payload = {'a', 'b', 'c', 'd'};
    header.length = static_cast<uint32_t>(payload.size());
    header.setLast(true);

    const std::vector<uint8_t> message = frameChunk(header, payload.data(), payload.size());
    ASSERT_EQ(message.size(), CHUNK_HEADER_SIZE + payload.size());

    DecodedChunk chunk;
    ASSERT_EQ(decodeChunk(message.data(), message.size(), chunk), CodecError::NONE);
    EXPECT_EQ(chunk.header, header);
    ASSERT_EQ(chunk.payloadSize, payload.size());
    EXPECT_EQ(std::vector<uint8_t>(chunk.payload, chunk.payload + chunk.payloadSize), payload);
}

/**
 * @test Every buffer shorter than the header is rejected
 */
TEST_F(TransferHeaderTest, ShortBufferRejectedForEveryLengthBelowHeaderSize) {
    const auto bytes = header.encode();
    for (size_t size = 0; size < CHUNK_HEADER_SIZE; ++size) {
        DecodedChunk chunk;
        EXPECT_EQ(decodeChunk(bytes.data(), size, chunk), CodecError::SHORT_BUFFER)
            << "size=" << size;
    }
}

/**
 * @test A header with no payload decodes with an empty payload view
 */
TEST_F(TransferHeaderTest, HeaderOnlyMessageHasEmptyPayload) {
    header.length = 0;
    const auto bytes = header.encode();

    DecodedChunk chunk;
    ASSERT_EQ(decodeChunk(bytes.data(), bytes.size(), chunk), CodecError::NONE);
    EXPECT_EQ(chunk.payloadSize, 0u);
}

/**
 * @test Decoding does not cross-check length against the payload actually present
 */
TEST_F(TransferHeaderTest, DecodeAcceptsPayloadShorterThanLength) {
    const std::vector<uint8_t> payload(10, 0x5A);
    header.length = 1200;

    const std::vector<uint8_t> message = frameChunk(header, payload.data(), payload.size());

    DecodedChunk chunk;
    ASSERT_EQ(decodeChunk(message.data(), message.size(), chunk), CodecError::NONE);
    EXPECT_EQ(chunk.header.length, 1200u);
    EXPECT_EQ(chunk.payloadSize, 10u);
}

/**
 * @test Padding bytes are ignored on decode
 */
TEST_F(TransferHeaderTest, PaddingIsIgnoredOnDecode) {
    auto bytes = header.encode();
    bytes[29] = 0xAA;
    bytes[30] = 0xBB;
    bytes[31] = 0xCC;

    DecodedChunk chunk;
    ASSERT_EQ(decodeChunk(bytes.data(), bytes.size(), chunk), CodecError::NONE);
    EXPECT_EQ(chunk.header, header);
}

TEST(CodecErrorTest, ToStringNamesEachError) {
    EXPECT_STRNE(codecErrorToString(CodecError::NONE), codecErrorToString(CodecError::SHORT_BUFFER));
}
