/**
 * @file sender_session_test.cpp
 * @brief Chunking, pacing and backpressure of the sender
 */

#include <gtest/gtest.h>

#include "pacesend/HashUtils.h"
#include "pacesend/SenderSession.h"
#include "pacesend/TransferHeader.h"
#include "MemoryConnection.h"
#include "TestFiles.h"

#include <algorithm>
#include <chrono>
#include <thread>
#include <vector>

using namespace PaceSend;
using PaceSendTest::MemoryConnection;
using PaceSendTest::ScratchDir;
using Clock = SenderSession::Clock;

namespace {

DecodedChunk decodeOrFail(const std::vector<uint8_t>& message) {
    DecodedChunk chunk;
    EXPECT_EQ(decodeChunk(message.data(), message.size(), chunk), CodecError::NONE);
    return chunk;
}

}  // namespace

class SenderSessionTest : public ::testing::Test {
protected:
    ScratchDir dir{"sender_session"};
    std::filesystem::path source;
    std::vector<uint8_t> content;

    void createSource(size_t size) {
        source = dir / "source.bin";
        content = PaceSendTest::patternBytes(size);
        PaceSendTest::writeFile(source, content);
    }

    SenderConfig config(ChannelKind channel, size_t chunkBytes = 1200, double rateBits = 1e12) {
        SenderConfig cfg;
        cfg.sourcePath = source;
        cfg.chunkBytes = chunkBytes;
        cfg.rateBitsPerSec = rateBits;
        cfg.channel = channel;
        return cfg;
    }
};

//=============================================================================
// Initialization
//=============================================================================

TEST_F(SenderSessionTest, InitializeRecordsSizeIdAndHash) {
    createSource(3000);
    SenderSession session(config(ChannelKind::DATAGRAM));

    std::string err;
    ASSERT_TRUE(session.initialize(err)) << err;
    EXPECT_EQ(session.totalSize(), 3000u);
    EXPECT_EQ(session.transferId(), HashUtils::computeTransferId(source, 3000));
    EXPECT_EQ(session.sourceSha256(), HashUtils::fileHashHex(source));
    EXPECT_FALSE(session.isComplete());
}

TEST_F(SenderSessionTest, InitializeRejectsMissingFile) {
    source = dir / "missing.bin";
    SenderSession session(config(ChannelKind::DATAGRAM));

    std::string err;
    EXPECT_FALSE(session.initialize(err));
    EXPECT_NE(err.find("PSD-XFR-2000"), std::string::npos) << err;
}

TEST_F(SenderSessionTest, InitializeRejectsDirectory) {
    source = dir.path();
    SenderSession session(config(ChannelKind::DATAGRAM));

    std::string err;
    EXPECT_FALSE(session.initialize(err));
}

TEST_F(SenderSessionTest, InitializeRejectsZeroChunk) {
    createSource(10);
    SenderSession session(config(ChannelKind::DATAGRAM, 0));

    std::string err;
    EXPECT_FALSE(session.initialize(err));
}

TEST_F(SenderSessionTest, StartBeforeInitializeFails) {
    createSource(10);
    SenderSession session(config(ChannelKind::DATAGRAM));
    MemoryConnection conn;

    std::string err;
    EXPECT_FALSE(session.start(conn, Clock::now(), err));
    EXPECT_EQ(session.advance(conn), 0u);
}

//=============================================================================
// Pacing
//=============================================================================

TEST_F(SenderSessionTest, PacingIntervalFromChunkAndRate) {
    // 1200 bytes at 10 Mbit/s = 960 microseconds
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::nanoseconds>(
                  SenderSession::computePacingInterval(1200, 10e6)).count(),
              960000);
    // 1250 bytes at 1 Gbit/s = 10 microseconds
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::nanoseconds>(
                  SenderSession::computePacingInterval(1250, 1e9)).count(),
              10000);
    EXPECT_EQ(SenderSession::computePacingInterval(1200, 0.0), Clock::duration::zero());
}

TEST_F(SenderSessionTest, AdvanceSendsOnlyChunksWhoseDeadlineHasPassed) {
    createSource(3000);
    SenderSession session(config(ChannelKind::DATAGRAM, 1200, 10e6));
    MemoryConnection conn;

    std::string err;
    ASSERT_TRUE(session.initialize(err)) << err;
    const Clock::time_point t0 = Clock::now();
    ASSERT_TRUE(session.start(conn, t0, err)) << err;

    // First chunk is due immediately
    EXPECT_EQ(session.advance(conn, t0), 1u);
    EXPECT_EQ(session.nextDeadline(), t0 + session.pacingInterval());

    // Not yet due
    EXPECT_EQ(session.advance(conn, t0 + session.pacingInterval() - std::chrono::nanoseconds(1)), 0u);

    // Late tick catches up on everything that became due
    EXPECT_EQ(session.advance(conn, t0 + session.pacingInterval() * 5), 2u);
    EXPECT_TRUE(session.isComplete());
    EXPECT_EQ(conn.sentDatagrams.size(), 3u);
}

TEST_F(SenderSessionTest, DeadlineAdvancesFromScheduleNotFromWallClock) {
    createSource(12000);
    SenderSession session(config(ChannelKind::DATAGRAM, 1200, 10e6));
    MemoryConnection conn;

    std::string err;
    ASSERT_TRUE(session.initialize(err)) << err;
    const Clock::time_point t0 = Clock::now();
    ASSERT_TRUE(session.start(conn, t0, err)) << err;

    const auto interval = session.pacingInterval();
    EXPECT_EQ(session.advance(conn, t0 + interval * 3), 4u);
    EXPECT_EQ(session.nextDeadline(), t0 + interval * 4);
}

//=============================================================================
// Datagram mode
//=============================================================================

TEST_F(SenderSessionTest, DatagramModeSplitsFileIntoHeaderedChunks) {
    createSource(3000);
    SenderSession session(config(ChannelKind::DATAGRAM));
    MemoryConnection conn;

    std::string err;
    ASSERT_TRUE(session.initialize(err)) << err;
    ASSERT_TRUE(session.start(conn, Clock::now(), err)) << err;
    session.advance(conn, Clock::now() + std::chrono::seconds(1));

    ASSERT_EQ(conn.sentDatagrams.size(), 3u);
    const uint64_t expectedOffsets[] = {0, 1200, 2400};
    const uint32_t expectedLengths[] = {1200, 1200, 600};

    for (size_t i = 0; i < 3; ++i) {
        const DecodedChunk chunk = decodeOrFail(conn.sentDatagrams[i]);
        EXPECT_EQ(chunk.header.transferId, session.transferId());
        EXPECT_EQ(chunk.header.totalSize, 3000u);
        EXPECT_EQ(chunk.header.offset, expectedOffsets[i]);
        EXPECT_EQ(chunk.header.length, expectedLengths[i]);
        EXPECT_EQ(chunk.header.isLast(), i == 2);
        ASSERT_EQ(chunk.payloadSize, expectedLengths[i]);
        EXPECT_TRUE(std::equal(chunk.payload, chunk.payload + chunk.payloadSize,
                               content.begin() + static_cast<std::ptrdiff_t>(expectedOffsets[i])));
    }

    // Timestamps never decrease
    EXPECT_LE(decodeOrFail(conn.sentDatagrams[0]).header.timestampNs,
              decodeOrFail(conn.sentDatagrams[2]).header.timestampNs);
}

TEST_F(SenderSessionTest, CompletionClosesConnectionGracefullyOnce) {
    createSource(3000);
    SenderSession session(config(ChannelKind::DATAGRAM));
    MemoryConnection conn;

    std::string err;
    ASSERT_TRUE(session.initialize(err)) << err;
    ASSERT_TRUE(session.start(conn, Clock::now(), err)) << err;
    session.advance(conn, Clock::now() + std::chrono::seconds(1));
    session.advance(conn, Clock::now() + std::chrono::seconds(2));

    EXPECT_TRUE(session.isComplete());
    EXPECT_TRUE(session.closeRequested());
    EXPECT_EQ(conn.closeCalls, 1);
    EXPECT_TRUE(conn.closedGracefully);
    EXPECT_EQ(conn.closeCode, 0u);
    EXPECT_EQ(session.sentBytes(), 3000u);
    EXPECT_EQ(session.chunksSent(), 3u);
}

TEST_F(SenderSessionTest, EmptyFileSendsOneEmptyLastChunk) {
    createSource(0);
    SenderSession session(config(ChannelKind::DATAGRAM));
    MemoryConnection conn;

    std::string err;
    ASSERT_TRUE(session.initialize(err)) << err;
    EXPECT_FALSE(session.isComplete());
    ASSERT_TRUE(session.start(conn, Clock::now(), err)) << err;
    EXPECT_EQ(session.advance(conn, Clock::now() + std::chrono::seconds(1)), 1u);

    ASSERT_EQ(conn.sentDatagrams.size(), 1u);
    const DecodedChunk chunk = decodeOrFail(conn.sentDatagrams[0]);
    EXPECT_EQ(chunk.header.totalSize, 0u);
    EXPECT_EQ(chunk.header.length, 0u);
    EXPECT_TRUE(chunk.header.isLast());
    EXPECT_TRUE(session.isComplete());
    EXPECT_EQ(conn.closeCalls, 1);
}

TEST_F(SenderSessionTest, WouldBlockLeavesStateUntouchedAndRetries) {
    createSource(3000);
    SenderSession session(config(ChannelKind::DATAGRAM));
    MemoryConnection conn;
    conn.scriptedStatus = {IoStatus::OK, IoStatus::WOULD_BLOCK};

    std::string err;
    ASSERT_TRUE(session.initialize(err)) << err;
    const Clock::time_point t0 = Clock::now();
    ASSERT_TRUE(session.start(conn, t0, err)) << err;

    const Clock::time_point late = t0 + std::chrono::seconds(1);
    EXPECT_EQ(session.advance(conn, late), 1u);
    EXPECT_EQ(session.sentBytes(), 1200u);
    EXPECT_EQ(session.chunksSent(), 1u);
    const auto deadlineAfterBlock = session.nextDeadline();

    // Retry resends the same chunk at the same offset
    EXPECT_EQ(session.advance(conn, late), 2u);
    EXPECT_GT(session.nextDeadline(), deadlineAfterBlock);
    ASSERT_EQ(conn.sentDatagrams.size(), 3u);
    EXPECT_EQ(decodeOrFail(conn.sentDatagrams[1]).header.offset, 1200u);
    EXPECT_TRUE(session.isComplete());
}

TEST_F(SenderSessionTest, FailedSendIsRetriedOnNextTick) {
    createSource(2400);
    SenderSession session(config(ChannelKind::DATAGRAM));
    MemoryConnection conn;
    conn.scriptedStatus = {IoStatus::FAILED};

    std::string err;
    ASSERT_TRUE(session.initialize(err)) << err;
    ASSERT_TRUE(session.start(conn, Clock::now(), err)) << err;

    const Clock::time_point late = Clock::now() + std::chrono::seconds(1);
    EXPECT_EQ(session.advance(conn, late), 0u);
    EXPECT_EQ(session.sentBytes(), 0u);
    EXPECT_FALSE(session.closeRequested());

    EXPECT_EQ(session.advance(conn, late), 2u);
    EXPECT_TRUE(session.isComplete());
}

TEST_F(SenderSessionTest, ReadFailureStallsWithoutAdvancing) {
    createSource(3000);
    SenderSession session(config(ChannelKind::DATAGRAM));
    MemoryConnection conn;

    std::string err;
    ASSERT_TRUE(session.initialize(err)) << err;
    ASSERT_TRUE(session.start(conn, Clock::now(), err)) << err;

    // Shrink the file under the open session: the second chunk becomes a short read
    PaceSendTest::writeFile(source, std::vector<uint8_t>(content.begin(), content.begin() + 1500));

    const Clock::time_point late = Clock::now() + std::chrono::seconds(1);
    EXPECT_EQ(session.advance(conn, late), 1u);
    EXPECT_EQ(session.sentBytes(), 1200u);
    EXPECT_EQ(session.advance(conn, late), 0u);
    EXPECT_EQ(session.sentBytes(), 1200u);
    EXPECT_FALSE(session.isComplete());
    EXPECT_EQ(conn.closeCalls, 0);
}

TEST_F(SenderSessionTest, TelemetryRecordsEverySubmittedChunk) {
    createSource(3000);
    const auto csv = dir / "send.csv";
    TelemetrySink sink(1);
    std::string err;
    ASSERT_TRUE(sink.open(csv, err)) << err;

    SenderSession session(config(ChannelKind::DATAGRAM), &sink);
    MemoryConnection conn;
    conn.scriptedStatus = {IoStatus::OK, IoStatus::WOULD_BLOCK};

    ASSERT_TRUE(session.initialize(err)) << err;
    ASSERT_TRUE(session.start(conn, Clock::now(), err)) << err;
    session.advance(conn, Clock::now() + std::chrono::seconds(1));
    session.advance(conn, Clock::now() + std::chrono::seconds(1));

    // The blocked attempt is not recorded
    EXPECT_EQ(sink.recordCount(), 3u);
}

//=============================================================================
// Stream mode
//=============================================================================

TEST_F(SenderSessionTest, StreamModeOpensOneStreamAndSetsFinOnLastWrite) {
    createSource(3000);
    SenderSession session(config(ChannelKind::STREAM));
    MemoryConnection conn;
    conn.nextStreamId = 8;

    std::string err;
    ASSERT_TRUE(session.initialize(err)) << err;
    ASSERT_TRUE(session.start(conn, Clock::now(), err)) << err;
    ASSERT_TRUE(session.streamId().has_value());
    EXPECT_EQ(*session.streamId(), 8u);
    ASSERT_EQ(conn.lastUrgency.size(), 1u);
    EXPECT_EQ(conn.lastUrgency[0], SENDER_STREAM_URGENCY);

    session.advance(conn, Clock::now() + std::chrono::seconds(1));

    ASSERT_EQ(conn.outStreams.size(), 1u);
    const auto& stream = conn.outStreams.at(8);
    EXPECT_EQ(stream.data, content);
    EXPECT_TRUE(stream.fin);
    EXPECT_EQ(conn.streamWriteSizes, (std::vector<size_t>{1200, 1200, 600}));
    EXPECT_TRUE(conn.sentDatagrams.empty());
    EXPECT_TRUE(session.isComplete());
}

TEST_F(SenderSessionTest, StreamModeStartFailsWhenStreamCannotOpen) {
    createSource(3000);
    SenderSession session(config(ChannelKind::STREAM));
    MemoryConnection conn;
    conn.failOpen = true;

    std::string err;
    ASSERT_TRUE(session.initialize(err)) << err;
    EXPECT_FALSE(session.start(conn, Clock::now(), err));
    EXPECT_FALSE(session.isStarted());
}

TEST_F(SenderSessionTest, StreamModeEmptyFileWritesEmptyFin) {
    createSource(0);
    SenderSession session(config(ChannelKind::STREAM));
    MemoryConnection conn;

    std::string err;
    ASSERT_TRUE(session.initialize(err)) << err;
    ASSERT_TRUE(session.start(conn, Clock::now(), err)) << err;
    session.advance(conn, Clock::now() + std::chrono::seconds(1));

    ASSERT_EQ(conn.outStreams.size(), 1u);
    EXPECT_TRUE(conn.outStreams.begin()->second.data.empty());
    EXPECT_TRUE(conn.outStreams.begin()->second.fin);
    EXPECT_TRUE(session.isComplete());
}

TEST_F(SenderSessionTest, PacedRunTakesAboutChunkCountTimesInterval) {
    // 50 chunks of 1200 bytes at 9.6 Mbit/s: one chunk per millisecond
    createSource(50 * 1200);
    SenderSession session(config(ChannelKind::DATAGRAM, 1200, 9.6e6));
    MemoryConnection conn;

    std::string err;
    ASSERT_TRUE(session.initialize(err)) << err;
    const Clock::time_point t0 = Clock::now();
    ASSERT_TRUE(session.start(conn, t0, err)) << err;

    while (!session.isComplete() && Clock::now() - t0 < std::chrono::seconds(5)) {
        session.advance(conn);
        std::this_thread::sleep_for(std::chrono::microseconds(200));
    }
    const auto elapsed = Clock::now() - t0;

    ASSERT_TRUE(session.isComplete());
    EXPECT_EQ(conn.sentDatagrams.size(), 50u);
    // The last chunk is due 49 intervals after the first
    EXPECT_GE(elapsed, std::chrono::milliseconds(49));
    EXPECT_LT(elapsed, std::chrono::milliseconds(1000));
}
