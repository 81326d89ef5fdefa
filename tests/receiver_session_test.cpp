/**
 * @file receiver_session_test.cpp
 * @brief Datagram placement, completion and stream capture on the receiver
 *
 * (c) 2026 PaceSend Project
 * Licensed under MIT License
 */

#include <gtest/gtest.h>

#include "pacesend/ReceiverSession.h"
#include "pacesend/TransferHeader.h"
#include "MemoryConnection.h"
#include "TestFiles.h"

#include <algorithm>
#include <vector>

using namespace PaceSend;
using PaceSendTest::MemoryConnection;
using PaceSendTest::ScratchDir;

class ReceiverSessionTest : public ::testing::Test {
protected:
    ScratchDir dir{"receiver_session"};
    std::vector<uint8_t> content = PaceSendTest::patternBytes(3000, 11);
    const uint64_t transferId = 0x00c0ffee12345678ULL;

    ReceiverConfig config() {
        ReceiverConfig cfg;
        cfg.outDir = dir / "out";
        return cfg;
    }

    std::vector<uint8_t> chunk(uint64_t offset, uint32_t length, bool last) {
        TransferHeader hdr;
        hdr.transferId = transferId;
        hdr.totalSize = content.size();
        hdr.offset = offset;
        hdr.length = length;
        hdr.setLast(last);
        hdr.timestampNs = 1;
        return frameChunk(hdr, content.data() + offset, length);
    }

    std::filesystem::path datagramPath() {
        return config().outDir / ReceiverSession::datagramFileName(transferId, content.size());
    }
};

TEST_F(ReceiverSessionTest, FileNamesUseSixteenHexDigits) {
    EXPECT_EQ(ReceiverSession::datagramFileName(0xabcULL, 3000), "0000000000000abc_size3000.bin");
    EXPECT_EQ(ReceiverSession::streamFileName(4), "0000000000000004.bin");
}

TEST_F(ReceiverSessionTest, PrepareCreatesOutputDirectory) {
    ReceiverSession session(config());
    std::string err;
    ASSERT_TRUE(session.prepare(err)) << err;
    EXPECT_TRUE(std::filesystem::is_directory(config().outDir));
}

TEST_F(ReceiverSessionTest, PrepareFailsWhenOutDirIsAFile) {
    PaceSendTest::writeFile(dir / "out", {0});
    ReceiverSession session(config());
    std::string err;
    EXPECT_FALSE(session.prepare(err));
    EXPECT_NE(err.find("PSD-XFR-2001"), std::string::npos) << err;
}

//=============================================================================
// Datagram path
//=============================================================================

TEST_F(ReceiverSessionTest, InOrderChunksCompleteTheFile) {
    ReceiverSession session(config());
    std::string err;
    ASSERT_TRUE(session.prepare(err)) << err;

    auto c0 = chunk(0, 1200, false);
    auto c1 = chunk(1200, 1200, false);
    auto c2 = chunk(2400, 600, true);

    EXPECT_EQ(session.handleDatagram(c0.data(), c0.size()), DatagramOutcome::WRITTEN);
    EXPECT_EQ(session.handleDatagram(c1.data(), c1.size()), DatagramOutcome::WRITTEN);
    EXPECT_EQ(session.handleDatagram(c2.data(), c2.size()), DatagramOutcome::COMPLETED);

    EXPECT_EQ(PaceSendTest::readFile(datagramPath()), content);
    ASSERT_EQ(session.files().size(), 1u);
    const ReceiverFileState& state = session.files().at(transferId);
    EXPECT_TRUE(state.completed);
    EXPECT_EQ(state.bytesWritten, 3000u);
    EXPECT_EQ(state.chunksWritten, 3u);
}

TEST_F(ReceiverSessionTest, OutOfOrderChunksLandAtTheirOffsets) {
    ReceiverSession session(config());
    std::string err;
    ASSERT_TRUE(session.prepare(err)) << err;

    auto c0 = chunk(0, 1200, false);
    auto c1 = chunk(1200, 1200, false);
    auto c2 = chunk(2400, 600, true);

    EXPECT_EQ(session.handleDatagram(c1.data(), c1.size()), DatagramOutcome::WRITTEN);
    EXPECT_EQ(session.handleDatagram(c2.data(), c2.size()), DatagramOutcome::COMPLETED);
    EXPECT_EQ(session.handleDatagram(c0.data(), c0.size()), DatagramOutcome::WRITTEN);

    EXPECT_EQ(PaceSendTest::readFile(datagramPath()), content);
}

TEST_F(ReceiverSessionTest, DuplicateChunkRewritesSameBytes) {
    ReceiverSession session(config());
    std::string err;
    ASSERT_TRUE(session.prepare(err)) << err;

    auto c0 = chunk(0, 1200, false);
    session.handleDatagram(c0.data(), c0.size());
    session.handleDatagram(c0.data(), c0.size());

    const auto written = PaceSendTest::readFile(datagramPath());
    ASSERT_EQ(written.size(), 1200u);
    EXPECT_TRUE(std::equal(written.begin(), written.end(), content.begin()));
}

TEST_F(ReceiverSessionTest, LostMiddleChunkLeavesHoleButLengthCheckPasses) {
    ReceiverSession session(config());
    std::string err;
    ASSERT_TRUE(session.prepare(err)) << err;

    auto c0 = chunk(0, 1200, false);
    auto c2 = chunk(2400, 600, true);
    session.handleDatagram(c0.data(), c0.size());
    EXPECT_EQ(session.handleDatagram(c2.data(), c2.size()), DatagramOutcome::COMPLETED);

    const auto written = PaceSendTest::readFile(datagramPath());
    ASSERT_EQ(written.size(), 3000u);
    EXPECT_NE(written, content);
    EXPECT_EQ(written[1200], 0);
}

TEST_F(ReceiverSessionTest, LostLastChunkLeavesIncompleteFile) {
    ReceiverSession session(config());
    std::string err;
    ASSERT_TRUE(session.prepare(err)) << err;

    auto c0 = chunk(0, 1200, false);
    auto c1 = chunk(1200, 1200, false);
    session.handleDatagram(c0.data(), c0.size());
    session.handleDatagram(c1.data(), c1.size());

    EXPECT_EQ(PaceSendTest::readFile(datagramPath()).size(), 2400u);
    EXPECT_FALSE(session.files().at(transferId).completed);
}

TEST_F(ReceiverSessionTest, LastChunkBeforeFileReachesSizeIsNotComplete) {
    ReceiverSession session(config());
    std::string err;
    ASSERT_TRUE(session.prepare(err)) << err;

    // Last chunk arrives truncated so the file stops short of total size
    auto c2 = chunk(2400, 600, true);
    c2.resize(c2.size() - 100);
    EXPECT_EQ(session.handleDatagram(c2.data(), c2.size()), DatagramOutcome::WRITTEN);
    EXPECT_EQ(PaceSendTest::readFile(datagramPath()).size(), 2900u);
    EXPECT_FALSE(session.files().at(transferId).completed);
}

TEST_F(ReceiverSessionTest, TruncatedPayloadWritesOnlyWhatArrived) {
    ReceiverSession session(config());
    std::string err;
    ASSERT_TRUE(session.prepare(err)) << err;

    auto c0 = chunk(0, 1200, false);
    c0.resize(CHUNK_HEADER_SIZE + 500);
    EXPECT_EQ(session.handleDatagram(c0.data(), c0.size()), DatagramOutcome::WRITTEN);
    EXPECT_EQ(session.files().at(transferId).bytesWritten, 500u);
    EXPECT_EQ(PaceSendTest::readFile(datagramPath()).size(), 500u);
}

TEST_F(ReceiverSessionTest, MalformedDatagramIsDroppedWithoutCreatingFile) {
    ReceiverSession session(config());
    std::string err;
    ASSERT_TRUE(session.prepare(err)) << err;

    const std::vector<uint8_t> junk(CHUNK_HEADER_SIZE - 1, 0xAB);
    EXPECT_EQ(session.handleDatagram(junk.data(), junk.size()), DatagramOutcome::MALFORMED);
    EXPECT_TRUE(session.files().empty());
    EXPECT_TRUE(std::filesystem::is_empty(config().outDir));
}

TEST_F(ReceiverSessionTest, ExistingFileIsNotTruncated) {
    std::string err;
    {
        ReceiverSession first(config());
        ASSERT_TRUE(first.prepare(err)) << err;
        auto c0 = chunk(0, 1200, false);
        first.handleDatagram(c0.data(), c0.size());
    }

    // A later session with the same transfer id resumes into the same file
    ReceiverSession second(config());
    ASSERT_TRUE(second.prepare(err)) << err;
    auto c1 = chunk(1200, 1200, false);
    auto c2 = chunk(2400, 600, true);
    second.handleDatagram(c1.data(), c1.size());
    EXPECT_EQ(second.handleDatagram(c2.data(), c2.size()), DatagramOutcome::COMPLETED);

    EXPECT_EQ(PaceSendTest::readFile(datagramPath()), content);
}

TEST_F(ReceiverSessionTest, EmptyLastChunkCompletesEmptyFile) {
    ReceiverSession session(config());
    std::string err;
    ASSERT_TRUE(session.prepare(err)) << err;

    TransferHeader hdr;
    hdr.transferId = 77;
    hdr.totalSize = 0;
    hdr.length = 0;
    hdr.setLast(true);
    const auto message = hdr.encode();

    EXPECT_EQ(session.handleDatagram(message.data(), message.size()), DatagramOutcome::COMPLETED);
    const auto path = config().outDir / ReceiverSession::datagramFileName(77, 0);
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(std::filesystem::file_size(path), 0u);
}

TEST_F(ReceiverSessionTest, DrainDatagramsConsumesEverythingQueued) {
    ReceiverSession session(config());
    std::string err;
    ASSERT_TRUE(session.prepare(err)) << err;

    MemoryConnection conn;
    conn.inboundDatagrams.push_back(chunk(0, 1200, false));
    conn.inboundDatagrams.push_back(std::vector<uint8_t>(3, 0));
    conn.inboundDatagrams.push_back(chunk(1200, 1200, false));

    EXPECT_EQ(session.drainDatagrams(conn), 3u);
    EXPECT_TRUE(conn.inboundDatagrams.empty());
    EXPECT_EQ(session.files().at(transferId).chunksWritten, 2u);
}

TEST_F(ReceiverSessionTest, DatagramTelemetryRecordsEachWrite) {
    TelemetrySink sink(1);
    std::string err;
    ASSERT_TRUE(sink.open(dir / "recv.csv", err)) << err;

    ReceiverSession session(config(), &sink);
    ASSERT_TRUE(session.prepare(err)) << err;

    auto c0 = chunk(0, 1200, false);
    const std::vector<uint8_t> junk(10, 0);
    session.handleDatagram(c0.data(), c0.size());
    session.handleDatagram(junk.data(), junk.size());

    EXPECT_EQ(sink.recordCount(), 1u);
}

//=============================================================================
// Stream path
//=============================================================================

TEST_F(ReceiverSessionTest, StreamBytesAppendUntilFin) {
    ReceiverSession session(config());
    std::string err;
    ASSERT_TRUE(session.prepare(err)) << err;

    MemoryConnection conn;
    conn.readLimit = 700;
    auto& in = conn.inStreams[4];
    in.data.assign(content.begin(), content.begin() + 1000);

    ASSERT_TRUE(session.handleStreamReadable(conn, 4));
    EXPECT_EQ(session.streams().at(4).receivedBytes, 1000u);
    EXPECT_FALSE(session.streams().at(4).finished);

    in.data.insert(in.data.end(), content.begin() + 1000, content.end());
    in.fin = true;
    ASSERT_TRUE(session.handleStreamReadable(conn, 4));

    const ReceiverStreamState& state = session.streams().at(4);
    EXPECT_TRUE(state.finished);
    EXPECT_EQ(state.receivedBytes, 3000u);
    EXPECT_EQ(PaceSendTest::readFile(config().outDir / ReceiverSession::streamFileName(4)), content);
}

TEST_F(ReceiverSessionTest, StreamWithOnlyFinProducesEmptyFile) {
    ReceiverSession session(config());
    std::string err;
    ASSERT_TRUE(session.prepare(err)) << err;

    MemoryConnection conn;
    conn.inStreams[0].fin = true;

    ASSERT_TRUE(session.handleStreamReadable(conn, 0));
    EXPECT_TRUE(session.streams().at(0).finished);
    EXPECT_EQ(std::filesystem::file_size(config().outDir / ReceiverSession::streamFileName(0)), 0u);
}

TEST_F(ReceiverSessionTest, StreamFileIsTruncatedOnCreate) {
    std::string err;
    ReceiverSession session(config());
    ASSERT_TRUE(session.prepare(err)) << err;
    PaceSendTest::writeFile(config().outDir / ReceiverSession::streamFileName(8),
                            std::vector<uint8_t>(5000, 0xEE));

    MemoryConnection conn;
    conn.inStreams[8].data.assign(content.begin(), content.begin() + 100);
    conn.inStreams[8].fin = true;
    ASSERT_TRUE(session.handleStreamReadable(conn, 8));

    EXPECT_EQ(std::filesystem::file_size(config().outDir / ReceiverSession::streamFileName(8)), 100u);
}

TEST_F(ReceiverSessionTest, ReleaseStreamsForgetsStateSoIdsCanBeReused) {
    ReceiverSession session(config());
    std::string err;
    ASSERT_TRUE(session.prepare(err)) << err;

    MemoryConnection first;
    first.inStreams[0].data.assign(content.begin(), content.begin() + 500);
    ASSERT_TRUE(session.handleStreamReadable(first, 0));
    EXPECT_EQ(session.streams().size(), 1u);

    session.releaseStreams();
    EXPECT_TRUE(session.streams().empty());

    MemoryConnection second;
    second.inStreams[0].data.assign(content.begin(), content.begin() + 200);
    second.inStreams[0].fin = true;
    ASSERT_TRUE(session.handleStreamReadable(second, 0));
    EXPECT_EQ(session.streams().at(0).receivedBytes, 200u);
}

TEST_F(ReceiverSessionTest, StreamReadFailureStopsWithoutError) {
    ReceiverSession session(config());
    std::string err;
    ASSERT_TRUE(session.prepare(err)) << err;

    MemoryConnection conn;
    EXPECT_TRUE(session.handleStreamReadable(conn, 12));
    EXPECT_EQ(session.streams().at(12).receivedBytes, 0u);
}

TEST_F(ReceiverSessionTest, StreamTelemetryUsesStreamIdAndRunningOffset) {
    const auto csv = dir / "recv.csv";
    TelemetrySink sink(1);
    std::string err;
    ASSERT_TRUE(sink.open(csv, err)) << err;

    ReceiverSession session(config(), &sink);
    ASSERT_TRUE(session.prepare(err)) << err;

    MemoryConnection conn;
    conn.readLimit = 1000;
    conn.inStreams[4].data = content;
    conn.inStreams[4].fin = true;
    ASSERT_TRUE(session.handleStreamReadable(conn, 4));
    sink.close();

    EXPECT_EQ(sink.recordCount(), 3u);
    const auto bytes = PaceSendTest::readFile(csv);
    const std::string text(bytes.begin(), bytes.end());
    EXPECT_NE(text.find(",0000000000000004,2000,1000,stream"), std::string::npos) << text;
}
