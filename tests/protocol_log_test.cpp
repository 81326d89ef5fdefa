/**
 * @file protocol_log_test.cpp
 * @brief Unit tests for the JSON-lines protocol log and the TLS key log
 *
 * (c) 2026 PaceSend Project
 * Licensed under MIT License
 */

#include "pacesend/KeyLog.h"
#include "pacesend/ProtocolLog.h"
#include "TestFiles.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace PaceSend;
using PaceSendTest::ScratchDir;

namespace {

std::vector<json> readJsonLines(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::vector<json> out;
    std::string line;
    while (std::getline(in, line)) {
        out.push_back(json::parse(line));
    }
    return out;
}

}  // namespace

//=============================================================================
// Protocol Log Tests
//=============================================================================

/**
 * @test The first line names the log and its vantage point
 */
TEST(ProtocolLogTest, OpenWritesHeaderLine) {
    ScratchDir dir("protocol_log_header");
    const auto path = dir / "logs/client.qlog";

    ProtocolLog log;
    std::string err;
    ASSERT_TRUE(log.open(path, "pacesend_client", "client", err)) << err;
    log.close();

    const auto lines = readJsonLines(path);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0]["title"], "pacesend_client");
    EXPECT_EQ(lines[0]["vantage_point"], "client");
}

/**
 * @test Each event is one JSON object with category, name, connection and data
 */
TEST(ProtocolLogTest, EventsAreOneObjectPerLine) {
    ScratchDir dir("protocol_log_events");
    const auto path = dir / "server.qlog";

    ProtocolLog log;
    std::string err;
    ASSERT_TRUE(log.open(path, "pacesend_server", "server", err)) << err;
    log.event("transport", "datagram_sent", "abcd", json{{"size", 1240}});
    log.event("connectivity", "connection_closed", "abcd");
    EXPECT_EQ(log.eventCount(), 2u);
    log.close();

    const auto lines = readJsonLines(path);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[1]["category"], "transport");
    EXPECT_EQ(lines[1]["name"], "datagram_sent");
    EXPECT_EQ(lines[1]["conn"], "abcd");
    EXPECT_EQ(lines[1]["data"]["size"], 1240);
    EXPECT_TRUE(lines[1]["time_us"].is_number_unsigned());
    EXPECT_TRUE(lines[2]["data"].is_object());
    EXPECT_LE(lines[1]["time_us"].get<uint64_t>(), lines[2]["time_us"].get<uint64_t>());
}

/**
 * @test A log that was never opened drops events
 */
TEST(ProtocolLogTest, ClosedLogIgnoresEvents) {
    ProtocolLog log;
    EXPECT_FALSE(log.isEnabled());
    log.event("transport", "ignored", "x");
    EXPECT_EQ(log.eventCount(), 0u);
}

//=============================================================================
// Key Log Tests
//=============================================================================

/**
 * @test Key log lines are appended verbatim once a path is configured
 */
TEST(KeyLogTest, AppendsLinesWhenEnabled) {
    ScratchDir dir("keylog");
    const auto path = dir / "keys.log";

    KeyLog::initialize("");
    EXPECT_FALSE(KeyLog::isEnabled());
    KeyLog::log("dropped");
    EXPECT_FALSE(std::filesystem::exists(path));

    KeyLog::initialize(path);
    EXPECT_TRUE(KeyLog::isEnabled());
    KeyLog::log("CLIENT_RANDOM aa bb");
    KeyLog::sslCallback(nullptr, "SERVER_TRAFFIC_SECRET_0 cc dd");
    KeyLog::sslCallback(nullptr, nullptr);
    KeyLog::initialize("");

    const auto bytes = PaceSendTest::readFile(path);
    EXPECT_EQ(std::string(bytes.begin(), bytes.end()),
              "CLIENT_RANDOM aa bb\nSERVER_TRAFFIC_SECRET_0 cc dd\n");
}
