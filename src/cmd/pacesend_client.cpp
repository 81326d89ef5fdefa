/**
 * @file pacesend_client.cpp
 * @brief Paced file sender
 *
 * Usage:
 *   pacesend_client --connect-to 127.0.0.1:4433 --in-file ./data.bin --mode dg
 *                   --chunk-bytes 1200 --rate-mbps 10 --csv-send results/send.csv
 *
 * Run with --help for the full option list.
 */

#include "pacesend/Debug.h"
#include "pacesend/KeyLog.h"
#include "pacesend/ProtocolLog.h"
#include "pacesend/SenderSession.h"
#include "pacesend/SocketEndpoint.h"
#include "pacesend/TelemetrySink.h"
#include "pacesend/TransferOptions.h"
#include "pacesend/TransportAdapter.h"

#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace PaceSend;

namespace {

volatile std::sig_atomic_t g_stopRequested = 0;

void onSignal(int) {
    g_stopRequested = 1;
}

/**
 * @brief Format bytes to human-readable string
 */
std::string formatBytes(uint64_t bytes) {
    const double KB = 1024.0;
    const double MB = 1024.0 * 1024.0;
    const double GB = 1024.0 * 1024.0 * 1024.0;

    std::ostringstream oss;
    if (bytes >= GB) {
        oss << std::fixed << std::setprecision(2) << (bytes / GB) << " GB";
    } else if (bytes >= MB) {
        oss << std::fixed << std::setprecision(2) << (bytes / MB) << " MB";
    } else if (bytes >= KB) {
        oss << std::fixed << std::setprecision(2) << (bytes / KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

}  // namespace

int main(int argc, char* argv[]) {
    SenderOptions options;
    try {
        options = SenderOptions::parseOrThrow(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << SenderOptions::usage(argv[0]);
        return 2;
    }

    if (options.showHelp) {
        std::cout << SenderOptions::usage(argv[0]);
        return 0;
    }

    setLogLevel(options.logLevel);
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    if (!options.keylogFile.empty()) {
        KeyLog::initialize(options.keylogFile);
    }

    std::string errorMsg;

    ProtocolLog protocolLog;
    if (!options.qlogFile.empty() &&
        !protocolLog.open(options.qlogFile, "client protocol log", "client", errorMsg)) {
        LOG_ERROR("Cannot open protocol log: " << errorMsg);
        return 1;
    }

    TelemetrySink telemetry(options.flushEvery);
    if (!options.csvSend.empty() && !telemetry.open(options.csvSend, errorMsg)) {
        LOG_ERROR("Cannot open send telemetry: " << errorMsg);
        return 1;
    }
    TelemetrySink* sink = telemetry.isEnabled() ? &telemetry : nullptr;

    SenderConfig senderConfig;
    senderConfig.sourcePath = options.inFile;
    senderConfig.chunkBytes = options.chunkBytes;
    senderConfig.rateBitsPerSec = options.rateBitsPerSec();
    senderConfig.channel = options.mode;

    SenderSession session(senderConfig, sink);
    if (!session.initialize(errorMsg)) {
        LOG_ERROR(errorMsg);
        return 1;
    }

    EndpointConfig endpointConfig;
    endpointConfig.useTls = options.useTls;
    endpointConfig.idleTimeoutUs = options.idleTimeoutUs;
    endpointConfig.maxDatagramFrameSize = options.maxDatagramFrameSize;
    endpointConfig.datagramSendTimeoutUs = options.sendTimeoutUs;
    endpointConfig.cca = options.cca;
    endpointConfig.protocolLog = protocolLog.isEnabled() ? &protocolLog : nullptr;

    SenderHandler handler(session, sink);
    SocketEndpoint endpoint(endpointConfig, handler, false);

    const auto startTime = std::chrono::steady_clock::now();
    if (!endpoint.connect(options.connectTo, errorMsg)) {
        LOG_ERROR(errorMsg);
        return 1;
    }

    while (!handler.isFinished()) {
        if (g_stopRequested) {
            LOG_WARNING("Interrupted, aborting transfer");
            endpoint.shutdown();
            break;
        }
        if (!endpoint.runOnce(MAX_POLL_WAIT_MS, errorMsg)) {
            LOG_ERROR("Event loop failed: " << errorMsg);
            endpoint.shutdown();
            break;
        }
    }

    const double elapsedSec = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - startTime).count();
    const double mbps = elapsedSec > 0.0
        ? static_cast<double>(session.sentBytes()) * 8.0 / elapsedSec / 1e6
        : 0.0;

    LOG_INFO("Sent " << formatBytes(session.sentBytes()) << " in " << session.chunksSent()
             << " chunks over " << std::fixed << std::setprecision(2) << elapsedSec << " s ("
             << mbps << " Mbit/s, target " << options.rateMbps << ")");

    telemetry.close();
    protocolLog.close();
    return session.isComplete() ? 0 : 1;
}
