/**
 * @file pacesend_server.cpp
 * @brief Receiver: accepts senders one at a time and writes their files
 *
 * Usage:
 *   pacesend_server --listen 0.0.0.0:4433 --out-dir results/recv --csv-recv results/recv.csv
 *
 * Runs until SIGINT/SIGTERM.
 */

#include "pacesend/Debug.h"
#include "pacesend/KeyLog.h"
#include "pacesend/ProtocolLog.h"
#include "pacesend/ReceiverSession.h"
#include "pacesend/SocketEndpoint.h"
#include "pacesend/TelemetrySink.h"
#include "pacesend/TransferOptions.h"
#include "pacesend/TransportAdapter.h"

#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace PaceSend;

namespace {

volatile std::sig_atomic_t g_stopRequested = 0;

void onSignal(int) {
    g_stopRequested = 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    ReceiverOptions options;
    try {
        options = ReceiverOptions::parseOrThrow(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << ReceiverOptions::usage(argv[0]);
        return 2;
    }

    if (options.showHelp) {
        std::cout << ReceiverOptions::usage(argv[0]);
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
        !protocolLog.open(options.qlogFile, "server protocol log", "server", errorMsg)) {
        LOG_ERROR("Cannot open protocol log: " << errorMsg);
        return 1;
    }

    TelemetrySink telemetry(options.flushEvery);
    if (!options.csvRecv.empty() && !telemetry.open(options.csvRecv, errorMsg)) {
        LOG_ERROR("Cannot open receive telemetry: " << errorMsg);
        return 1;
    }
    TelemetrySink* sink = telemetry.isEnabled() ? &telemetry : nullptr;

    ReceiverConfig receiverConfig;
    receiverConfig.outDir = options.outDir;

    ReceiverSession session(receiverConfig, sink);
    if (!session.prepare(errorMsg)) {
        LOG_ERROR(errorMsg);
        return 1;
    }

    EndpointConfig endpointConfig;
    endpointConfig.useTls = options.useTls;
    endpointConfig.certFile = options.certFile;
    endpointConfig.keyFile = options.keyFile;
    endpointConfig.idleTimeoutUs = options.idleTimeoutUs;
    endpointConfig.maxDatagramFrameSize = options.maxDatagramFrameSize;
    endpointConfig.datagramSendTimeoutUs = options.sendTimeoutUs;
    endpointConfig.cca = options.cca;
    endpointConfig.protocolLog = protocolLog.isEnabled() ? &protocolLog : nullptr;

    ReceiverHandler handler(session, sink);
    SocketEndpoint endpoint(endpointConfig, handler, true);

    if (!endpoint.listen(options.listen, errorMsg)) {
        LOG_ERROR(errorMsg);
        return 1;
    }
    LOG_INFO("Writing received files to " << options.outDir);

    int exitCode = 0;
    while (!g_stopRequested) {
        if (!endpoint.runOnce(MAX_POLL_WAIT_MS, errorMsg)) {
            LOG_ERROR("Event loop failed: " << errorMsg);
            exitCode = 1;
            break;
        }
    }

    endpoint.shutdown();
    LOG_INFO("Shutting down after " << endpoint.connectionsServed() << " connection(s)");

    telemetry.close();
    protocolLog.close();
    return exitCode;
}
