/**
 * @file TransferOptions.cpp
 * @brief Client/server option parsing
 */

#include "pacesend/TransferOptions.h"
#include "pacesend/ErrorCodes.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <map>
#include <sstream>
#include <utility>
#include <vector>

namespace PaceSend {

namespace {

using OptionList = std::vector<std::pair<std::string, std::string>>;

[[noreturn]] void throwConfig(const char* code, const std::string& message) {
    throw std::runtime_error(std::string(code) + ": " + message);
}

std::string normalizeKey(std::string key) {
    for (char& c : key) {
        if (c == '_') {
            c = '-';
        }
    }
    return key;
}

uint64_t parseUnsignedOrThrow(const std::string& key, const std::string& value) {
    if (value.empty() || value[0] == '-' || value[0] == '+') {
        throwConfig(ErrorCodes::CONFIG_INVALID_VALUE, "--" + key + " expects an unsigned integer, got '" + value + "'");
    }
    try {
        size_t pos = 0;
        const unsigned long long parsed = std::stoull(value, &pos, 10);
        if (pos != value.size()) {
            throwConfig(ErrorCodes::CONFIG_INVALID_VALUE, "--" + key + " expects an unsigned integer, got '" + value + "'");
        }
        return static_cast<uint64_t>(parsed);
    } catch (const std::logic_error&) {
        throwConfig(ErrorCodes::CONFIG_INVALID_VALUE, "--" + key + " expects an unsigned integer, got '" + value + "'");
    }
}

double parseDoubleOrThrow(const std::string& key, const std::string& value) {
    try {
        size_t pos = 0;
        const double parsed = std::stod(value, &pos);
        if (pos != value.size()) {
            throwConfig(ErrorCodes::CONFIG_INVALID_VALUE, "--" + key + " expects a number, got '" + value + "'");
        }
        return parsed;
    } catch (const std::logic_error&) {
        throwConfig(ErrorCodes::CONFIG_INVALID_VALUE, "--" + key + " expects a number, got '" + value + "'");
    }
}

bool parseBoolOrThrow(const std::string& key, const std::string& value) {
    if (value == "true" || value == "1") {
        return true;
    }
    if (value == "false" || value == "0") {
        return false;
    }
    throwConfig(ErrorCodes::CONFIG_INVALID_VALUE, "--" + key + " expects true or false, got '" + value + "'");
}

LogLevel parseLogLevelOrThrow(const std::string& value) {
    LogLevel level = LogLevel::INFO;
    if (!parseLogLevel(value, level)) {
        throwConfig(ErrorCodes::CONFIG_INVALID_VALUE, "unknown log level: " + value);
    }
    return level;
}

ChannelKind parseModeOrThrow(const std::string& value) {
    ChannelKind kind = ChannelKind::DATAGRAM;
    if (!parseChannelKind(value, kind)) {
        throwConfig(ErrorCodes::CONFIG_INVALID_VALUE, "unknown mode: " + value + " (expected datagram|dg|stream|str)");
    }
    return kind;
}

/**
 * Split argv into (long-name, value) pairs. Switches get the value "true".
 */
OptionList collectArgsOrThrow(int argc,
                              const char* const* argv,
                              const std::map<std::string, std::string>& shortNames,
                              bool& showHelp)
{
    OptionList out;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i] ? std::string(argv[i]) : std::string();

        if (a == "--help" || a == "-h") {
            showHelp = true;
            continue;
        }

        std::string key;
        std::string value;
        bool hasValue = false;

        if (a.rfind("--", 0) == 0 && a.size() > 2) {
            key = a.substr(2);
            const size_t eq = key.find('=');
            if (eq != std::string::npos) {
                value = key.substr(eq + 1);
                key = key.substr(0, eq);
                hasValue = true;
            }
            key = normalizeKey(key);
        } else {
            auto it = shortNames.find(a);
            if (it == shortNames.end()) {
                throwConfig(ErrorCodes::CONFIG_INVALID_ARGUMENT, "Unknown argument: " + a);
            }
            key = it->second;
        }

        if (key == "no-tls") {
            out.emplace_back(key, hasValue ? value : std::string("true"));
            continue;
        }

        if (!hasValue) {
            if (i + 1 >= argc || argv[i + 1] == nullptr) {
                throwConfig(ErrorCodes::CONFIG_INVALID_ARGUMENT, "Missing value for " + a);
            }
            value = argv[++i];
        }
        out.emplace_back(key, value);
    }

    return out;
}

OptionList loadConfigFileOrThrow(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throwConfig(ErrorCodes::CONFIG_FILE_ERROR, "cannot open config file: " + path);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(in);
    } catch (const nlohmann::json::exception& e) {
        throwConfig(ErrorCodes::CONFIG_FILE_ERROR, "invalid JSON in " + path + ": " + e.what());
    }

    if (!j.is_object()) {
        throwConfig(ErrorCodes::CONFIG_FILE_ERROR, "config file must hold a JSON object: " + path);
    }

    OptionList out;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string key = normalizeKey(it.key());
        const nlohmann::json& v = it.value();

        if (v.is_string()) {
            out.emplace_back(key, v.get<std::string>());
        } else if (v.is_boolean()) {
            out.emplace_back(key, v.get<bool>() ? "true" : "false");
        } else if (v.is_number()) {
            out.emplace_back(key, v.dump());
        } else {
            throwConfig(ErrorCodes::CONFIG_FILE_ERROR, "unsupported value type for key '" + it.key() + "'");
        }
    }
    return out;
}

/**
 * File values first, then command-line values, skipping --config itself.
 */
template <typename ApplyFn>
void applyAllOrThrow(const OptionList& cliArgs, ApplyFn apply) {
    for (const auto& kv : cliArgs) {
        if (kv.first == "config") {
            for (const auto& fileKv : loadConfigFileOrThrow(kv.second)) {
                if (fileKv.first != "config") {
                    apply(fileKv.first, fileKv.second);
                }
            }
        }
    }
    for (const auto& kv : cliArgs) {
        if (kv.first != "config") {
            apply(kv.first, kv.second);
        }
    }
}

void applySenderOrThrow(SenderOptions& out, const std::string& key, const std::string& value) {
    if (key == "log-level") {
        out.logLevel = parseLogLevelOrThrow(value);
    } else if (key == "connect-to") {
        out.connectTo = SocketAddress::parseOrThrow(value);
    } else if (key == "idle-timeout") {
        out.idleTimeoutUs = parseUnsignedOrThrow(key, value);
    } else if (key == "keylog-file") {
        out.keylogFile = value;
    } else if (key == "qlog-file") {
        out.qlogFile = value;
    } else if (key == "csv-send") {
        out.csvSend = value;
    } else if (key == "flush-every") {
        out.flushEvery = static_cast<size_t>(parseUnsignedOrThrow(key, value));
    } else if (key == "max-datagram-frame-size") {
        out.maxDatagramFrameSize = static_cast<size_t>(parseUnsignedOrThrow(key, value));
    } else if (key == "send-timeout") {
        out.sendTimeoutUs = parseUnsignedOrThrow(key, value);
    } else if (key == "mode") {
        out.mode = parseModeOrThrow(value);
    } else if (key == "in-file") {
        out.inFile = value;
    } else if (key == "chunk-bytes") {
        out.chunkBytes = static_cast<size_t>(parseUnsignedOrThrow(key, value));
    } else if (key == "rate-mbps") {
        out.rateMbps = parseDoubleOrThrow(key, value);
    } else if (key == "cca") {
        out.cca = parseCongestionControlOrThrow(value);
    } else if (key == "no-tls") {
        out.useTls = !parseBoolOrThrow(key, value);
    } else {
        throwConfig(ErrorCodes::CONFIG_INVALID_ARGUMENT, "Unknown argument: --" + key);
    }
}

void applyReceiverOrThrow(ReceiverOptions& out, const std::string& key, const std::string& value) {
    if (key == "log-level") {
        out.logLevel = parseLogLevelOrThrow(value);
    } else if (key == "listen") {
        out.listen = SocketAddress::parseOrThrow(value);
    } else if (key == "idle-timeout") {
        out.idleTimeoutUs = parseUnsignedOrThrow(key, value);
    } else if (key == "cert") {
        out.certFile = value;
    } else if (key == "key") {
        out.keyFile = value;
    } else if (key == "keylog-file") {
        out.keylogFile = value;
    } else if (key == "qlog-file") {
        out.qlogFile = value;
    } else if (key == "max-datagram-frame-size") {
        out.maxDatagramFrameSize = static_cast<size_t>(parseUnsignedOrThrow(key, value));
    } else if (key == "send-timeout") {
        out.sendTimeoutUs = parseUnsignedOrThrow(key, value);
    } else if (key == "out-dir") {
        out.outDir = value;
    } else if (key == "flush-every") {
        out.flushEvery = static_cast<size_t>(parseUnsignedOrThrow(key, value));
    } else if (key == "csv-recv") {
        out.csvRecv = value;
    } else if (key == "cca") {
        out.cca = parseCongestionControlOrThrow(value);
    } else if (key == "no-tls") {
        out.useTls = !parseBoolOrThrow(key, value);
    } else {
        throwConfig(ErrorCodes::CONFIG_INVALID_ARGUMENT, "Unknown argument: --" + key);
    }
}

}  // namespace

SocketAddress SocketAddress::parseOrThrow(const std::string& text) {
    const size_t colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= text.size()) {
        throwConfig(ErrorCodes::CONFIG_INVALID_VALUE, "expected host:port, got '" + text + "'");
    }

    SocketAddress out;
    out.host = text.substr(0, colon);
    if (out.host.size() >= 2 && out.host.front() == '[' && out.host.back() == ']') {
        out.host = out.host.substr(1, out.host.size() - 2);
    }

    const uint64_t port = parseUnsignedOrThrow("port", text.substr(colon + 1));
    if (port > 65535) {
        throwConfig(ErrorCodes::CONFIG_INVALID_VALUE, "port out of range in '" + text + "'");
    }
    out.port = static_cast<uint16_t>(port);
    return out;
}

// ============================================================================
// SenderOptions
// ============================================================================

SenderOptions SenderOptions::parseOrThrow(int argc, const char* const* argv) {
    SenderOptions out;

    const std::map<std::string, std::string> shortNames = {
        {"-c", "connect-to"},
        {"-f", "in-file"},
        {"-m", "mode"},
    };

    const OptionList cliArgs = collectArgsOrThrow(argc, argv, shortNames, out.showHelp);
    if (out.showHelp) {
        return out;
    }

    bool haveConnectTo = false;
    applyAllOrThrow(cliArgs, [&](const std::string& key, const std::string& value) {
        applySenderOrThrow(out, key, value);
        if (key == "connect-to") {
            haveConnectTo = true;
        }
    });

    if (!haveConnectTo) {
        throwConfig(ErrorCodes::CONFIG_INVALID_ARGUMENT, "--connect-to is required");
    }
    if (out.inFile.empty()) {
        throwConfig(ErrorCodes::CONFIG_INVALID_ARGUMENT, "--in-file is required");
    }
    if (out.chunkBytes == 0) {
        throwConfig(ErrorCodes::CONFIG_INVALID_VALUE, "--chunk-bytes must be > 0");
    }
    if (out.mode == ChannelKind::DATAGRAM) {
        const size_t frameLimit = std::min(out.maxDatagramFrameSize, MAX_UDP_PAYLOAD - DATAGRAM_TOKEN_SIZE);
        if (out.chunkBytes + CHUNK_HEADER_SIZE > frameLimit) {
            throwConfig(ErrorCodes::CONFIG_INVALID_VALUE,
                        "--chunk-bytes " + std::to_string(out.chunkBytes) +
                        " plus the " + std::to_string(CHUNK_HEADER_SIZE) +
                        "-byte header exceeds the datagram limit of " + std::to_string(frameLimit));
        }
    }
    if (!(out.rateMbps > 0.0)) {
        throwConfig(ErrorCodes::CONFIG_INVALID_VALUE, "--rate-mbps must be > 0");
    }
    if (out.flushEvery == 0) {
        throwConfig(ErrorCodes::CONFIG_INVALID_VALUE, "--flush-every must be > 0");
    }

    return out;
}

std::string SenderOptions::usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " --connect-to HOST:PORT --in-file PATH [options]\n"
        << "\n"
        << "  -c, --connect-to HOST:PORT        Server address\n"
        << "  -f, --in-file PATH                File to send\n"
        << "  -m, --mode datagram|stream        Channel kind (default datagram)\n"
        << "      --chunk-bytes N               Chunk size in bytes (default " << DEFAULT_CHUNK_BYTES << ")\n"
        << "      --rate-mbps R                 Target rate in Mbit/s (default " << DEFAULT_RATE_MBPS << ")\n"
        << "      --cca Cubic|Bbr|Copa|Reno     Congestion control algorithm\n"
        << "      --idle-timeout US             Idle timeout in microseconds (default " << DEFAULT_IDLE_TIMEOUT_US << ")\n"
        << "      --max-datagram-frame-size N   Datagram size limit (default " << DEFAULT_MAX_DATAGRAM_FRAME_SIZE << ")\n"
        << "      --send-timeout US             Datagram send timeout (default " << DEFAULT_CLIENT_DATAGRAM_SEND_TIMEOUT_US << ")\n"
        << "      --csv-send PATH               Telemetry CSV\n"
        << "      --flush-every N               Telemetry flush cadence (default " << DEFAULT_FLUSH_EVERY << ")\n"
        << "      --keylog-file PATH            TLS key log\n"
        << "      --qlog-file PATH              Protocol event log (JSON lines)\n"
        << "      --no-tls                      Plain TCP control channel\n"
        << "      --config PATH                 JSON file with option defaults\n"
        << "      --log-level LEVEL             ERROR|WARN|INFO|DEBUG (default INFO)\n"
        << "  -h, --help                        Show this help\n";
    return oss.str();
}

// ============================================================================
// ReceiverOptions
// ============================================================================

ReceiverOptions::ReceiverOptions()
    : listen(SocketAddress::parseOrThrow(DEFAULT_LISTEN_ADDRESS))
{
}

ReceiverOptions ReceiverOptions::parseOrThrow(int argc, const char* const* argv) {
    ReceiverOptions out;

    const std::map<std::string, std::string> shortNames = {
        {"-c", "cert"},
        {"-k", "key"},
        {"-l", "listen"},
    };

    const OptionList cliArgs = collectArgsOrThrow(argc, argv, shortNames, out.showHelp);
    if (out.showHelp) {
        return out;
    }

    applyAllOrThrow(cliArgs, [&](const std::string& key, const std::string& value) {
        applyReceiverOrThrow(out, key, value);
    });

    if (out.outDir.empty()) {
        throwConfig(ErrorCodes::CONFIG_INVALID_VALUE, "--out-dir must not be empty");
    }
    if (out.flushEvery == 0) {
        throwConfig(ErrorCodes::CONFIG_INVALID_VALUE, "--flush-every must be > 0");
    }

    return out;
}

std::string ReceiverOptions::usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n"
        << "\n"
        << "  -l, --listen HOST:PORT            Listen address (default " << DEFAULT_LISTEN_ADDRESS << ")\n"
        << "  -c, --cert PATH                   TLS certificate (default " << DEFAULT_CERT_FILE << ")\n"
        << "  -k, --key PATH                    TLS private key (default " << DEFAULT_KEY_FILE << ")\n"
        << "      --out-dir DIR                 Output directory (default " << DEFAULT_OUT_DIR << ")\n"
        << "      --csv-recv PATH               Telemetry CSV\n"
        << "      --flush-every N               Telemetry flush cadence (default " << DEFAULT_FLUSH_EVERY << ")\n"
        << "      --cca Cubic|Bbr|Copa|Reno     Congestion control algorithm\n"
        << "      --idle-timeout US             Idle timeout in microseconds (default " << DEFAULT_IDLE_TIMEOUT_US << ")\n"
        << "      --max-datagram-frame-size N   Datagram size limit (default " << DEFAULT_MAX_DATAGRAM_FRAME_SIZE << ")\n"
        << "      --send-timeout US             Datagram send timeout (default " << DEFAULT_SERVER_DATAGRAM_SEND_TIMEOUT_US << ")\n"
        << "      --keylog-file PATH            TLS key log\n"
        << "      --qlog-file PATH              Protocol event log (JSON lines)\n"
        << "      --no-tls                      Plain TCP control channel\n"
        << "      --config PATH                 JSON file with option defaults\n"
        << "      --log-level LEVEL             ERROR|WARN|INFO|DEBUG (default INFO)\n"
        << "  -h, --help                        Show this help\n";
    return oss.str();
}

}  // namespace PaceSend
