/**
 * @file KeyLog.cpp
 * @brief NSS key log writer
 */

#include "pacesend/KeyLog.h"

#include <fstream>

namespace PaceSend {

std::mutex KeyLog::s_mutex;
std::filesystem::path KeyLog::s_logPath;

void KeyLog::initialize(const std::filesystem::path& logPath) {
    std::lock_guard<std::mutex> lock(s_mutex);
    s_logPath = logPath;
}

bool KeyLog::isEnabled() {
    std::lock_guard<std::mutex> lock(s_mutex);
    return !s_logPath.empty();
}

void KeyLog::log(const std::string& line) {
    std::lock_guard<std::mutex> lock(s_mutex);

    if (s_logPath.empty()) {
        return;
    }

    std::ofstream file(s_logPath, std::ios::app);
    if (file.is_open()) {
        file << line << "\n";
        file.flush();
    }
}

void KeyLog::sslCallback(const SSL* ssl, const char* line) {
    (void)ssl;
    if (line) {
        log(std::string(line));
    }
}

}  // namespace PaceSend
