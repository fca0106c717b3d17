#include "core/Logger.hpp"
#include <algorithm>
#include <cctype>

namespace core {

std::mutex Logger::mutex_;
std::atomic<LogLevel> Logger::level_{LogLevel::INFO};

LogLevel Logger::parseLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

} // namespace core
