// NodeCraftLog.cpp
//
// Global log level and the serialized stderr sink.
#include "NodeCraftLog.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <mutex>

namespace NodeCraft {

namespace {
std::atomic<int> currentLevel{static_cast<int>(LogLevel::Warn)};
std::mutex sinkMutex;
}

void setLogLevel(LogLevel level) { currentLevel.store(static_cast<int>(level)); }

LogLevel logLevel() { return static_cast<LogLevel>(currentLevel.load()); }

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off: return "OFF";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> parseLogLevel(const std::string& text) {
    std::string name = text;
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "off") return LogLevel::Off;
    return std::nullopt;
}

void logLine(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(sinkMutex);
    fmt::print(stderr, "[{}] {}\n", logLevelName(level), message);
}

} // namespace NodeCraft
