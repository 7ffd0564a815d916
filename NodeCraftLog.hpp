// NodeCraft logging
//
// Leveled stderr logging on top of fmt. Lines carry a "[LEVEL]" prefix the
// same way the runtime prints its debug traces, and everything below the
// configured level is dropped before formatting.
#pragma once
#include <fmt/core.h>
#include <optional>
#include <string>
#include <utility>

namespace NodeCraft {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void setLogLevel(LogLevel level);
LogLevel logLevel();
const char* logLevelName(LogLevel level);
std::optional<LogLevel> parseLogLevel(const std::string& name);

// Writes one already formatted line. Thread-safe.
void logLine(LogLevel level, const std::string& message);

inline bool logEnabled(LogLevel level) { return level >= logLevel() && level != LogLevel::Off; }

template <typename... Args>
void logDebug(fmt::format_string<Args...> format, Args&&... args) {
    if (logEnabled(LogLevel::Debug)) logLine(LogLevel::Debug, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void logInfo(fmt::format_string<Args...> format, Args&&... args) {
    if (logEnabled(LogLevel::Info)) logLine(LogLevel::Info, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void logWarn(fmt::format_string<Args...> format, Args&&... args) {
    if (logEnabled(LogLevel::Warn)) logLine(LogLevel::Warn, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void logError(fmt::format_string<Args...> format, Args&&... args) {
    if (logEnabled(LogLevel::Error)) logLine(LogLevel::Error, fmt::format(format, std::forward<Args>(args)...));
}

} // namespace NodeCraft
