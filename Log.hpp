// Log.hpp
//
// Leveled logging for the runtime and the core. Messages are formatted with
// fmt and written to stderr as single lines tagged with their level, e.g.
// "[WARN] action on node 4 timed out". The level is process-wide.
#pragma once
#include <fmt/core.h>
#include <atomic>
#include <cstdio>
#include <optional>
#include <string>

namespace MidiFlow {

enum class LogLevel { Trace = 0, Debug, Info, Warn, Error, Off };

namespace detail {
inline std::atomic<int>& logLevelStorage() {
    static std::atomic<int> level{static_cast<int>(LogLevel::Info)};
    return level;
}
}

inline void setLogLevel(LogLevel level) { detail::logLevelStorage().store(static_cast<int>(level)); }
inline LogLevel logLevel() { return static_cast<LogLevel>(detail::logLevelStorage().load()); }
inline bool logEnabled(LogLevel level) { return static_cast<int>(level) >= static_cast<int>(logLevel()); }

inline const char* logLevelTag(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        default: return "";
    }
}

// Accepts "trace", "debug", "info", "warn", "error", "off".
std::optional<LogLevel> parseLogLevel(const std::string& name);

template <typename... Args>
void logMessage(LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
    if (!logEnabled(level)) return;
    std::string line = fmt::format("[{}] ", logLevelTag(level));
    line += fmt::format(format, std::forward<Args>(args)...);
    line += '\n';
    std::fputs(line.c_str(), stderr);
}

} // namespace MidiFlow

#define MIDIFLOW_TRACE(...) ::MidiFlow::logMessage(::MidiFlow::LogLevel::Trace, __VA_ARGS__)
#define MIDIFLOW_DEBUG(...) ::MidiFlow::logMessage(::MidiFlow::LogLevel::Debug, __VA_ARGS__)
#define MIDIFLOW_INFO(...) ::MidiFlow::logMessage(::MidiFlow::LogLevel::Info, __VA_ARGS__)
#define MIDIFLOW_WARN(...) ::MidiFlow::logMessage(::MidiFlow::LogLevel::Warn, __VA_ARGS__)
#define MIDIFLOW_ERROR(...) ::MidiFlow::logMessage(::MidiFlow::LogLevel::Error, __VA_ARGS__)
