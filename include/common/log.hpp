#pragma once
#include <optional>
#include <string>

namespace h2site {

enum class LogLevel : int { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

// Global verbosity, default kWarn so library callers stay quiet.
void SetLogLevel(LogLevel lvl) noexcept;
LogLevel GetLogLevel() noexcept;

// "debug" / "info" / "warn" / "error" (case-insensitive)
std::optional<LogLevel> ParseLogLevel(const std::string& text);

// Timestamped line; WARN/ERROR go to stderr, the rest to stdout. Never throws.
void Log(LogLevel lvl, const std::string& msg) noexcept;

inline void LogDebug(const std::string& msg) noexcept { Log(LogLevel::kDebug, msg); }
inline void LogInfo(const std::string& msg) noexcept { Log(LogLevel::kInfo, msg); }
inline void LogWarn(const std::string& msg) noexcept { Log(LogLevel::kWarn, msg); }
inline void LogError(const std::string& msg) noexcept { Log(LogLevel::kError, msg); }

} // namespace h2site
