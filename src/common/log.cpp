#include "common/log.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace h2site {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::kWarn)};

// Never destroyed: a late fetch worker may still log during static teardown.
// std::cout/std::cerr outlive static destructors already.
std::mutex& LogMutex() {
  static auto* mu = new std::mutex;
  return *mu;
}

const char* LevelTag(LogLevel lvl) noexcept {
  switch (lvl) {
    case LogLevel::kDebug: return "DEBUG";
    case LogLevel::kInfo:  return "INFO";
    case LogLevel::kWarn:  return "WARN";
    case LogLevel::kError: return "ERROR";
  }
  return "INFO";
}

std::string UtcTimestamp() {
  using clock = std::chrono::system_clock;
  const std::time_t tt = clock::to_time_t(clock::now());
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

} // namespace

void SetLogLevel(LogLevel lvl) noexcept {
  g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel GetLogLevel() noexcept {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

std::optional<LogLevel> ParseLogLevel(const std::string& text) {
  std::string s;
  for (char c : text) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (s == "debug") return LogLevel::kDebug;
  if (s == "info") return LogLevel::kInfo;
  if (s == "warn" || s == "warning") return LogLevel::kWarn;
  if (s == "error") return LogLevel::kError;
  return std::nullopt;
}

void Log(LogLevel lvl, const std::string& msg) noexcept {
  if (static_cast<int>(lvl) < g_level.load(std::memory_order_relaxed)) return;
  try {
    const std::string ts = UtcTimestamp();
    std::lock_guard<std::mutex> lk(LogMutex());
    std::ostream& out = (lvl >= LogLevel::kWarn) ? std::cerr : std::cout;
    out << "[" << ts << "][" << LevelTag(lvl) << "] " << msg << "\n";
    out.flush();
  } catch (const std::exception&) {
    // a failing log sink must not take the caller down
  }
}

} // namespace h2site
