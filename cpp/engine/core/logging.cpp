/*
===========================================================
Core: Logging (Implementation)
FILE: cpp/engine/core/logging.cpp
===========================================================
Purpose:
  - Implements the noexcept logging API.
  - Adds timestamp + level tag.

Hardening:
  - Formatting goes through C stdio only.
  - Coarse mutex makes multi-thread output readable. Taking it can throw
    std::system_error; the line is then written without the lock.
===========================================================
*/

#include "engine/core/logging.hpp"

#include <atomic>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <system_error>

namespace blanket {

static std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};
static std::mutex g_log_mu;

static const char* level_tag(LogLevel lvl) noexcept {
  switch (lvl) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    default:              return "INFO";
  }
}

void set_log_level(LogLevel lvl) noexcept {
  g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel get_log_level() noexcept {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

static bool equals_nocase(const std::string& a, const char* b) noexcept {
  std::size_t i = 0;
  for (; i < a.size() && b[i] != '\0'; ++i) {
    const int ca = std::tolower(static_cast<unsigned char>(a[i]));
    const int cb = std::tolower(static_cast<unsigned char>(b[i]));
    if (ca != cb) return false;
  }
  return i == a.size() && b[i] == '\0';
}

bool parse_log_level(const std::string& text, LogLevel* out) noexcept {
  if (!out) return false;
  if (equals_nocase(text, "debug")) { *out = LogLevel::DEBUG; return true; }
  if (equals_nocase(text, "info"))  { *out = LogLevel::INFO;  return true; }
  if (equals_nocase(text, "warn") || equals_nocase(text, "warning")) {
    *out = LogLevel::WARN;
    return true;
  }
  if (equals_nocase(text, "error")) { *out = LogLevel::ERROR; return true; }
  return false;
}

static void utc_timestamp(char* buf, std::size_t n) noexcept {
  const std::time_t tt = std::time(nullptr);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  if (std::strftime(buf, n, "%Y-%m-%dT%H:%M:%SZ", &tm) == 0 && n > 0) buf[0] = '\0';
}

static void write_line(std::FILE* out, const char* ts, LogLevel lvl, const std::string& msg) noexcept {
  std::fprintf(out, "[%s][%s] %s\n", ts, level_tag(lvl), msg.c_str());
  std::fflush(out);
}

void log(LogLevel lvl, const std::string& msg) noexcept {
  const int cur = g_level.load(std::memory_order_relaxed);
  if (static_cast<int>(lvl) < cur) return;

  char ts[32];
  utc_timestamp(ts, sizeof(ts));
  std::FILE* out = (lvl >= LogLevel::WARN) ? stderr : stdout;

  try {
    std::lock_guard<std::mutex> lk(g_log_mu);
    write_line(out, ts, lvl, msg);
  } catch (const std::system_error&) {
    // Lock failed: write unserialized rather than lose the line.
    write_line(out, ts, lvl, msg);
  }
}

} // namespace blanket
