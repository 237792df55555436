#pragma once
/*
===========================================================
Core: Logging
FILE: cpp/engine/core/logging.hpp
===========================================================
Purpose:
  - Minimal, dependency-free logging used by ALL engine modules.
  - Centralizes stdout/stderr policy.

Hardening:
  - Logging MUST NOT throw (noexcept API).
  - Thread-safe (coarse mutex in implementation).
  - Caller controls severity; implementation routes WARN/ERROR to stderr.
===========================================================
*/

#include <string>

namespace blanket {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Set global logging verbosity (default INFO).
void set_log_level(LogLevel lvl) noexcept;

// Get global logging verbosity.
LogLevel get_log_level() noexcept;

// Parse "debug" / "info" / "warn" / "error" (case-insensitive).
// Returns false and leaves *out untouched on unknown text.
bool parse_log_level(const std::string& text, LogLevel* out) noexcept;

// Core logging call. Never throws.
void log(LogLevel lvl, const std::string& msg) noexcept;

} // namespace blanket
