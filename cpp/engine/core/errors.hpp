#pragma once
/*
================================================================================
Core: Error Types
FILE: cpp/engine/core/errors.hpp

Purpose:
  - Uniform exception types so data-quality and runtime failures are:
      * searchable
      * catchable by category
      * reportable with enough context (file, row, field) to fix the input

Taxonomy:
  BlanketError
    ValidationError        settings / argument problems
    IOError                open / write failures
    NoDataError            nothing left to export
    InputError             carries RecordContext
      MalformedRecordError
      UnknownLoggerIdError
      DuplicateLoggerIdError
      InvalidWindowError
      OverlappingWindowError
================================================================================
*/

#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace blanket {

// Base error for the engine.
class BlanketError : public std::runtime_error {
 public:
  explicit BlanketError(std::string msg) : std::runtime_error(std::move(msg)) {}
};

// Thrown when user/config input fails validation.
class ValidationError : public BlanketError {
 public:
  explicit ValidationError(std::string msg) : BlanketError(std::move(msg)) {}
};

// Thrown for I/O or filesystem related issues.
class IOError : public BlanketError {
 public:
  explicit IOError(std::string msg) : BlanketError(std::move(msg)) {}
};

// Thrown when no corrected record falls inside any deployment window.
class NoDataError : public BlanketError {
 public:
  explicit NoDataError(std::string msg) : BlanketError(std::move(msg)) {}
};

// Where in an input file a problem was found. row is 1-based, 0 = whole file.
struct RecordContext {
  std::string path;
  std::size_t row = 0;
  std::string field;
};

// Base for every data-quality error raised while reading inputs.
class InputError : public BlanketError {
 public:
  InputError(const std::string& msg, RecordContext where)
      : BlanketError(build_what(msg, where)), message_(msg), where_(std::move(where)) {}

  const std::string& message() const noexcept { return message_; }
  const RecordContext& where() const noexcept { return where_; }

 private:
  static std::string build_what(const std::string& msg, const RecordContext& where) {
    std::ostringstream oss;
    oss << msg;
    if (!where.path.empty() || where.row != 0 || !where.field.empty()) {
      oss << " [";
      const char* sep = "";
      if (!where.path.empty()) { oss << "file=" << where.path; sep = ", "; }
      if (where.row != 0)      { oss << sep << "row=" << where.row; sep = ", "; }
      if (!where.field.empty()) oss << sep << "field=" << where.field;
      oss << "]";
    }
    return oss.str();
  }

  std::string message_;
  RecordContext where_;
};

// A row cannot be decomposed into its typed fields.
class MalformedRecordError : public InputError {
 public:
  MalformedRecordError(const std::string& msg, RecordContext where)
      : InputError(msg, std::move(where)) {}
};

// A logger ID has no entry in the offset table.
class UnknownLoggerIdError : public InputError {
 public:
  UnknownLoggerIdError(std::string logger_id, RecordContext where)
      : InputError("no offset for logger '" + logger_id + "'", std::move(where)),
        logger_id_(std::move(logger_id)) {}

  const std::string& logger_id() const noexcept { return logger_id_; }

 private:
  std::string logger_id_;
};

// The offset table lists one logger ID with two different offsets.
class DuplicateLoggerIdError : public InputError {
 public:
  DuplicateLoggerIdError(const std::string& msg, RecordContext where)
      : InputError(msg, std::move(where)) {}
};

// A deployment row whose recovery is not after its deployment.
class InvalidWindowError : public InputError {
 public:
  InvalidWindowError(const std::string& msg, RecordContext where)
      : InputError(msg, std::move(where)) {}
};

// Two deployment windows share at least one instant.
class OverlappingWindowError : public InputError {
 public:
  OverlappingWindowError(const std::string& msg, RecordContext where)
      : InputError(msg, std::move(where)) {}
};

} // namespace blanket
