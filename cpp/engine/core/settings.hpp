#pragma once
/*
================================================================================
Core: Pipeline Settings
FILE: cpp/engine/core/settings.hpp

Purpose:
  - Centralize every processing knob (logger ID normalization, pairing
    tolerance, output precision) into a single validated object.
  - Identical settings + identical inputs => byte-identical CSV output.

Hardening:
  - validate_or_throw() catches nonsensical values early.
  - Conservative defaults reproduce the historical processing (strict
    timestamp equality, 7-character logger IDs).

Malformed rows:
  - Always abort the file that contains them. This is not a knob.
================================================================================
*/

#include <cstddef>
#include <cstdint>

#include "engine/core/errors.hpp"

namespace blanket {

// ----------------------------- Parsing ---------------------------------------
struct ParseSettings {
  // Logger IDs longer than this keep only their first N characters (some
  // ANTARES units append a suffix letter to the 7-digit ID). 0 disables.
  std::size_t logger_id_width = 7;

  void validate_or_throw() const {
    if (logger_id_width > 64) {
      throw ValidationError("ParseSettings: logger_id_width must be <= 64");
    }
  }
};

// ----------------------------- Pairing ---------------------------------------
struct PairingSettings {
  // Max |t_top - t_bottom| for two samples to be paired. 0 = exact match.
  std::int64_t tolerance_s = 0;

  void validate_or_throw() const {
    if (tolerance_s < 0 || tolerance_s > 86400) {
      throw ValidationError("PairingSettings: tolerance_s must be in [0, 86400]");
    }
  }
};

// ----------------------------- Export ----------------------------------------
struct ExportSettings {
  // Decimal places for temperatures and coordinates in the CSV.
  int temperature_precision = 6;

  // Decimal places for the datenum column (8 places < 1 ms).
  int datenum_precision = 8;

  void validate_or_throw() const {
    if (temperature_precision < 1 || temperature_precision > 12) {
      throw ValidationError("ExportSettings: temperature_precision must be in [1, 12]");
    }
    if (datenum_precision < 5 || datenum_precision > 12) {
      throw ValidationError("ExportSettings: datenum_precision must be in [5, 12]");
    }
  }
};

// ----------------------------- Master ----------------------------------------
struct PipelineSettings {
  ParseSettings parse{};
  PairingSettings pairing{};
  ExportSettings exports{};

  static PipelineSettings defaults() { return PipelineSettings{}; }

  void validate_or_throw() const {
    parse.validate_or_throw();
    pairing.validate_or_throw();
    exports.validate_or_throw();
  }
};

} // namespace blanket
