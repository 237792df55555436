#pragma once
/*
================================================================================
Engine: MATLAB v7.3 MAT-file Writer
FILE: cpp/engine/exports/mat_file.hpp

Purpose:
  - Numeric export of the corrected dataset for MATLAB / Octave / h5py.
  - A v7.3 MAT-file is an HDF5 file with a 512-byte user block whose first
    128 bytes hold the MATLAB header; each variable is a dataset tagged with a
    "MATLAB_class" attribute. HDF5 stores dimensions in reverse (C) order, so
    a MATLAB N x 1 column is an HDF5 dataset of shape {1, N}.

Variables written for an alignment result (N records, W windows):
  DateTime, Top, Bot, Diff, Window      N x 1 (Window = 1-based group index)
  deptimev, rectimev, Latitude, Longitude   W x 1
  TopOffset, BotOffset                  1 x 1
  Times are MATLAB datenums.
================================================================================
*/

#include "engine/align/alignment.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace blanket {

inline constexpr std::size_t kMatUserblockBytes = 512;
inline constexpr std::size_t kMatHeaderBytes = 128;

// The 128-byte MATLAB 7.3 header (text, subsystem offset, version, endian).
std::string mat73_header();

class MatFileWriter {
 public:
  // Throws ValidationError on an invalid or repeated MATLAB variable name.
  void add_column(const std::string& name, std::vector<double> values);
  void add_scalar(const std::string& name, double value);

  std::size_t variable_count() const noexcept { return vars_.size(); }

  // Overwrites path. Throws IOError.
  void write(const std::string& path) const;

 private:
  struct Variable {
    std::string name;
    std::vector<double> values;
    bool scalar = false;
  };

  void check_name(const std::string& name) const;

  std::vector<Variable> vars_;
};

// Builds the variable set above and writes it. Throws IOError.
void write_alignment_mat_file(const AlignmentResult& result, const std::string& path);

} // namespace blanket
