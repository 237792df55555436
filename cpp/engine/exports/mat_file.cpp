#include "engine/exports/mat_file.hpp"

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"

#include <H5Cpp.h>

#include <cctype>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <sstream>
#include <utility>

namespace blanket {

namespace {

constexpr std::size_t kMatHeaderTextBytes = 116;

void tag_matlab_class(H5::DataSet& ds, const char* cls) {
  H5::StrType str_type(H5::PredType::C_S1, std::strlen(cls));
  H5::Attribute attr = ds.createAttribute("MATLAB_class", str_type, H5::DataSpace(H5S_SCALAR));
  attr.write(str_type, std::string(cls));
}

// MATLAB stores empty arrays as their dimension vector plus MATLAB_empty = 1.
void write_empty_double(H5::H5File& file, const std::string& name, const H5::DSetCreatPropList& dcpl) {
  const std::uint64_t dims_value[2] = {1, 0};
  const hsize_t dims[1] = {2};
  H5::DataSpace space(1, dims);
  H5::DataSet ds = file.createDataSet(name, H5::PredType::STD_U64LE, space, dcpl);
  ds.write(dims_value, H5::PredType::NATIVE_UINT64);
  tag_matlab_class(ds, "double");

  const std::uint8_t one = 1;
  H5::Attribute empty = ds.createAttribute("MATLAB_empty", H5::PredType::STD_U8LE, H5::DataSpace(H5S_SCALAR));
  empty.write(H5::PredType::NATIVE_UINT8, &one);
}

void stamp_header(const std::string& path) {
  std::fstream f(path, std::ios::in | std::ios::out | std::ios::binary);
  if (!f.is_open()) {
    throw IOError("Failed to reopen MAT-file for header: " + path);
  }
  const std::string header = mat73_header();
  f.seekp(0);
  f.write(header.data(), static_cast<std::streamsize>(header.size()));
  f.close();
  if (!f) {
    throw IOError("Failed to write MAT-file header: " + path);
  }
}

} // namespace

std::string mat73_header() {
  std::string h = "MATLAB 7.3 MAT-file, Platform: GLNXA64, Created by: blanket_cli HDF5 schema 1.00 .";
  h.resize(kMatHeaderTextBytes, ' ');
  h.append(8, '\0');      // subsystem data offset: none
  h.push_back('\x00');    // version 0x0200, little endian
  h.push_back('\x02');
  h.push_back('I');
  h.push_back('M');
  return h;
}

void MatFileWriter::check_name(const std::string& name) const {
  bool ok = !name.empty() && name.size() <= 63 &&
            std::isalpha(static_cast<unsigned char>(name[0]));
  for (char c : name) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') ok = false;
  }
  if (!ok) {
    throw ValidationError("MatFileWriter: invalid MATLAB variable name '" + name + "'");
  }
  for (const auto& v : vars_) {
    if (v.name == name) {
      throw ValidationError("MatFileWriter: variable '" + name + "' added twice");
    }
  }
}

void MatFileWriter::add_column(const std::string& name, std::vector<double> values) {
  check_name(name);
  vars_.push_back(Variable{name, std::move(values), false});
}

void MatFileWriter::add_scalar(const std::string& name, double value) {
  check_name(name);
  vars_.push_back(Variable{name, std::vector<double>{value}, true});
}

void MatFileWriter::write(const std::string& path) const {
  H5::Exception::dontPrint();
  try {
    H5::FileCreatPropList fcpl;
    fcpl.setUserblock(kMatUserblockBytes);
    H5::H5File file(path, H5F_ACC_TRUNC, fcpl);

    // No modification times in the objects: equal data, equal bytes.
    H5::DSetCreatPropList dcpl;
    if (H5Pset_obj_track_times(dcpl.getId(), 0) < 0) {
      throw IOError("HDF5: cannot disable object time tracking");
    }

    for (const auto& v : vars_) {
      if (v.values.empty()) {
        write_empty_double(file, v.name, dcpl);
        continue;
      }
      const hsize_t dims[2] = {1, static_cast<hsize_t>(v.scalar ? 1 : v.values.size())};
      H5::DataSpace space(2, dims);
      H5::DataSet ds = file.createDataSet(v.name, H5::PredType::IEEE_F64LE, space, dcpl);
      ds.write(v.values.data(), H5::PredType::NATIVE_DOUBLE);
      tag_matlab_class(ds, "double");
    }
    file.close();
  } catch (const H5::Exception& e) {
    throw IOError("HDF5 error writing " + path + ": " + e.getFuncName() + ": " + e.getDetailMsg());
  }

  stamp_header(path);
}

void write_alignment_mat_file(const AlignmentResult& result, const std::string& path) {
  std::vector<double> date_time, top, bot, diff, window;
  std::vector<double> deptimev, rectimev, latitude, longitude;

  date_time.reserve(result.record_count());
  top.reserve(result.record_count());
  bot.reserve(result.record_count());
  diff.reserve(result.record_count());
  window.reserve(result.record_count());

  for (std::size_t k = 0; k < result.groups.size(); ++k) {
    const auto& g = result.groups[k];
    deptimev.push_back(to_datenum(g.window.deployed_at));
    rectimev.push_back(to_datenum(g.window.recovered_at));
    latitude.push_back(g.window.latitude_deg);
    longitude.push_back(g.window.longitude_deg);

    for (const auto& r : g.records) {
      date_time.push_back(to_datenum(r.time));
      top.push_back(r.top.corrected_c);
      bot.push_back(r.bottom.corrected_c);
      diff.push_back(r.differential_c);
      window.push_back(static_cast<double>(k + 1));
    }
  }

  MatFileWriter mat;
  mat.add_column("DateTime", std::move(date_time));
  mat.add_column("Top", std::move(top));
  mat.add_column("Bot", std::move(bot));
  mat.add_column("Diff", std::move(diff));
  mat.add_column("Window", std::move(window));
  mat.add_column("deptimev", std::move(deptimev));
  mat.add_column("rectimev", std::move(rectimev));
  mat.add_column("Latitude", std::move(latitude));
  mat.add_column("Longitude", std::move(longitude));
  mat.add_scalar("TopOffset", result.top_offset_c);
  mat.add_scalar("BotOffset", result.bottom_offset_c);
  mat.write(path);

  std::ostringstream oss;
  oss << "Wrote MAT-file " << path << " (" << result.record_count() << " records, "
      << result.groups.size() << " windows)";
  log(LogLevel::INFO, oss.str());
}

} // namespace blanket
