#pragma once
/*
================================================================================
Testing: Selftest Helpers
FILE: cpp/engine/testing/selftest_util.hpp

Framework-free helpers shared by the *_selftest executables:
  - [ OK ] / [FAIL] lines on stderr, global failure counter
  - fixture files in a fresh per-test temporary directory
  - finish() turns the failure count into the process exit code
================================================================================
*/

#include <cmath>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace blanket::selftest {

inline int g_fail_count = 0;

inline void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

inline void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

inline void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

inline void expect_near(double got, double exp, double tol, std::string_view msg) {
  if (!(std::fabs(got - exp) <= tol)) {
    fail(msg);
    std::cerr << "  got " << got << ", expected " << exp << " (tol " << tol << ")\n";
  } else {
    pass(msg);
  }
}

inline void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

// Runs fn and checks it throws E. Returns true when it did.
template <typename E, typename Fn>
bool expect_throws(Fn&& fn, std::string_view msg) {
  try {
    fn();
  } catch (const E& e) {
    pass(msg);
    std::cerr << "  (" << e.what() << ")\n";
    return true;
  } catch (const std::exception& e) {
    fail(msg);
    std::cerr << "  wrong exception: " << e.what() << "\n";
    return false;
  }
  fail(msg);
  std::cerr << "  nothing thrown\n";
  return false;
}

// Empty directory under the system temp dir, recreated on every call.
inline std::filesystem::path fresh_temp_dir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / ("blanket_selftest_" + name);
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

inline std::string write_text_file(const std::filesystem::path& path, const std::string& content) {
  std::ofstream ofs(path, std::ios::out | std::ios::trunc | std::ios::binary);
  ofs << content;
  ofs.close();
  if (!ofs) {
    fail("cannot write fixture " + path.string());
  }
  return path.string();
}

inline std::string read_text_file(const std::filesystem::path& path) {
  std::ifstream ifs(path, std::ios::in | std::ios::binary);
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

inline int finish() {
  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}

} // namespace blanket::selftest
