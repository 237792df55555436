/*
  Logging Selftest

  Validates:
    1) level names parse case-insensitively, unknown text leaves the level
    2) the level filter drops lower-severity lines
    3) log() is noexcept, and lines from concurrent writers come out whole

  INFO lines go to stdout, which is redirected to a file for the duration
  of the test; [ OK ]/[FAIL] lines stay on stderr.
  Non-zero return code indicates failure.
*/

#include "engine/core/logging.hpp"
#include "engine/testing/selftest_util.hpp"

#include <cstdio>
#include <filesystem>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace blanket {
namespace {

using namespace selftest;
namespace fs = std::filesystem;

static_assert(noexcept(log(LogLevel::INFO, std::string())), "log() must not throw");

constexpr int kWriters = 4;
constexpr int kLinesPerWriter = 200;

void test_parse_levels() {
  LogLevel lvl = LogLevel::INFO;
  expect_true(parse_log_level("DEBUG", &lvl) && lvl == LogLevel::DEBUG, "DEBUG parsed");
  expect_true(parse_log_level("Warning", &lvl) && lvl == LogLevel::WARN, "'Warning' means WARN");
  expect_true(parse_log_level("error", &lvl) && lvl == LogLevel::ERROR, "error parsed");
  expect_true(!parse_log_level("loud", &lvl) && lvl == LogLevel::ERROR, "unknown text leaves the level");
  expect_true(!parse_log_level("info", nullptr), "null output rejected");

  set_log_level(LogLevel::WARN);
  expect_true(get_log_level() == LogLevel::WARN, "level round trip");
}

void test_filter_and_concurrent_writers(const fs::path& dir) {
  const std::string path = (dir / "stdout.log").string();
  if (std::freopen(path.c_str(), "w", stdout) == nullptr) {
    fail("redirect stdout for the logging test");
    return;
  }

  set_log_level(LogLevel::INFO);
  log(LogLevel::DEBUG, "filtered debug line");

  std::vector<std::thread> writers;
  for (int w = 0; w < kWriters; ++w) {
    writers.emplace_back([w] {
      for (int i = 0; i < kLinesPerWriter; ++i) {
        log(LogLevel::INFO, "writer " + std::to_string(w) + " line " + std::to_string(i));
      }
    });
  }
  for (auto& t : writers) t.join();
  std::fflush(stdout);

  std::istringstream in(read_text_file(path));
  std::string line;
  int lines = 0;
  int whole = 0;
  bool saw_debug = false;
  while (std::getline(in, line)) {
    ++lines;
    if (line.find("[DEBUG]") != std::string::npos) saw_debug = true;
    const auto tag = line.find("][INFO] writer ");
    if (line.size() > 2 && line[0] == '[' && tag != std::string::npos &&
        line.find('[', tag + 2) == std::string::npos) {
      ++whole;
    }
  }
  expect_true(!saw_debug, "DEBUG line dropped at INFO level");
  expect_true(lines == kWriters * kLinesPerWriter, "one output line per log call");
  expect_true(whole == lines, "concurrent lines are not interleaved");
}

} // namespace
} // namespace blanket

int main() {
  using namespace blanket;

  const auto dir = selftest::fresh_temp_dir("logging");
  test_parse_levels();
  test_filter_and_concurrent_writers(dir);

  return selftest::finish();
}
