#include "catch.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "series_io.hpp"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace {

std::string write_temp(const std::string &name, const std::string &text) {
  std::string path = "tsstat_test_" + name;
  std::ofstream out(path);
  out << text;
  return path;
}

} // namespace

TEST_CASE("Missing config file yields the defaults") {
  auto cfg = ts::Config::load("does/not/exist.conf");
  REQUIRE(cfg.log_level == "info");
  REQUIRE(cfg.column == 1);
  REQUIRE(cfg.nstep == 100);
  REQUIRE_FALSE(cfg.debug);
  REQUIRE(cfg.acf_output.empty());
  REQUIRE(cfg.acf_mode == "full");
  REQUIRE(cfg.smooth_resolution == 0.0);
  REQUIRE(cfg.smooth_window == "flat");
}

TEST_CASE("Config keys are parsed with comments stripped") {
  auto path = write_temp("full.conf", "# analysis settings\n"
                                      "log_level = debug\n"
                                      "column=2\n"
                                      "nstep = 10   # every 10th frame\n"
                                      "debug = yes\n"
                                      "acf_output = acf.dat\n"
                                      "acf_normalize = true\n"
                                      "acf_mode = same\n"
                                      "smooth_resolution = 2.5\n"
                                      "smooth_window = hanning\n"
                                      "smooth_output = smooth.dat\n"
                                      "unknown_key = 42\n"
                                      "not a setting\n");
  auto cfg = ts::Config::load(path);
  std::remove(path.c_str());

  REQUIRE(cfg.log_level == "debug");
  REQUIRE(cfg.column == 2);
  REQUIRE(cfg.nstep == 10);
  REQUIRE(cfg.debug);
  REQUIRE(cfg.acf_output == "acf.dat");
  REQUIRE(cfg.acf_normalize);
  REQUIRE(cfg.acf_mode == "same");
  REQUIRE(cfg.smooth_resolution == Approx(2.5));
  REQUIRE(cfg.smooth_window == "hanning");
  REQUIRE(cfg.smooth_output == "smooth.dat");
}

TEST_CASE("Malformed config values are reported") {
  auto path = write_temp("bad.conf", "nstep = 0\n");
  REQUIRE_THROWS_AS(ts::Config::load(path), std::invalid_argument);
  std::remove(path.c_str());

  path = write_temp("bad_bool.conf", "debug = maybe\n");
  REQUIRE_THROWS_AS(ts::Config::load(path), std::invalid_argument);
  std::remove(path.c_str());
}

TEST_CASE("Data columns are read skipping xvg headers") {
  auto path = write_temp("series.xvg", "# GROMACS energy\n"
                                       "@    title \"Potential\"\n"
                                       "@ s0 legend \"E\"\n"
                                       "\n"
                                       "0.0  1.5  -2\n"
                                       "0.5  2.5  -3\n"
                                       "1.0  3.5  -4\n");
  auto cols = ts::read_columns(path);
  std::remove(path.c_str());

  REQUIRE(cols.size() == 3);
  REQUIRE(cols[0] == std::vector<double>{0.0, 0.5, 1.0});
  REQUIRE(cols[1] == std::vector<double>{1.5, 2.5, 3.5});
  REQUIRE(cols[2] == std::vector<double>{-2.0, -3.0, -4.0});
}

TEST_CASE("Ragged or unreadable data files raise") {
  auto path = write_temp("ragged.dat", "0 1\n1 2 3\n");
  REQUIRE_THROWS_AS(ts::read_columns(path), std::runtime_error);
  std::remove(path.c_str());

  path = write_temp("text.dat", "0 abc\n");
  REQUIRE_THROWS_AS(ts::read_columns(path), std::runtime_error);
  std::remove(path.c_str());

  REQUIRE_THROWS_AS(ts::read_columns("does/not/exist.xvg"), std::runtime_error);
}

TEST_CASE("Written columns read back") {
  std::string path = "tsstat_test_written.dat";
  ts::Columns cols = {{0.0, 0.1, 0.2}, {1.0 / 3.0, 2.0, -7.25}};
  REQUIRE(ts::write_columns(path, cols, {"lag acf"}));
  auto back = ts::read_columns(path);
  std::remove(path.c_str());
  REQUIRE(back == cols);

  REQUIRE_FALSE(ts::write_columns(path, {{1.0, 2.0}, {1.0}}));
}

TEST_CASE("Log levels parse case-insensitively") {
  REQUIRE(ts::log::level_from_string("DEBUG") == ts::log::Level::Debug);
  REQUIRE(ts::log::level_from_string("warning") == ts::log::Level::Warn);
  REQUIRE(ts::log::level_from_string("error") == ts::log::Level::Error);
  REQUIRE(ts::log::level_from_string("chatty") == ts::log::Level::Info);
  REQUIRE(std::string(ts::log::level_to_string(ts::log::Level::Warn)) == "WARN");
}

TEST_CASE("Diagnostic sink forwards to the logger") {
  std::ostringstream captured;
  auto *saved = std::cerr.rdbuf(captured.rdbuf());
  ts::log::init(ts::log::Level::Info);
  auto sink = ts::log::diagnostic_sink();
  sink(ts::Diagnostic{ts::Diagnostic::Kind::LowAccuracy, "only 3 points", 3, 1});

  ts::log::init(ts::log::Level::Error);
  sink(ts::Diagnostic{ts::Diagnostic::Kind::LowAccuracy, "suppressed", 3, 1});
  std::cerr.rdbuf(saved);
  ts::log::init(ts::log::Level::Info);

  const std::string out = captured.str();
  REQUIRE(out.find("[WARN] low accuracy: only 3 points") != std::string::npos);
  REQUIRE(out.find("suppressed") == std::string::npos);
}
