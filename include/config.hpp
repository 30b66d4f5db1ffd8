#pragma once
#include <cstddef>
#include <string>

namespace ts {

struct Config {
  std::string log_level = "info";

  // data file layout: column 0 is the abscissa
  int column = 1;

  // correlation time
  std::size_t nstep = 100;
  bool debug = false;

  // optional ACF dump
  std::string acf_output;
  bool acf_normalize = false;
  std::string acf_mode = "full";

  // optional smoothing; resolution in abscissa units, 0 disables
  double smooth_resolution = 0.0;
  std::string smooth_window = "flat";
  std::string smooth_output;

  // Missing file yields the defaults.
  static Config load(const std::string &path);
};

} // namespace ts
