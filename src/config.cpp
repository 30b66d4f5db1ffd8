#include "config.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace ts {
namespace {
std::string trim(const std::string &s) {
  auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos)
    return "";
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

bool parse_bool(const std::string &key, const std::string &value) {
  std::string s = value;
  std::transform(s.begin(), s.end(), s.begin(), ::tolower);
  if (s == "1" || s == "true" || s == "yes" || s == "on")
    return true;
  if (s == "0" || s == "false" || s == "no" || s == "off")
    return false;
  throw std::invalid_argument("config: " + key + " expects a boolean, got '" +
                              value + "'");
}

std::size_t parse_count(const std::string &key, const std::string &value) {
  long long v = std::stoll(value);
  if (v < 1)
    throw std::invalid_argument("config: " + key + " must be >= 1, got " +
                                value);
  return static_cast<std::size_t>(v);
}
} // namespace

Config Config::load(const std::string &path) {
  Config cfg;
  std::ifstream in(path);
  if (!in.is_open())
    return cfg;
  std::string line;
  while (std::getline(in, line)) {
    auto hash = line.find('#');
    if (hash != std::string::npos)
      line = line.substr(0, hash);
    line = trim(line);
    if (line.empty())
      continue;
    auto eq = line.find('=');
    if (eq == std::string::npos)
      continue;
    std::string key = trim(line.substr(0, eq));
    std::string value = trim(line.substr(eq + 1));
    if (key == "log_level") {
      cfg.log_level = value;
    } else if (key == "column") {
      cfg.column = std::stoi(value);
    } else if (key == "nstep") {
      cfg.nstep = parse_count(key, value);
    } else if (key == "debug") {
      cfg.debug = parse_bool(key, value);
    } else if (key == "acf_output") {
      cfg.acf_output = value;
    } else if (key == "acf_normalize") {
      cfg.acf_normalize = parse_bool(key, value);
    } else if (key == "acf_mode") {
      cfg.acf_mode = value;
    } else if (key == "smooth_resolution") {
      cfg.smooth_resolution = std::stod(value);
    } else if (key == "smooth_window") {
      cfg.smooth_window = value;
    } else if (key == "smooth_output") {
      cfg.smooth_output = value;
    }
  }
  return cfg;
}

} // namespace ts
