#include "series_io.hpp"
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace ts {

Columns read_columns(const std::string &path) {
  std::ifstream in(path);
  if (!in.is_open())
    throw std::runtime_error("cannot open data file '" + path + "'");

  Columns cols;
  std::string line;
  size_t lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    auto start = line.find_first_not_of(" \t\r");
    if (start == std::string::npos)
      continue;
    if (line[start] == '#' || line[start] == '@')
      continue;

    std::istringstream row(line);
    std::vector<double> values;
    double v;
    while (row >> v)
      values.push_back(v);
    if (!row.eof())
      throw std::runtime_error(path + ":" + std::to_string(lineno) +
                               ": not a number");
    if (cols.empty())
      cols.resize(values.size());
    if (values.size() != cols.size())
      throw std::runtime_error(path + ":" + std::to_string(lineno) +
                               ": expected " + std::to_string(cols.size()) +
                               " columns, got " +
                               std::to_string(values.size()));
    for (size_t c = 0; c < values.size(); ++c)
      cols[c].push_back(values[c]);
  }
  return cols;
}

bool write_columns(const std::string &path, const Columns &cols,
                   const std::vector<std::string> &header) {
  for (const auto &c : cols) {
    if (c.size() != cols.front().size())
      return false;
  }
  std::ofstream out(path);
  if (!out.is_open())
    return false;
  for (const auto &h : header)
    out << "# " << h << "\n";
  const size_t rows = cols.empty() ? 0 : cols.front().size();
  out << std::setprecision(std::numeric_limits<double>::max_digits10);
  for (size_t r = 0; r < rows; ++r) {
    for (size_t c = 0; c < cols.size(); ++c) {
      if (c)
        out << ' ';
      out << std::setw(24) << cols[c][r];
    }
    out << "\n";
  }
  return static_cast<bool>(out);
}

} // namespace ts
