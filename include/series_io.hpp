#pragma once
#include <string>
#include <vector>

namespace ts {

using Columns = std::vector<std::vector<double>>;

// Whitespace separated numeric columns. Lines starting with '#' or '@'
// (xmgrace/GROMACS xvg headers) and blank lines are skipped. Throws
// std::runtime_error if the file cannot be read or rows are ragged.
Columns read_columns(const std::string &path);

// Writes columns side by side, optional header lines prefixed with '#'.
bool write_columns(const std::string &path, const Columns &cols,
                   const std::vector<std::string> &header = {});

} // namespace ts
