#include "dsp/series.hpp"
#include <numeric>
#include <sstream>
#include <utility>

namespace ts {

Series::Series(std::vector<double> values)
    : values_(std::move(values)), shape_{values_.size()} {}

Series::Series(std::vector<double> values, std::vector<std::size_t> shape)
    : values_(std::move(values)), shape_(std::move(shape)) {
  std::size_t n = std::accumulate(shape_.begin(), shape_.end(),
                                  static_cast<std::size_t>(1),
                                  std::multiplies<std::size_t>());
  if (n != values_.size())
    throw ValidationError("Series: shape " + shape_to_string(shape_) +
                          " does not hold " + std::to_string(values_.size()) +
                          " values");
}

std::vector<std::size_t> Series::squeezed_shape() const {
  std::vector<std::size_t> out;
  for (auto d : shape_) {
    if (d != 1)
      out.push_back(d);
  }
  // a single sample squeezes to a scalar; keep it as a length-1 series
  if (out.empty() && !shape_.empty())
    out.push_back(1);
  return out;
}

Series Series::squeezed() const {
  if (shape_.empty())
    return *this;
  return Series(values_, squeezed_shape());
}

const std::vector<double> &Series::as_1d(const char *who) const {
  auto s = squeezed_shape();
  if (s.size() != 1)
    throw ShapeError(std::string(who) + ": series must be a 1D array, got shape " +
                     shape_to_string(shape_));
  return values_;
}

std::string shape_to_string(const std::vector<std::size_t> &shape) {
  std::ostringstream os;
  os << "(";
  for (size_t i = 0; i < shape.size(); ++i) {
    if (i)
      os << ", ";
    os << shape[i];
  }
  if (shape.size() == 1)
    os << ",";
  os << ")";
  return os.str();
}

} // namespace ts
