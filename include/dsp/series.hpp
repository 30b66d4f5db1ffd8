#pragma once
#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace ts {

// Rank or length mismatch between arrays.
class ShapeError : public std::invalid_argument {
public:
  explicit ShapeError(const std::string &what) : std::invalid_argument(what) {}
};

// Argument outside the accepted range (window, stride, empty input...).
class ValidationError : public std::invalid_argument {
public:
  explicit ValidationError(const std::string &what)
      : std::invalid_argument(what) {}
};

// Real-valued samples stored flat with a numpy-like shape.
class Series {
public:
  Series() = default;
  Series(std::vector<double> values); // shape {N}
  Series(std::vector<double> values, std::vector<std::size_t> shape);

  template <typename T, typename = typename std::enable_if<
                            std::is_arithmetic<T>::value>::type>
  static Series from(const std::vector<T> &values) {
    return Series(std::vector<double>(values.begin(), values.end()));
  }

  std::size_t size() const { return values_.size(); }
  std::size_t rank() const { return shape_.size(); }
  bool empty() const { return values_.empty(); }
  const std::vector<std::size_t> &shape() const { return shape_; }
  const std::vector<double> &values() const { return values_; }

  // Drops axes of length one.
  Series squeezed() const;

  // Squeezed values; throws ShapeError unless the squeezed rank is 1.
  const std::vector<double> &as_1d(const char *who) const;

private:
  std::vector<double> values_;
  std::vector<std::size_t> shape_;
  std::vector<std::size_t> squeezed_shape() const;
};

std::string shape_to_string(const std::vector<std::size_t> &shape);

struct Diagnostic {
  enum class Kind { LowAccuracy };
  Kind kind;
  std::string message;
  std::size_t samples; // effective sample count
  std::size_t nstep;   // stride that produced it
};

using DiagnosticSink = std::function<void(const Diagnostic &)>;

} // namespace ts
