#include "dsp/integrate.hpp"
#include "dsp/series.hpp"

#include <string>

namespace ts {

namespace {

// Simpson panels [start, start+2], [start+2, start+4], ... up to stop.
double basic_simpson(const std::vector<double> &y, const std::vector<double> &x,
                     std::size_t start, std::size_t stop) {
  double result = 0.0;
  for (std::size_t i = start; i + 2 <= stop; i += 2) {
    const double h0 = x[i + 1] - x[i];
    const double h1 = x[i + 2] - x[i + 1];
    const double hsum = h0 + h1;
    const double hprod = h0 * h1;
    const double h0divh1 = h0 / h1;
    result += hsum / 6.0 *
              (y[i] * (2.0 - 1.0 / h0divh1) + y[i + 1] * hsum * hsum / hprod +
               y[i + 2] * (2.0 - h0divh1));
  }
  return result;
}

double trapezoid(const std::vector<double> &y, const std::vector<double> &x,
                 std::size_t i) {
  return 0.5 * (x[i + 1] - x[i]) * (y[i + 1] + y[i]);
}

} // namespace

double simpson(const std::vector<double> &y, const std::vector<double> &x,
               EvenRule rule) {
  if (y.size() != x.size())
    throw ShapeError("simpson: len(y)=" + std::to_string(y.size()) +
                     " but len(x)=" + std::to_string(x.size()));
  const std::size_t n = y.size();
  if (n < 2)
    return 0.0;
  if (n % 2 == 1)
    return basic_simpson(y, x, 0, n - 1);

  double first = basic_simpson(y, x, 0, n - 2) + trapezoid(y, x, n - 2);
  double last = trapezoid(y, x, 0) + basic_simpson(y, x, 1, n - 1);
  switch (rule) {
  case EvenRule::First:
    return first;
  case EvenRule::Last:
    return last;
  case EvenRule::Avg:
    break;
  }
  return 0.5 * (first + last);
}

} // namespace ts
