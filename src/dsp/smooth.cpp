#include "dsp/smooth.hpp"
#include "dsp/convolve.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <numeric>
#include <utility>

namespace ts {

namespace {

constexpr double kPi = 3.14159265358979323846;

struct ShapeName {
  WindowShape shape;
  const char *name;
};

const ShapeName kShapeNames[] = {{WindowShape::Flat, "flat"},
                                 {WindowShape::Hanning, "hanning"},
                                 {WindowShape::Hamming, "hamming"},
                                 {WindowShape::Bartlett, "bartlett"},
                                 {WindowShape::Blackman, "blackman"}};

} // namespace

Window Window::custom(std::vector<double> w) {
  Window out(WindowShape::Custom);
  out.weights = std::move(w);
  return out;
}

WindowShape parse_window_shape(const std::string &name) {
  std::string s = name;
  std::transform(s.begin(), s.end(), s.begin(), ::tolower);
  for (const auto &e : kShapeNames) {
    if (s == e.name)
      return e.shape;
  }
  throw ValidationError("Window '" + name +
                        "' not supported; must be one of flat, hanning, "
                        "hamming, bartlett, blackman");
}

const char *window_shape_name(WindowShape shape) {
  for (const auto &e : kShapeNames) {
    if (e.shape == shape)
      return e.name;
  }
  return "custom";
}

std::vector<double> make_window(WindowShape shape, int m) {
  if (m < 1)
    return {};
  if (shape == WindowShape::Custom)
    throw ValidationError("make_window: custom windows carry their own weights");
  std::vector<double> w(m, 1.0);
  if (shape == WindowShape::Flat || m == 1)
    return w;

  const double denom = static_cast<double>(m - 1);
  for (int n = 0; n < m; ++n) {
    const double a = 2.0 * kPi * n / denom;
    switch (shape) {
    case WindowShape::Hanning:
      w[n] = 0.5 - 0.5 * std::cos(a);
      break;
    case WindowShape::Hamming:
      w[n] = 0.54 - 0.46 * std::cos(a);
      break;
    case WindowShape::Bartlett:
      w[n] = 2.0 / denom * (denom / 2.0 - std::fabs(n - denom / 2.0));
      break;
    case WindowShape::Blackman:
      w[n] = 0.42 - 0.5 * std::cos(a) + 0.08 * std::cos(2.0 * a);
      break;
    default:
      break;
    }
  }
  return w;
}

std::vector<double> smooth(const std::vector<double> &x, int window_len,
                           const Window &window) {
  if (window.shape == WindowShape::Custom)
    window_len = static_cast<int>(window.weights.size());
  if (window_len < 3)
    return x;
  if (window_len % 2 == 0)
    throw ValidationError("smooth: window_len should be an odd integer, got " +
                          std::to_string(window_len));
  const std::size_t wl = static_cast<std::size_t>(window_len);
  if (x.size() < wl)
    throw ValidationError("smooth: input vector of length " +
                          std::to_string(x.size()) +
                          " needs to be bigger than window size " +
                          std::to_string(window_len));

  std::vector<double> w = window.shape == WindowShape::Custom
                              ? window.weights
                              : make_window(window.shape, window_len);
  const double wsum = std::accumulate(w.begin(), w.end(), 0.0);
  if (wsum == 0.0)
    throw ValidationError("smooth: window weights sum to zero");
  for (auto &v : w)
    v /= wsum;

  // x[w-1] ... x[1], x, x[N-1] ... x[N-w+1]
  const std::size_t n = x.size();
  std::vector<double> s;
  s.reserve(n + 2 * (wl - 1));
  for (std::size_t i = wl - 1; i >= 1; --i)
    s.push_back(x[i]);
  s.insert(s.end(), x.begin(), x.end());
  for (std::size_t i = 0; i + 1 < wl; ++i)
    s.push_back(x[n - 1 - i]);

  auto y = convolve(w, s, {ConvolveMode::Valid, ConvolveMethod::Direct});
  const std::size_t half = (wl - 1) / 2;
  return std::vector<double>(y.begin() + half, y.end() - half);
}

std::vector<double> smooth(const Series &x, int window_len,
                           const Window &window) {
  return smooth(x.as_1d("smooth"), window_len, window);
}

int smoothing_window_length(double resolution, const std::vector<double> &t) {
  if (t.size() < 2)
    throw ValidationError("smoothing_window_length: need at least two time points");
  double dt = 0.0;
  for (std::size_t i = 1; i < t.size(); ++i)
    dt += t[i] - t[i - 1];
  dt /= static_cast<double>(t.size() - 1);
  if (!std::isfinite(dt) || dt <= 0.0)
    throw ValidationError("smoothing_window_length: time points must increase");
  const double q = resolution / dt;
  if (!(q < std::numeric_limits<int>::max() &&
        q > std::numeric_limits<int>::min()))
    throw ValidationError("smoothing_window_length: resolution " +
                          std::to_string(resolution) +
                          " spans more samples than a window can hold");
  int n = static_cast<int>(q);
  if (n % 2 == 0)
    n += 1;
  return n;
}

} // namespace ts
