#pragma once
#include "dsp/series.hpp"
#include <string>
#include <vector>

namespace ts {

enum class WindowShape { Flat, Hanning, Hamming, Bartlett, Blackman, Custom };

struct Window {
  WindowShape shape = WindowShape::Flat;
  std::vector<double> weights; // only for WindowShape::Custom

  Window() = default;
  Window(WindowShape s) : shape(s) {}
  static Window custom(std::vector<double> w);
};

// "flat", "hanning", "hamming", "bartlett" or "blackman".
WindowShape parse_window_shape(const std::string &name);
const char *window_shape_name(WindowShape shape);

// Weights of a named window of length m (numpy conventions).
std::vector<double> make_window(WindowShape shape, int m);

// Smooth x by convolving it with the normalized window.
//
// Both ends are padded with window_len-1 reflected samples so the output
// has no transients and keeps the length of x. A flat window is a moving
// average. With a custom window its length replaces window_len.
// window_len < 3 returns x unchanged.
std::vector<double> smooth(const std::vector<double> &x, int window_len = 11,
                           const Window &window = Window());
std::vector<double> smooth(const Series &x, int window_len = 11,
                           const Window &window = Window());

// Odd number of samples spanning about `resolution` units of t.
int smoothing_window_length(double resolution, const std::vector<double> &t);

} // namespace ts
