#include "dsp/autocorrelation.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>

namespace ts {

namespace {

double mean_of(const std::vector<double> &v) {
  return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

double variance_of(const std::vector<double> &v) {
  const double m = mean_of(v);
  double sum = 0.0;
  for (double x : v)
    sum += (x - m) * (x - m);
  return sum / static_cast<double>(v.size());
}

double mean_square_of(const std::vector<double> &v) {
  double sum = 0.0;
  for (double x : v)
    sum += x * x;
  return sum / static_cast<double>(v.size());
}

} // namespace

std::vector<double> autocorrelation_fft(const Series &series,
                                        const AutocorrelationOptions &opts) {
  std::vector<double> s = series.as_1d("autocorrelation_fft");
  if (s.empty())
    throw ValidationError("autocorrelation_fft: series is empty");

  const std::size_t n = s.size();
  if (opts.remove_mean) {
    const double m = mean_of(s);
    for (auto &v : s)
      v -= m;
  }

  std::vector<double> reversed(s.rbegin(), s.rend());
  auto full = convolve(s, reversed, opts.convolve);

  // lag 0 sits in the middle for every mode
  const std::size_t origin = full.size() / 2;
  std::vector<double> ac(full.begin() + origin, full.end());
  if (ac.size() > n)
    throw std::logic_error("autocorrelation_fft: len(ac)=" +
                           std::to_string(ac.size()) +
                           " exceeds len(series)=" + std::to_string(n));

  if (opts.padding_correction && opts.convolve.mode != ConvolveMode::Valid) {
    for (std::size_t i = 0; i < ac.size(); ++i)
      ac[i] *= static_cast<double>(n) / static_cast<double>(n - i);
  }

  double norm = ac.empty() || ac[0] == 0.0 ? 1.0 : ac[0];
  if (!opts.normalize) {
    // rescale so that acf[0] == Var(s) (or <s^2>) independent of padding
    const double moment = opts.remove_mean ? variance_of(s) : mean_square_of(s);
    norm = moment == 0.0 ? 1.0 : norm / moment;
  }

  for (auto &v : ac)
    v /= norm;
  return ac;
}

std::vector<double> autocorrelation_fft(const std::vector<double> &series,
                                        const AutocorrelationOptions &opts) {
  return autocorrelation_fft(Series(series), opts);
}

} // namespace ts
