#pragma once
#include "dsp/convolve.hpp"
#include "dsp/series.hpp"
#include <vector>

namespace ts {

struct AutocorrelationOptions {
  bool remove_mean = true;        // correlate fluctuations around the mean
  bool padding_correction = true; // scale lag i by N/(N-i); ignored for Valid
  bool normalize = false;         // divide by acf[0]
  ConvolveOptions convolve;
};

// Autocorrelation of a 1D series over lags [0, N).
//
// With the defaults acf[0] equals the variance of the series; without
// mean removal it equals <series^2>. Only the causal half of the symmetric
// correlation is returned, so the result never holds more than N values.
// The input is always copied before it is de-meaned.
std::vector<double>
autocorrelation_fft(const Series &series,
                    const AutocorrelationOptions &opts = {});

std::vector<double>
autocorrelation_fft(const std::vector<double> &series,
                    const AutocorrelationOptions &opts = {});

template <typename T, typename = typename std::enable_if<
                          std::is_arithmetic<T>::value &&
                          !std::is_same<T, double>::value>::type>
std::vector<double>
autocorrelation_fft(const std::vector<T> &series,
                    const AutocorrelationOptions &opts = {}) {
  return autocorrelation_fft(Series::from(series), opts);
}

} // namespace ts
