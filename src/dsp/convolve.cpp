#include "dsp/convolve.hpp"
#include "dsp/series.hpp"

#include <algorithm>
#include <cctype>
#include <complex>
#include <fftw3.h>

namespace ts {

namespace {

std::vector<double> fft_full(const std::vector<double> &a,
                             const std::vector<double> &b) {
  const std::size_t out_len = a.size() + b.size() - 1;
  const int nfft = static_cast<int>(next_fast_len(out_len));
  const int nbins = nfft / 2 + 1;

  std::vector<double> tmp(nfft, 0.0);
  std::vector<std::complex<double>> fa(nbins);
  std::vector<std::complex<double>> fb(nbins);
  fftw_plan fwd = fftw_plan_dft_r2c_1d(
      nfft, tmp.data(), reinterpret_cast<fftw_complex *>(fa.data()),
      FFTW_ESTIMATE);

  std::copy(b.begin(), b.end(), tmp.begin());
  fftw_execute(fwd);
  fb = fa;

  std::fill(tmp.begin(), tmp.end(), 0.0);
  std::copy(a.begin(), a.end(), tmp.begin());
  fftw_execute(fwd);
  fftw_destroy_plan(fwd);

  for (int k = 0; k < nbins; ++k)
    fa[k] *= fb[k];

  // c2r overwrites its input
  fftw_plan inv = fftw_plan_dft_c2r_1d(
      nfft, reinterpret_cast<fftw_complex *>(fa.data()), tmp.data(),
      FFTW_ESTIMATE);
  fftw_execute(inv);
  fftw_destroy_plan(inv);

  std::vector<double> out(out_len);
  const double scale = 1.0 / nfft;
  for (std::size_t i = 0; i < out_len; ++i)
    out[i] = tmp[i] * scale;
  return out;
}

std::vector<double> direct_full(const std::vector<double> &a,
                                const std::vector<double> &b) {
  std::vector<double> out(a.size() + b.size() - 1, 0.0);
  for (std::size_t i = 0; i < a.size(); ++i) {
    for (std::size_t j = 0; j < b.size(); ++j)
      out[i + j] += a[i] * b[j];
  }
  return out;
}

} // namespace

std::vector<double> convolve(const std::vector<double> &a,
                             const std::vector<double> &b,
                             const ConvolveOptions &opts) {
  if (a.empty() || b.empty())
    return {};

  auto full = opts.method == ConvolveMethod::Fft ? fft_full(a, b)
                                                 : direct_full(a, b);
  std::size_t start = 0;
  std::size_t len = full.size();
  switch (opts.mode) {
  case ConvolveMode::Full:
    return full;
  case ConvolveMode::Same:
    len = a.size();
    start = (full.size() - len) / 2;
    break;
  case ConvolveMode::Valid:
    len = std::max(a.size(), b.size()) - std::min(a.size(), b.size()) + 1;
    start = std::min(a.size(), b.size()) - 1;
    break;
  }
  return std::vector<double>(full.begin() + start,
                             full.begin() + start + len);
}

ConvolveMode parse_convolve_mode(const std::string &name) {
  std::string s = name;
  std::transform(s.begin(), s.end(), s.begin(), ::tolower);
  if (s == "full")
    return ConvolveMode::Full;
  if (s == "same")
    return ConvolveMode::Same;
  if (s == "valid")
    return ConvolveMode::Valid;
  throw ValidationError("convolution mode '" + name +
                        "' not supported; must be one of full, same, valid");
}

const char *convolve_mode_name(ConvolveMode mode) {
  switch (mode) {
  case ConvolveMode::Full:
    return "full";
  case ConvolveMode::Same:
    return "same";
  case ConvolveMode::Valid:
    return "valid";
  }
  return "";
}

std::size_t next_fast_len(std::size_t n) {
  if (n <= 6)
    return std::max<std::size_t>(n, 1);
  std::size_t best = 1;
  while (best < n)
    best <<= 1;
  for (std::size_t p5 = 1; p5 < best; p5 *= 5) {
    for (std::size_t p35 = p5; p35 < best; p35 *= 3) {
      std::size_t v = p35;
      while (v < n)
        v <<= 1;
      best = std::min(best, v);
    }
  }
  return best;
}

} // namespace ts
