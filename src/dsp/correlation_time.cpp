#include "dsp/correlation_time.hpp"
#include "dsp/autocorrelation.hpp"
#include "dsp/integrate.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace ts {

namespace {

std::vector<double> every_nth(const std::vector<double> &v, std::size_t nstep) {
  std::vector<double> out;
  out.reserve(v.size() / nstep + 1);
  for (std::size_t i = 0; i < v.size(); i += nstep)
    out.push_back(v[i]);
  return out;
}

} // namespace

CorrelationStats tcorrel(const Series &x, const Series &y,
                         const CorrelationTimeOptions &opts) {
  if (x.shape() != y.shape())
    throw ShapeError("tcorrel: x and y must be y(x), i.e. same shape; got " +
                     shape_to_string(x.shape()) + " and " +
                     shape_to_string(y.shape()));
  const auto &xs = x.as_1d("tcorrel");
  const auto &ys = y.as_1d("tcorrel");
  if (opts.nstep < 1)
    throw ValidationError("tcorrel: nstep must be >= 1");

  auto sx = every_nth(xs, opts.nstep);
  auto sy = every_nth(ys, opts.nstep);
  if (sy.empty())
    throw ValidationError("tcorrel: no datapoints left for nstep=" +
                          std::to_string(opts.nstep));

  CorrelationStats out;
  out.samples = sy.size();
  out.nstep = opts.nstep;
  if (sy.size() < kLowAccuracySamples) {
    Diagnostic d{Diagnostic::Kind::LowAccuracy,
                 "tcorrel: only " + std::to_string(sy.size()) +
                     " datapoints for the chosen nstep=" +
                     std::to_string(opts.nstep) +
                     "; ACF will possibly not be accurate",
                 sy.size(), opts.nstep};
    if (opts.sink)
      opts.sink(d);
    out.diagnostics.push_back(std::move(d));
  }

  auto acf = autocorrelation_fft(sy);

  // first root of the ACF, or the last point if it never crosses zero
  std::size_t i0 = acf.size() - 1;
  for (std::size_t i = 0; i < acf.size(); ++i) {
    if (acf[i] <= 0.0) {
      i0 = i;
      break;
    }
  }
  out.t0 = sx[i0];

  const double norm = acf[0] == 0.0 ? 1.0 : acf[0];
  std::vector<double> t(sx.begin(), sx.begin() + i0);
  std::vector<double> f(acf.begin(), acf.begin() + i0);
  std::vector<double> fn(f.size());
  for (std::size_t i = 0; i < f.size(); ++i)
    fn[i] = f[i] / norm;
  out.tc = simpson(fn, t);

  const double span = xs.back() - xs.front();
  out.sigma = span == 0.0 ? 0.0 : std::sqrt(2.0 * out.tc * acf[0] / span);

  if (opts.debug) {
    out.t = std::move(t);
    out.acf = std::move(f);
  }
  return out;
}

CorrelationStats tcorrel(const std::vector<double> &x,
                         const std::vector<double> &y,
                         const CorrelationTimeOptions &opts) {
  return tcorrel(Series(x), Series(y), opts);
}

} // namespace ts
