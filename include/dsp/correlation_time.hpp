#pragma once
#include "dsp/series.hpp"
#include <cstddef>
#include <vector>

namespace ts {

// Fewer points than this after subsampling raise a LowAccuracy diagnostic.
constexpr std::size_t kLowAccuracySamples = 500;

struct CorrelationTimeOptions {
  std::size_t nstep = 100; // analyze every nstep-th point
  bool debug = false;      // keep the arrays used for the integral
  DiagnosticSink sink;     // optional receiver for advisory diagnostics
};

struct CorrelationStats {
  double tc = 0.0;    // decay constant, units of x
  double t0 = 0.0;    // x at the first root of the ACF
  double sigma = 0.0; // error of <y> corrected for correlations
  std::size_t samples = 0;
  std::size_t nstep = 1;
  std::vector<Diagnostic> diagnostics;

  // filled only with CorrelationTimeOptions::debug
  std::vector<double> t;
  std::vector<double> acf;
};

// Correlation time of y(x) and the error estimate for the mean <y>.
//
// The ACF f(t) of the fluctuations y - <y> is computed on every nstep-th
// point. Assuming f(t)/f(0) = exp(-t/tc), tc is the integral of the
// normalized ACF up to its first root t0 (Frenkel & Smit, Understanding
// Molecular Simulation, p. 526). The error of the mean is
//   sigma = sqrt(2 tc f(0) / (x[-1] - x[0])).
// nstep should be large enough that roughly 50,000 points or fewer remain.
CorrelationStats tcorrel(const Series &x, const Series &y,
                         const CorrelationTimeOptions &opts = {});

CorrelationStats tcorrel(const std::vector<double> &x,
                         const std::vector<double> &y,
                         const CorrelationTimeOptions &opts = {});

} // namespace ts
