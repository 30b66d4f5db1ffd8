#include "catch.hpp"
#include "dsp/correlation_time.hpp"
#include <cmath>
#include <random>
#include <vector>

namespace {

constexpr double kPi = 3.14159265358979323846;

std::vector<double> linspace(double start, double step, size_t n) {
  std::vector<double> v(n);
  for (size_t i = 0; i < n; ++i)
    v[i] = start + step * static_cast<double>(i);
  return v;
}

} // namespace

TEST_CASE("Sine wave: first root near a quarter period") {
  const double period = 10.0;
  auto t = linspace(0.0, 0.01, 100001);
  std::vector<double> y(t.size());
  for (size_t i = 0; i < t.size(); ++i)
    y[i] = std::sin(2.0 * kPi * t[i] / period);

  ts::CorrelationTimeOptions opts;
  opts.nstep = 10;
  auto stats = ts::tcorrel(t, y, opts);

  REQUIRE(stats.samples == 10001);
  REQUIRE(stats.diagnostics.empty());
  REQUIRE(std::fabs(stats.t0 - period / 4.0) < 0.15);
  // integral of cos(2 pi t / T) up to T/4
  REQUIRE(stats.tc == Approx(period / (2.0 * kPi)).margin(0.1));
  REQUIRE(stats.sigma > 0.0);
  REQUIRE(stats.t.empty());
}

TEST_CASE("Uncorrelated noise has a vanishing correlation time") {
  std::mt19937 gen(1234);
  std::normal_distribution<double> dist(0.0, 1.0);
  auto t = linspace(0.0, 1.0, 5000);
  std::vector<double> y(t.size());
  for (auto &v : y)
    v = dist(gen);

  ts::CorrelationTimeOptions opts;
  opts.nstep = 1;
  auto stats = ts::tcorrel(t, y, opts);

  REQUIRE(stats.tc >= 0.0);
  REQUIRE(stats.tc < 2.0);
  REQUIRE(stats.t0 >= 1.0);
  REQUIRE(stats.t0 <= 20.0);
  // close to the naive standard error for independent samples
  REQUIRE(stats.sigma < 0.05);
}

TEST_CASE("Few samples raise a low accuracy diagnostic") {
  auto t = linspace(0.0, 0.5, 1000);
  std::vector<double> y(t.size());
  for (size_t i = 0; i < t.size(); ++i)
    y[i] = std::cos(0.01 * static_cast<double>(i));

  std::vector<ts::Diagnostic> seen;
  ts::CorrelationTimeOptions opts;
  opts.nstep = 100;
  opts.sink = [&seen](const ts::Diagnostic &d) { seen.push_back(d); };
  auto stats = ts::tcorrel(t, y, opts);

  REQUIRE(seen.size() == 1);
  REQUIRE(seen[0].kind == ts::Diagnostic::Kind::LowAccuracy);
  REQUIRE(seen[0].samples == 10);
  REQUIRE(seen[0].nstep == 100);
  REQUIRE(stats.diagnostics.size() == 1);
  REQUIRE(stats.samples == 10);

  ts::CorrelationTimeOptions quiet;
  quiet.nstep = 100;
  auto same = ts::tcorrel(t, y, quiet);
  REQUIRE(same.tc == stats.tc);
  REQUIRE(same.t0 == stats.t0);
  REQUIRE(same.sigma == stats.sigma);
}

TEST_CASE("Constant signal has zero correlation time and error") {
  auto t = linspace(0.0, 1.0, 800);
  std::vector<double> y(t.size(), 3.0);
  ts::CorrelationTimeOptions opts;
  opts.nstep = 1;
  auto stats = ts::tcorrel(t, y, opts);
  REQUIRE(stats.tc == 0.0);
  REQUIRE(stats.sigma == 0.0);
  REQUIRE(stats.t0 == 0.0);
}

TEST_CASE("Debug keeps the arrays used for the integral") {
  const double period = 40.0;
  auto t = linspace(0.0, 0.1, 20000);
  std::vector<double> y(t.size());
  for (size_t i = 0; i < t.size(); ++i)
    y[i] = std::sin(2.0 * kPi * t[i] / period);

  ts::CorrelationTimeOptions opts;
  opts.nstep = 20;
  opts.debug = true;
  auto stats = ts::tcorrel(t, y, opts);

  REQUIRE(!stats.t.empty());
  REQUIRE(stats.t.size() == stats.acf.size());
  REQUIRE(stats.t.front() == 0.0);
  REQUIRE(stats.t.back() < stats.t0);
  for (double v : stats.acf)
    REQUIRE(v > 0.0);
}

TEST_CASE("Single sample gives zero correlation time and error") {
  std::vector<double> t = {2.0};
  std::vector<double> y = {5.0};
  ts::CorrelationTimeOptions opts;
  opts.nstep = 1;
  auto stats = ts::tcorrel(t, y, opts);
  REQUIRE(stats.t0 == 2.0);
  REQUIRE(stats.tc == 0.0);
  REQUIRE(stats.sigma == 0.0);
  REQUIRE(stats.diagnostics.size() == 1);
}

TEST_CASE("tcorrel validates its inputs") {
  std::vector<double> x = {0.0, 1.0, 2.0};
  std::vector<double> y = {1.0, 2.0};
  REQUIRE_THROWS_AS(ts::tcorrel(x, y), ts::ShapeError);

  ts::CorrelationTimeOptions opts;
  opts.nstep = 0;
  REQUIRE_THROWS_AS(ts::tcorrel(x, x, opts), ts::ValidationError);

  REQUIRE_THROWS_AS(ts::tcorrel(std::vector<double>{}, std::vector<double>{}),
                    ts::ValidationError);

  ts::Series m({1.0, 2.0, 3.0, 4.0}, {2, 2});
  REQUIRE_THROWS_AS(ts::tcorrel(m, m), ts::ShapeError);
}

TEST_CASE("Low accuracy threshold sits at 500 samples") {
  auto count_diagnostics = [](size_t n) {
    auto t = linspace(0.0, 1.0, n);
    std::vector<double> y(n);
    for (size_t i = 0; i < n; ++i)
      y[i] = std::sin(0.1 * static_cast<double>(i));
    size_t calls = 0;
    ts::CorrelationTimeOptions opts;
    opts.nstep = 1;
    opts.sink = [&calls](const ts::Diagnostic &) { ++calls; };
    auto stats = ts::tcorrel(t, y, opts);
    REQUIRE(stats.samples == n);
    REQUIRE(stats.diagnostics.size() == calls);
    return calls;
  };
  REQUIRE(count_diagnostics(499) == 1);
  REQUIRE(count_diagnostics(500) == 0);
}
