#include "config.hpp"
#include "dsp/autocorrelation.hpp"
#include "dsp/correlation_time.hpp"
#include "dsp/smooth.hpp"
#include "logging.hpp"
#include "series_io.hpp"
#include <cstdio>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace {

void usage(const char *prog) {
  std::cerr << "usage: " << prog << " <data-file> [config-file]\n"
            << "  data-file: columns x y1 y2 ... ('#' and '@' lines ignored)\n"
            << "  config-file: key = value settings [tsstat.conf]\n";
}

int run(const std::string &data_path, const ts::Config &cfg) {
  auto cols = ts::read_columns(data_path);
  if (cfg.column < 1 || static_cast<size_t>(cfg.column) >= cols.size()) {
    ts::log::error("column " + std::to_string(cfg.column) + " not present in " +
                   data_path + " (" + std::to_string(cols.size()) +
                   " columns)");
    return 1;
  }
  const auto &x = cols[0];
  const auto &y = cols[cfg.column];
  ts::log::info("Read " + std::to_string(y.size()) + " samples from " +
                data_path);

  ts::CorrelationTimeOptions opts;
  opts.nstep = cfg.nstep;
  opts.debug = cfg.debug;
  opts.sink = ts::log::diagnostic_sink();
  auto stats = ts::tcorrel(x, y, opts);

  char buf[160];
  std::snprintf(buf, sizeof(buf), "tc = %.6g  t0 = %.6g  sigma = %.6g", stats.tc,
                stats.t0, stats.sigma);
  std::cout << buf << "\n";
  ts::log::info("Correlation time from " + std::to_string(stats.samples) +
                " samples (nstep=" + std::to_string(stats.nstep) + ")");
  if (cfg.debug) {
    for (size_t i = 0; i < stats.t.size(); ++i)
      ts::log::debug("acf(" + std::to_string(stats.t[i]) +
                     ") = " + std::to_string(stats.acf[i]));
  }

  if (!cfg.acf_output.empty()) {
    ts::AutocorrelationOptions acf_opts;
    acf_opts.normalize = cfg.acf_normalize;
    acf_opts.convolve.mode = ts::parse_convolve_mode(cfg.acf_mode);
    auto acf = ts::autocorrelation_fft(y, acf_opts);
    std::vector<double> lag(x.begin(), x.begin() + acf.size());
    for (auto &v : lag)
      v -= x.front();
    if (!ts::write_columns(cfg.acf_output, {lag, acf},
                           {"lag acf", std::string("mode ") +
                                           ts::convolve_mode_name(
                                               acf_opts.convolve.mode)})) {
      ts::log::error("Failed to write " + cfg.acf_output);
      return 1;
    }
    ts::log::info("ACF written to " + cfg.acf_output);
  }

  if (!cfg.smooth_output.empty() && cfg.smooth_resolution > 0.0) {
    auto shape = ts::parse_window_shape(cfg.smooth_window);
    int window_len = ts::smoothing_window_length(cfg.smooth_resolution, x);
    ts::log::debug("Smoothing window " + std::to_string(window_len) +
                   " samples (" + ts::window_shape_name(shape) + ")");
    auto smoothed = ts::smooth(y, window_len, shape);
    if (!ts::write_columns(cfg.smooth_output, {x, smoothed},
                           {"x smoothed", "window " +
                                              std::string(ts::window_shape_name(
                                                  shape)) +
                                              " " + std::to_string(window_len)})) {
      ts::log::error("Failed to write " + cfg.smooth_output);
      return 1;
    }
    ts::log::info("Smoothed series written to " + cfg.smooth_output);
  }
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2 || argc > 3) {
    usage(argv[0]);
    return 2;
  }
  const std::string config_path = argc == 3 ? argv[2] : "tsstat.conf";

  try {
    auto cfg = ts::Config::load(config_path);
    ts::log::init(ts::log::level_from_string(cfg.log_level));
    return run(argv[1], cfg);
  } catch (const std::exception &e) {
    ts::log::error(e.what());
    return 1;
  }
}
