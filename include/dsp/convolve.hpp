#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace ts {

enum class ConvolveMode { Full, Same, Valid };
enum class ConvolveMethod { Fft, Direct };

struct ConvolveOptions {
  ConvolveMode mode = ConvolveMode::Full;
  ConvolveMethod method = ConvolveMethod::Fft;
};

// Linear convolution of a and b.
//   Full:  length na + nb - 1
//   Same:  length na, centered on the full result
//   Valid: only the points where one input fully overlaps the other
std::vector<double> convolve(const std::vector<double> &a,
                             const std::vector<double> &b,
                             const ConvolveOptions &opts = {});

ConvolveMode parse_convolve_mode(const std::string &name);
const char *convolve_mode_name(ConvolveMode mode);

// Smallest 2^a 3^b 5^c >= n.
std::size_t next_fast_len(std::size_t n);

} // namespace ts
