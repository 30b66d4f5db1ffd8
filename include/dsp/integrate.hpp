#pragma once
#include <cstddef>
#include <vector>

namespace ts {

// How to treat the extra interval when the sample count is even.
enum class EvenRule {
  First, // Simpson on the first N-1 points, trapezoid on the last interval
  Last,  // trapezoid on the first interval, Simpson on the last N-1 points
  Avg    // mean of First and Last
};

// Composite Simpson's rule for samples y(x) on an arbitrary increasing grid.
// Returns 0 for fewer than two samples and the trapezoid for exactly two.
double simpson(const std::vector<double> &y, const std::vector<double> &x,
               EvenRule rule = EvenRule::Avg);

} // namespace ts
