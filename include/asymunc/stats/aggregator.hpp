#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "asymunc/api/types.hpp"
#include "asymunc/core/sample_set.hpp"

namespace asymunc {

struct CoverageInterval {
  double lower = 0.0;
  double upper = 0.0;
  std::size_t first_index = 0;
  std::size_t covered = 0;
  // Position uncertainty of both ends due to the finite sample, only filled in
  // when requested.
  bool has_end_uncertainty = false;
  double lower_end_uncertainty = 0.0;
  double upper_end_uncertainty = 0.0;

  double width() const { return upper - lower; }
  bool contains(double value) const { return value >= lower && value <= upper; }
};

// Shortest interval [sorted[i], sorted[i + k - 1]] with k = ceil(coverage * n).
// sorted must be ascending and free of NaN. Ties resolve to the lowest i.
//
// With estimate_end_uncertainty the ends also get a position uncertainty: the
// shift of the window start that changes the interval width by one percent,
// from the slope of the width against the start position around the optimum.
// A flat slope falls back to a tenth of the width, which also caps the estimate.
CoverageInterval shortest_coverage_interval(
    std::span<const double> sorted,
    double coverage,
    bool estimate_end_uncertainty = false);

// Linear interpolation between closest ranks, p in [0, 1].
double empirical_quantile(std::span<const double> sorted, double p);

// Centre of the most populated of ceil(sqrt(n)) equal bins spanning [lower, upper].
double most_probable_value(std::span<const double> sorted, double lower, double upper);

// Reduced chi square of a fit against data with uncertainties.
double chi_square(
    std::span<const double> data,
    std::span<const double> uncertainties,
    std::span<const double> fit,
    std::size_t degrees_of_freedom = 1);

Result summarize(const SampleSet& samples, double coverage = 0.95, std::size_t minimum_valid_samples = 100);

}  // namespace asymunc
