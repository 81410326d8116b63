#include "asymunc/stats/aggregator.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "asymunc/core/errors.hpp"

namespace asymunc {
namespace {

void check_coverage(double coverage) {
  if (!(coverage > 0.0 && coverage <= 1.0)) {
    throw InvalidParameterError("coverage must be in (0, 1]");
  }
}

// Guards ceil() against 0.95 * 100 landing at 95.00000000000001.
std::size_t covered_count(double coverage, std::size_t n) {
  const double raw = coverage * static_cast<double>(n);
  const double rounded = std::round(raw);
  const double target = std::fabs(raw - rounded) < 1.0e-9 * std::max(1.0, raw) ? rounded : std::ceil(raw);
  return std::clamp<std::size_t>(static_cast<std::size_t>(target), 1, n);
}

constexpr double kWidthTolerance = 0.01;
constexpr double kFallbackEndUncertainty = 0.10;

// |d width / d start| around window start i, averaged over the available sides.
double width_slope(std::span<const double> sorted, std::size_t k, std::size_t i) {
  const auto width = [&](std::size_t start) { return sorted[start + k - 1] - sorted[start]; };

  double sum = 0.0;
  int sides = 0;
  if (i > 0 && sorted[i] > sorted[i - 1]) {
    sum += std::fabs(width(i) - width(i - 1)) / (sorted[i] - sorted[i - 1]);
    ++sides;
  }
  if (i + k < sorted.size() && sorted[i + 1] > sorted[i]) {
    sum += std::fabs(width(i + 1) - width(i)) / (sorted[i + 1] - sorted[i]);
    ++sides;
  }
  return sides == 0 ? 0.0 : sum / static_cast<double>(sides);
}

}  // namespace

CoverageInterval shortest_coverage_interval(
    std::span<const double> sorted,
    double coverage,
    bool estimate_end_uncertainty) {
  check_coverage(coverage);
  if (sorted.empty()) {
    throw InsufficientSamplesError("coverage interval of an empty sample", 0, 1);
  }

  const std::size_t n = sorted.size();
  const std::size_t k = covered_count(coverage, n);

  std::size_t best = 0;
  double best_width = sorted[k - 1] - sorted[0];
  for (std::size_t i = 1; i + k <= n; ++i) {
    const double width = sorted[i + k - 1] - sorted[i];
    if (width < best_width) {
      best_width = width;
      best = i;
    }
  }

  CoverageInterval interval;
  interval.lower = sorted[best];
  interval.upper = sorted[best + k - 1];
  interval.first_index = best;
  interval.covered = k;

  if (estimate_end_uncertainty) {
    const double width = interval.width();
    const double fallback = kFallbackEndUncertainty * width;
    const double slope = width_slope(sorted, k, best);
    const double estimate = slope > 0.0 ? std::min(fallback, kWidthTolerance * width / slope) : fallback;
    interval.has_end_uncertainty = true;
    interval.lower_end_uncertainty = estimate;
    interval.upper_end_uncertainty = estimate;
  }
  return interval;
}

double empirical_quantile(std::span<const double> sorted, double p) {
  if (sorted.empty()) {
    throw InsufficientSamplesError("quantile of an empty sample", 0, 1);
  }
  if (!(p >= 0.0 && p <= 1.0)) {
    throw InvalidParameterError("quantile probability must be in [0, 1]");
  }

  const std::size_t n = sorted.size();
  if (n == 1) {
    return sorted[0];
  }
  const double position = p * static_cast<double>(n - 1);
  const std::size_t i0 = static_cast<std::size_t>(std::floor(position));
  const std::size_t i1 = std::min(n - 1, i0 + 1);
  const double fraction = position - static_cast<double>(i0);
  return sorted[i0] + fraction * (sorted[i1] - sorted[i0]);
}

double most_probable_value(std::span<const double> sorted, double lower, double upper) {
  if (sorted.empty()) {
    throw InsufficientSamplesError("mode of an empty sample", 0, 1);
  }
  if (!(upper > lower)) {
    return lower;
  }

  const auto first = std::lower_bound(sorted.begin(), sorted.end(), lower);
  const auto last = std::upper_bound(sorted.begin(), sorted.end(), upper);
  const std::size_t inside = static_cast<std::size_t>(std::distance(first, last));
  if (inside == 0) {
    return 0.5 * (lower + upper);
  }

  const std::size_t bins = std::max<std::size_t>(1, static_cast<std::size_t>(std::ceil(std::sqrt(static_cast<double>(inside)))));
  const double bin_width = (upper - lower) / static_cast<double>(bins);

  std::vector<std::size_t> counts(bins, 0);
  for (auto it = first; it != last; ++it) {
    std::size_t bin = static_cast<std::size_t>((*it - lower) / bin_width);
    counts[std::min(bin, bins - 1)] += 1;
  }

  const auto peak = std::max_element(counts.begin(), counts.end());
  const std::size_t bin = static_cast<std::size_t>(std::distance(counts.begin(), peak));
  return lower + (static_cast<double>(bin) + 0.5) * bin_width;
}

double chi_square(
    std::span<const double> data,
    std::span<const double> uncertainties,
    std::span<const double> fit,
    std::size_t degrees_of_freedom) {
  if (data.size() != uncertainties.size() || data.size() != fit.size()) {
    throw InvalidParameterError("chi_square inputs must have the same length");
  }
  if (degrees_of_freedom == 0) {
    throw InvalidParameterError("chi_square degrees_of_freedom must be >= 1");
  }

  double sum = 0.0;
  for (std::size_t i = 0; i < data.size(); ++i) {
    if (!(uncertainties[i] > 0.0)) {
      throw InvalidParameterError("chi_square uncertainties must be positive");
    }
    const double residual = (data[i] - fit[i]) / uncertainties[i];
    sum += residual * residual;
  }
  return sum / static_cast<double>(degrees_of_freedom);
}

Result summarize(const SampleSet& samples, double coverage, std::size_t minimum_valid_samples) {
  check_coverage(coverage);

  std::vector<double> valid = samples.valid_values();
  const std::size_t trials = samples.size();
  const std::size_t required = std::max<std::size_t>(1, minimum_valid_samples);

  if (valid.size() < required) {
    std::ostringstream out;
    out << "Insufficient valid samples: " << valid.size() << " of " << trials << " trials valid, " << required
        << " required";
    throw InsufficientSamplesError(out.str(), valid.size(), required);
  }

  std::sort(valid.begin(), valid.end());
  const std::size_t n = valid.size();

  double sum = 0.0;
  for (double v : valid) {
    sum += v;
  }
  const double mean = sum / static_cast<double>(n);

  double squares = 0.0;
  for (double v : valid) {
    squares += (v - mean) * (v - mean);
  }

  const CoverageInterval interval = shortest_coverage_interval(valid, coverage);

  Result result;
  result.mean = mean;
  result.lower_bound = interval.lower;
  result.upper_bound = interval.upper;
  result.coverage = coverage;
  result.mode = most_probable_value(valid, interval.lower, interval.upper);
  result.median = empirical_quantile(valid, 0.5);
  result.standard_deviation = n > 1 ? std::sqrt(squares / static_cast<double>(n - 1)) : 0.0;
  result.valid_count = n;
  result.trial_count = trials;
  result.invalid_fraction = trials == 0 ? 0.0 : static_cast<double>(trials - n) / static_cast<double>(trials);
  return result;
}

}  // namespace asymunc
