#include "asymunc/sampling/sampler.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <boost/math/distributions/normal.hpp>

#include "asymunc/core/errors.hpp"

namespace asymunc {
namespace {

const boost::math::normal_distribution<double>& standard_normal() {
  static const boost::math::normal_distribution<double> dist(0.0, 1.0);
  return dist;
}

double phi(double z) {
  if (std::isinf(z)) {
    return z < 0.0 ? 0.0 : 1.0;
  }
  return boost::math::cdf(standard_normal(), z);
}

double phi_inverse(double p) {
  const double tiny = std::numeric_limits<double>::min();
  const double below_one = std::nextafter(1.0, 0.0);
  return boost::math::quantile(standard_normal(), std::clamp(p, tiny, below_one));
}

// Two half-normals joined at the mode; the normal distribution is the symmetric case.
// below is the probability mass left of the mode.
double split_normal_cdf(double mode, double sigma_low, double sigma_up, double below, double x) {
  if (x < mode) {
    return sigma_low > 0.0 ? 2.0 * below * phi((x - mode) / sigma_low) : 0.0;
  }
  if (!(sigma_up > 0.0)) {
    return 1.0;
  }
  return below + (1.0 - below) * (2.0 * phi((x - mode) / sigma_up) - 1.0);
}

double split_normal_quantile(double mode, double sigma_low, double sigma_up, double below, double p) {
  if (p < below) {
    return mode + sigma_low * phi_inverse(0.5 * p / below);
  }
  return mode + sigma_up * phi_inverse(0.5 + 0.5 * (p - below) / (1.0 - below));
}

// Mass left of the mode: one half, or upper / (lower + upper) when the mean is conserved.
double mass_below_mode(const ValueSpec& spec) {
  if (spec.conserve_mean) {
    return spec.upper_uncertainty / (spec.lower_uncertainty + spec.upper_uncertainty);
  }
  return 0.5;
}

double uniform_cdf(double a, double b, double x) {
  if (x <= a) {
    return 0.0;
  }
  if (x >= b) {
    return 1.0;
  }
  return (x - a) / (b - a);
}

double triangular_cdf(double a, double c, double b, double x) {
  if (x <= a) {
    return 0.0;
  }
  if (x >= b) {
    return 1.0;
  }
  if (x < c) {
    return (x - a) * (x - a) / ((b - a) * (c - a));
  }
  return 1.0 - (b - x) * (b - x) / ((b - a) * (b - c));
}

double triangular_quantile(double a, double c, double b, double p) {
  const double fc = (c - a) / (b - a);
  if (p < fc) {
    return a + std::sqrt(p * (b - a) * (c - a));
  }
  return b - std::sqrt((1.0 - p) * (b - a) * (b - c));
}

void check_sampling_parameters(const ValueSpec& spec) {
  if (spec.lower_uncertainty < 0.0 || spec.upper_uncertainty < 0.0) {
    throw InvalidParameterError("uncertainties must be >= 0");
  }
}

}  // namespace

double distribution_cdf(const ValueSpec& spec, double x) {
  const double lo = spec.nominal - spec.lower_uncertainty;
  const double hi = spec.nominal + spec.upper_uncertainty;

  if (spec.lower_uncertainty == 0.0 && spec.upper_uncertainty == 0.0) {
    return x < spec.nominal ? 0.0 : 1.0;
  }

  switch (spec.kind) {
    case DistributionKind::Normal:
    case DistributionKind::AsymmetricNormal:
      return split_normal_cdf(
          spec.nominal, spec.lower_uncertainty, spec.upper_uncertainty, mass_below_mode(spec), x);
    case DistributionKind::Uniform:
      return uniform_cdf(lo, hi, x);
    case DistributionKind::Triangular:
      return triangular_cdf(lo, spec.nominal, hi, x);
  }
  throw InvalidParameterError("Unsupported distribution kind");
}

double distribution_quantile(const ValueSpec& spec, double p) {
  if (!(p >= 0.0 && p <= 1.0)) {
    throw InvalidParameterError("quantile probability must be in [0, 1]");
  }

  const double lo = spec.nominal - spec.lower_uncertainty;
  const double hi = spec.nominal + spec.upper_uncertainty;

  if (spec.lower_uncertainty == 0.0 && spec.upper_uncertainty == 0.0) {
    return spec.nominal;
  }

  switch (spec.kind) {
    case DistributionKind::Normal:
    case DistributionKind::AsymmetricNormal:
      return split_normal_quantile(
          spec.nominal, spec.lower_uncertainty, spec.upper_uncertainty, mass_below_mode(spec), p);
    case DistributionKind::Uniform:
      return lo + p * (hi - lo);
    case DistributionKind::Triangular:
      return triangular_quantile(lo, spec.nominal, hi, p);
  }
  throw InvalidParameterError("Unsupported distribution kind");
}

TruncationWindow truncation_window(const ValueSpec& spec) {
  TruncationWindow window;
  window.lower = std::isinf(spec.lower_limit) ? 0.0 : distribution_cdf(spec, spec.lower_limit);
  window.upper = std::isinf(spec.upper_limit) ? 1.0 : distribution_cdf(spec, spec.upper_limit);
  return window;
}

void draw_into(const ValueSpec& spec, RandomStream& stream, std::span<double> out) {
  check_sampling_parameters(spec);

  if (spec.lower_uncertainty == 0.0 && spec.upper_uncertainty == 0.0) {
    std::fill(out.begin(), out.end(), spec.nominal);
    return;
  }

  const TruncationWindow window = truncation_window(spec);
  const double mass = window.upper - window.lower;
  const bool truncated = std::isfinite(spec.lower_limit) || std::isfinite(spec.upper_limit);

  for (double& value : out) {
    const double p = window.lower + stream.uniform_open01() * mass;
    value = distribution_quantile(spec, p);
    if (truncated) {
      value = std::clamp(value, spec.lower_limit, spec.upper_limit);
    }
  }
}

SampleSet draw_samples(const UncertainValue& value, std::size_t trial_count, RandomStream& stream) {
  if (trial_count == 0) {
    throw InvalidParameterError("trial_count must be >= 1");
  }

  SampleSet samples(trial_count);
  draw_into(value.spec(), stream, samples.block(0, trial_count));
  return samples;
}

}  // namespace asymunc
