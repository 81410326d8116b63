#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>

namespace asymunc {

enum class DistributionKind {
  Normal,
  AsymmetricNormal,
  Uniform,
  Triangular,
};

struct ValueSpec {
  double nominal = 0.0;
  double lower_uncertainty = 0.0;
  double upper_uncertainty = 0.0;
  DistributionKind kind = DistributionKind::AsymmetricNormal;
  double lower_limit = -std::numeric_limits<double>::infinity();
  double upper_limit = std::numeric_limits<double>::infinity();
  std::optional<std::uint64_t> seed;
  // Normal kinds only: weights the halves upper / (lower + upper) below the nominal
  // value so the distribution mean equals the nominal value. Excludes limits.
  bool conserve_mean = false;
};

struct PropagationConfig {
  std::size_t trial_count = 1'000'000;
  double coverage = 0.95;
  std::uint64_t seed = 42;
  std::size_t minimum_valid_samples = 100;
  std::size_t threads = 1;
  std::size_t block_size = 4096;
  bool cache_samples = true;
};

struct Result {
  double mean = 0.0;
  double lower_bound = 0.0;
  double upper_bound = 0.0;
  double coverage = 0.95;
  double mode = 0.0;
  double median = 0.0;
  double standard_deviation = 0.0;
  double invalid_fraction = 0.0;
  std::size_t valid_count = 0;
  std::size_t trial_count = 0;

  double lower_uncertainty() const { return mode - lower_bound; }
  double upper_uncertainty() const { return upper_bound - mode; }
  double width() const { return upper_bound - lower_bound; }
};

}  // namespace asymunc
