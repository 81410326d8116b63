#pragma once

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "asymunc/api/propagator.hpp"

namespace test_common {

inline asymunc::PropagationConfig default_config(std::size_t trials = 100'000, std::size_t threads = 1) {
  asymunc::PropagationConfig config;
  config.trial_count = trials;
  config.coverage = 0.95;
  config.seed = 42;
  config.minimum_valid_samples = 100;
  config.threads = threads;
  config.block_size = 4096;
  config.cache_samples = true;
  return config;
}

inline asymunc::UncertainValue seeded_value(
    double nominal,
    double lower,
    double upper,
    std::uint64_t seed,
    asymunc::DistributionKind kind = asymunc::DistributionKind::AsymmetricNormal) {
  return asymunc::UncertainValue::create(nominal, lower, upper, kind, seed);
}

inline double json_value(const std::string& json, const std::string& key) {
  const std::string needle = "\"" + key + "\":";
  const std::size_t begin = json.find(needle);
  if (begin == std::string::npos) {
    throw std::runtime_error("key not found in json: " + key);
  }

  std::size_t value_begin = begin + needle.size();
  std::size_t value_end = value_begin;
  while (value_end < json.size() &&
         (std::isdigit(static_cast<unsigned char>(json[value_end])) != 0 || json[value_end] == '.' ||
          json[value_end] == 'e' || json[value_end] == 'E' || json[value_end] == '+' || json[value_end] == '-')) {
    ++value_end;
  }

  return std::stod(json.substr(value_begin, value_end - value_begin));
}

inline double mean(const std::vector<double>& values) {
  double sum = 0.0;
  for (double value : values) {
    sum += value;
  }
  return sum / static_cast<double>(std::max<std::size_t>(1, values.size()));
}

inline double standard_deviation(const std::vector<double>& values) {
  const double m = mean(values);
  double sum = 0.0;
  for (double value : values) {
    sum += (value - m) * (value - m);
  }
  return std::sqrt(sum / static_cast<double>(std::max<std::size_t>(2, values.size()) - 1));
}

inline double fraction_below(const std::vector<double>& values, double threshold) {
  const auto count = std::count_if(values.begin(), values.end(), [threshold](double v) { return v < threshold; });
  return static_cast<double>(count) / static_cast<double>(std::max<std::size_t>(1, values.size()));
}

}  // namespace test_common
