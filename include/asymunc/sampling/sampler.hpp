#pragma once

#include <cstddef>
#include <span>

#include "asymunc/api/types.hpp"
#include "asymunc/api/uncertain_value.hpp"
#include "asymunc/core/random_stream.hpp"
#include "asymunc/core/sample_set.hpp"

namespace asymunc {

// CDF values of the untruncated distribution at the two limits.
struct TruncationWindow {
  double lower = 0.0;
  double upper = 1.0;
};

double distribution_cdf(const ValueSpec& spec, double x);
double distribution_quantile(const ValueSpec& spec, double p);
TruncationWindow truncation_window(const ValueSpec& spec);

// Inverse-transform sampling of the (truncated) distribution into out.
// Exact values fill out with the nominal value and leave the stream untouched.
void draw_into(const ValueSpec& spec, RandomStream& stream, std::span<double> out);

SampleSet draw_samples(const UncertainValue& value, std::size_t trial_count, RandomStream& stream);

}  // namespace asymunc
