#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "asymunc/api/expression.hpp"
#include "asymunc/api/types.hpp"
#include "asymunc/api/uncertain_value.hpp"
#include "asymunc/core/sample_set.hpp"

namespace asymunc {

class IPropagator {
 public:
  virtual ~IPropagator() = default;

  virtual void initialize(const PropagationConfig& config) = 0;
  virtual const PropagationConfig& config() const = 0;

  // Samples every quantity once, evaluates the expression trial by trial and
  // reduces the output to a Result.
  virtual Result evaluate(const Expression& expression) = 0;

  // Output population of one run, NaN for invalid trials.
  virtual SampleSet sample(const Expression& expression) = 0;

  virtual const SampleSet& samples_for(const UncertainValue& value) = 0;

  // Drops cached samples. Stream keys assigned to values stay until initialize(),
  // so values drawn again reproduce the same samples.
  virtual void clear_cache() = 0;
  virtual std::size_t cached_values() const = 0;

  virtual std::string diagnostics_json() const = 0;
};

std::unique_ptr<IPropagator> make_propagator(const PropagationConfig& config);

Result evaluate(const Expression& expression, std::size_t trial_count = 1'000'000, double coverage = 0.95);
Result evaluate(const Expression& expression, const PropagationConfig& config);

}  // namespace asymunc
