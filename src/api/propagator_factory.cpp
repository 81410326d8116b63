#include "asymunc/api/propagator.hpp"

#include "../core/runtime_propagator.hpp"

namespace asymunc {

std::unique_ptr<IPropagator> make_propagator(const PropagationConfig& config) {
  auto propagator = make_runtime_propagator();
  propagator->initialize(config);
  return propagator;
}

Result evaluate(const Expression& expression, std::size_t trial_count, double coverage) {
  PropagationConfig config;
  config.trial_count = trial_count;
  config.coverage = coverage;
  return evaluate(expression, config);
}

Result evaluate(const Expression& expression, const PropagationConfig& config) {
  auto propagator = make_propagator(config);
  return propagator->evaluate(expression);
}

}  // namespace asymunc
