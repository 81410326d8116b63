#include "asymunc/api/validation.hpp"

#include <cmath>
#include <sstream>

#include "asymunc/core/errors.hpp"
#include "asymunc/sampling/sampler.hpp"

namespace asymunc {
namespace {

constexpr double kMinimumTruncatedMass = 1.0e-12;

void throw_issues(const std::vector<ValidationIssue>& issues, const char* header) {
  bool any_fatal = false;
  std::ostringstream out;
  out << header;
  for (const auto& issue : issues) {
    if (issue.fatal) {
      out << "\n - " << issue.message;
      any_fatal = true;
    }
  }
  if (any_fatal) {
    throw InvalidParameterError(out.str());
  }
}

}  // namespace

std::vector<ValidationIssue> validate_value(const ValueSpec& spec) {
  std::vector<ValidationIssue> issues;

  if (!std::isfinite(spec.nominal)) {
    issues.push_back({"nominal must be finite", true});
  }
  if (!std::isfinite(spec.lower_uncertainty) || spec.lower_uncertainty < 0.0) {
    issues.push_back({"lower_uncertainty must be finite and >= 0", true});
  }
  if (!std::isfinite(spec.upper_uncertainty) || spec.upper_uncertainty < 0.0) {
    issues.push_back({"upper_uncertainty must be finite and >= 0", true});
  }
  if (std::isnan(spec.lower_limit) || std::isnan(spec.upper_limit) || !(spec.lower_limit < spec.upper_limit)) {
    issues.push_back({"limits must satisfy lower_limit < upper_limit", true});
  }
  if (!issues.empty()) {
    return issues;
  }

  if (spec.kind == DistributionKind::Normal && spec.lower_uncertainty != spec.upper_uncertainty) {
    issues.push_back({"normal distribution requires lower_uncertainty == upper_uncertainty", true});
  }

  if (spec.conserve_mean) {
    if (spec.kind != DistributionKind::Normal && spec.kind != DistributionKind::AsymmetricNormal) {
      issues.push_back({"conserve_mean applies to normal distributions only", true});
    }
    if (!(spec.lower_uncertainty > 0.0 && spec.upper_uncertainty > 0.0)) {
      issues.push_back({"conserve_mean requires both uncertainties > 0", true});
    }
    if (std::isfinite(spec.lower_limit) || std::isfinite(spec.upper_limit)) {
      issues.push_back({"conserve_mean cannot be combined with limits", true});
    }
    if (!issues.empty()) {
      return issues;
    }
  }

  const bool exact = spec.lower_uncertainty == 0.0 && spec.upper_uncertainty == 0.0;
  if (exact) {
    if (spec.nominal < spec.lower_limit || spec.nominal > spec.upper_limit) {
      issues.push_back({"exact value lies outside its limits", true});
    }
    return issues;
  }

  if (!issues.empty()) {
    return issues;
  }

  const TruncationWindow window = truncation_window(spec);
  if (!(window.upper - window.lower > kMinimumTruncatedMass)) {
    issues.push_back({"limits leave no probability mass of the distribution", true});
  }

  return issues;
}

std::vector<ValidationIssue> validate_config(const PropagationConfig& config) {
  std::vector<ValidationIssue> issues;

  if (config.trial_count == 0) {
    issues.push_back({"config.trial_count must be >= 1", true});
  }
  if (!(config.coverage > 0.0 && config.coverage <= 1.0)) {
    issues.push_back({"config.coverage must be in (0, 1]", true});
  }
  if (config.minimum_valid_samples == 0) {
    issues.push_back({"config.minimum_valid_samples must be >= 1", true});
  }
  if (config.threads == 0) {
    issues.push_back({"config.threads must be >= 1", true});
  }
  if (config.block_size == 0) {
    issues.push_back({"config.block_size must be >= 1", true});
  }
  if (config.trial_count > 0 && config.minimum_valid_samples > config.trial_count) {
    issues.push_back({"config.minimum_valid_samples exceeds config.trial_count; every evaluation will fail", false});
  }

  return issues;
}

void throw_if_invalid(const ValueSpec& spec) {
  throw_issues(validate_value(spec), "Invalid uncertain value:");
}

void throw_if_invalid(const PropagationConfig& config) {
  throw_issues(validate_config(config), "Invalid propagation config:");
}

}  // namespace asymunc
