#include "asymunc/api/uncertain_value.hpp"

#include <algorithm>
#include <cmath>

#include "asymunc/api/validation.hpp"
#include "asymunc/core/errors.hpp"

namespace asymunc {

UncertainValue::UncertainValue(const ValueSpec& spec) {
  throw_if_invalid(spec);
  spec_ = std::make_shared<const ValueSpec>(spec);
}

UncertainValue UncertainValue::create(
    double nominal,
    double lower_uncertainty,
    double upper_uncertainty,
    DistributionKind kind,
    std::optional<std::uint64_t> seed) {
  ValueSpec spec;
  spec.nominal = nominal;
  spec.lower_uncertainty = lower_uncertainty;
  spec.upper_uncertainty = upper_uncertainty;
  spec.kind = kind;
  spec.seed = seed;
  return UncertainValue(spec);
}

UncertainValue UncertainValue::exact(double nominal) {
  return create(nominal, 0.0, 0.0, DistributionKind::Normal);
}

UncertainValue UncertainValue::from_result(const Result& result) {
  ValueSpec spec;
  spec.nominal = result.mode;
  spec.lower_uncertainty = std::max(0.0, result.lower_uncertainty());
  spec.upper_uncertainty = std::max(0.0, result.upper_uncertainty());
  spec.kind = DistributionKind::AsymmetricNormal;
  return UncertainValue(spec);
}

bool UncertainValue::is_exact() const {
  return spec_->lower_uncertainty == 0.0 && spec_->upper_uncertainty == 0.0;
}

bool UncertainValue::is_symmetric() const {
  return spec_->lower_uncertainty == spec_->upper_uncertainty;
}

bool UncertainValue::is_truncated() const {
  return std::isfinite(spec_->lower_limit) || std::isfinite(spec_->upper_limit);
}

UncertainValue UncertainValue::with_limits(double lower_limit, double upper_limit) const {
  ValueSpec spec = *spec_;
  spec.lower_limit = lower_limit;
  spec.upper_limit = upper_limit;
  return UncertainValue(spec);
}

std::string distribution_name(DistributionKind kind) {
  switch (kind) {
    case DistributionKind::Normal:
      return "normal";
    case DistributionKind::AsymmetricNormal:
      return "asymmetric_normal";
    case DistributionKind::Uniform:
      return "uniform";
    case DistributionKind::Triangular:
      return "triangular";
  }
  return "unknown";
}

DistributionKind parse_distribution_kind(const std::string& name) {
  if (name == "normal") {
    return DistributionKind::Normal;
  }
  if (name == "asymmetric_normal") {
    return DistributionKind::AsymmetricNormal;
  }
  if (name == "uniform") {
    return DistributionKind::Uniform;
  }
  if (name == "triangular") {
    return DistributionKind::Triangular;
  }
  throw InvalidParameterError("Unknown distribution kind: " + name);
}

}  // namespace asymunc
