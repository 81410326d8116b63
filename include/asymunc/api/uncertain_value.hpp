#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "asymunc/api/types.hpp"

namespace asymunc {

// Immutable quantity with a nominal value and a (possibly asymmetric) uncertainty.
// Copies share identity: every copy is the same physical quantity and is sampled
// once per propagation run.
class UncertainValue {
 public:
  explicit UncertainValue(const ValueSpec& spec);

  // An explicit seed pins the value's random stream. Two distinct values given
  // the same seed draw identical samples and are therefore fully correlated.
  static UncertainValue create(
      double nominal,
      double lower_uncertainty,
      double upper_uncertainty,
      DistributionKind kind = DistributionKind::AsymmetricNormal,
      std::optional<std::uint64_t> seed = std::nullopt);

  static UncertainValue exact(double nominal);

  // Approximates a propagated result by an asymmetric normal around its mode.
  static UncertainValue from_result(const Result& result);

  double nominal() const { return spec_->nominal; }
  double lower_uncertainty() const { return spec_->lower_uncertainty; }
  double upper_uncertainty() const { return spec_->upper_uncertainty; }
  DistributionKind kind() const { return spec_->kind; }
  double lower_limit() const { return spec_->lower_limit; }
  double upper_limit() const { return spec_->upper_limit; }
  const std::optional<std::uint64_t>& seed() const { return spec_->seed; }
  bool conserves_mean() const { return spec_->conserve_mean; }

  bool is_exact() const;
  bool is_symmetric() const;
  bool is_truncated() const;

  const ValueSpec& spec() const { return *spec_; }
  const void* identity() const { return spec_.get(); }

  UncertainValue with_limits(double lower_limit, double upper_limit) const;

  friend bool same_quantity(const UncertainValue& lhs, const UncertainValue& rhs) {
    return lhs.spec_ == rhs.spec_;
  }

 private:
  std::shared_ptr<const ValueSpec> spec_;
};

std::string distribution_name(DistributionKind kind);
DistributionKind parse_distribution_kind(const std::string& name);

}  // namespace asymunc
