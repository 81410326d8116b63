#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "asymunc/api/types.hpp"
#include "asymunc/api/uncertain_value.hpp"

namespace asymunc {

// {"nominal":..,"lower_uncertainty":..,"upper_uncertainty":..,"distribution_kind":"..",
//  "lower_limit":..,"upper_limit":..,"conserve_mean":true|false[,"seed":..]};
// infinite limits are "-inf" / "inf".
std::string to_json(const UncertainValue& value);
std::string to_json(const Result& result);

// Missing optional keys take their ValueSpec defaults; nominal and both
// uncertainties are required.
UncertainValue value_from_json(std::string_view json);

std::string values_to_json(const std::vector<UncertainValue>& values);
std::vector<UncertainValue> values_from_json(std::string_view json);

}  // namespace asymunc
