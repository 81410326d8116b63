#include "asymunc/stats/rounding.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace asymunc {
namespace {

// Half-to-even, same as the default floating point rounding mode.
double round_to_decimals(double value, int decimals) {
  if (decimals >= 0) {
    const double scale = std::pow(10.0, decimals);
    return std::nearbyint(value * scale) / scale;
  }
  const double scale = std::pow(10.0, -decimals);
  return std::nearbyint(value / scale) * scale;
}

}  // namespace

RoundedTriple round_pdg(double value, double lower_uncertainty, double upper_uncertainty) {
  RoundedTriple out{value, lower_uncertainty, upper_uncertainty, 0};

  if (value != 0.0 && lower_uncertainty != 0.0 && upper_uncertainty != 0.0 &&
      std::fabs(value) / std::min(lower_uncertainty, upper_uncertainty) < 0.1) {
    out.value = 0.0;
  }

  if (lower_uncertainty == 0.0 && upper_uncertainty == 0.0) {
    return out;
  }

  std::array<double, 3> magnitudes = {out.value, lower_uncertainty, upper_uncertainty};
  double smallest = 0.0;
  for (double m : magnitudes) {
    if (m > 0.0 && (smallest == 0.0 || m < smallest)) {
      smallest = m;
    }
  }
  if (smallest == 0.0) {
    return out;
  }

  const int first_digit = static_cast<int>(std::floor(std::log10(smallest)));
  const double leading = std::nearbyint(smallest * std::pow(10.0, 2 - first_digit));
  const int extra = (leading >= 355.0 && leading <= 949.0) ? 0 : 1;
  out.decimals = extra - first_digit;

  out.value = round_to_decimals(out.value, out.decimals);
  out.lower = round_to_decimals(lower_uncertainty, out.decimals);
  out.upper = round_to_decimals(upper_uncertainty, out.decimals);
  return out;
}

std::string format_uncertain(double value, double lower_uncertainty, double upper_uncertainty) {
  const RoundedTriple rounded = round_pdg(value, lower_uncertainty, upper_uncertainty);
  std::ostringstream out;
  if (lower_uncertainty == 0.0 && upper_uncertainty == 0.0) {
    out << rounded.value;
    return out.str();
  }
  out << std::fixed << std::setprecision(std::max(0, rounded.decimals));
  out << rounded.value << " - " << rounded.lower << " + " << rounded.upper;
  return out.str();
}

std::string to_string(const UncertainValue& value) {
  return format_uncertain(value.nominal(), value.lower_uncertainty(), value.upper_uncertainty());
}

std::string to_string(const Result& result) {
  return format_uncertain(result.mode, result.lower_uncertainty(), result.upper_uncertainty());
}

}  // namespace asymunc
