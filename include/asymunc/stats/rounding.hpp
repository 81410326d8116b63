#pragma once

#include <string>

#include "asymunc/api/types.hpp"
#include "asymunc/api/uncertain_value.hpp"

namespace asymunc {

struct RoundedTriple {
  double value = 0.0;
  double lower = 0.0;
  double upper = 0.0;
  // Number of decimals kept; negative when rounding to tens, hundreds, ...
  int decimals = 0;
};

// Particle Data Group rounding. The smallest non-zero magnitude among value and
// uncertainties fixes the last significant digit of all three: leading three digits
// 100-354 keep two significant digits, 355-949 keep one, 950-999 keep two.
// A value below a tenth of the smaller uncertainty is shown as zero.
RoundedTriple round_pdg(double value, double lower_uncertainty, double upper_uncertainty);

// "value - lower + upper" with PDG rounding.
std::string format_uncertain(double value, double lower_uncertainty, double upper_uncertainty);

std::string to_string(const UncertainValue& value);
std::string to_string(const Result& result);

}  // namespace asymunc
