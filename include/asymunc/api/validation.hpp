#pragma once

#include <string>
#include <vector>

#include "asymunc/api/types.hpp"

namespace asymunc {

struct ValidationIssue {
  std::string message;
  bool fatal = true;
};

std::vector<ValidationIssue> validate_value(const ValueSpec& spec);
std::vector<ValidationIssue> validate_config(const PropagationConfig& config);

void throw_if_invalid(const ValueSpec& spec);
void throw_if_invalid(const PropagationConfig& config);

}  // namespace asymunc
