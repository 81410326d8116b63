#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "asymunc/api/expression.hpp"
#include "asymunc/api/uncertain_value.hpp"

namespace asymunc {

enum class OpCode {
  PushConstant,
  PushSymbol,
  Add,
  Sub,
  Mul,
  Div,
  Pow,
  Neg,
  Func1,
  Func2,
};

struct Instruction {
  OpCode op = OpCode::PushConstant;
  double constant_value = 0.0;
  std::string symbol;
};

using Bindings = std::unordered_map<std::string, UncertainValue>;

// Infix formula over named quantities, compiled once to postfix and bound to
// concrete values on demand.
class Formula {
 public:
  Formula() = default;

  static Formula compile(std::string_view text);

  // Builds the deferred expression; every occurrence of a name refers to the same quantity.
  Expression bind(const Bindings& bindings) const;

  // Identifiers that must be bound, in order of first appearance.
  std::vector<std::string> symbols() const;

  const std::string& canonical_form() const { return canonical_; }
  const std::vector<Instruction>& bytecode() const { return bytecode_; }

 private:
  std::string canonical_;
  std::vector<Instruction> bytecode_;
};

Expression compile_expression(std::string_view text, const Bindings& bindings);

}  // namespace asymunc
