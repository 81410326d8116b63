#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "asymunc/api/uncertain_value.hpp"

namespace asymunc {

enum class NodeKind {
  Value,
  Constant,
  Add,
  Sub,
  Mul,
  Div,
  Pow,
  Min,
  Max,
  Neg,
  Unary,
};

enum class UnaryFunction {
  Sqrt,
  Log,
  Log10,
  Exp,
  Sin,
  Cos,
  Tan,
  Asin,
  Acos,
  Atan,
  Sinh,
  Cosh,
  Tanh,
  Abs,
};

struct ExprNode {
  // Releases long chains iteratively instead of one stack frame per level.
  ~ExprNode();

  NodeKind kind = NodeKind::Constant;
  double constant = 0.0;
  UnaryFunction function = UnaryFunction::Sqrt;
  std::optional<UncertainValue> value;
  std::shared_ptr<const ExprNode> lhs;
  std::shared_ptr<const ExprNode> rhs;
};

// Deferred arithmetic over uncertain values. Nothing is sampled until the
// expression is handed to a propagator.
class Expression {
 public:
  Expression(const UncertainValue& value);
  Expression(double constant);

  static Expression binary(NodeKind kind, const Expression& lhs, const Expression& rhs);
  static Expression unary(UnaryFunction function, const Expression& operand);
  static Expression negate(const Expression& operand);

  NodeKind kind() const { return node_->kind; }
  const ExprNode& root() const { return *node_; }

  // Nodes in evaluation order (children before parents, left before right).
  // Walks the tree with an explicit stack, so arbitrarily deep chains are fine.
  std::vector<const ExprNode*> postorder() const;

  // Distinct quantities in order of first appearance (depth first, left to right).
  std::vector<UncertainValue> values() const;
  bool is_constant() const;
  std::size_t node_count() const;

  std::string to_string() const;

 private:
  explicit Expression(std::shared_ptr<const ExprNode> node);

  std::shared_ptr<const ExprNode> node_;
};

std::string function_name(UnaryFunction function);
std::optional<UnaryFunction> parse_unary_function(std::string_view name);
double apply_unary(UnaryFunction function, double value);

Expression operator+(const Expression& lhs, const Expression& rhs);
Expression operator-(const Expression& lhs, const Expression& rhs);
Expression operator*(const Expression& lhs, const Expression& rhs);
Expression operator/(const Expression& lhs, const Expression& rhs);
Expression operator-(const Expression& operand);
Expression operator+(const Expression& operand);

Expression pow(const Expression& base, const Expression& exponent);
Expression min(const Expression& lhs, const Expression& rhs);
Expression max(const Expression& lhs, const Expression& rhs);

Expression sqrt(const Expression& operand);
Expression log(const Expression& operand);
Expression log10(const Expression& operand);
Expression exp(const Expression& operand);
Expression sin(const Expression& operand);
Expression cos(const Expression& operand);
Expression tan(const Expression& operand);
Expression asin(const Expression& operand);
Expression acos(const Expression& operand);
Expression atan(const Expression& operand);
Expression sinh(const Expression& operand);
Expression cosh(const Expression& operand);
Expression tanh(const Expression& operand);
Expression abs(const Expression& operand);

}  // namespace asymunc
