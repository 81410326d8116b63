#include "asymunc/api/expression.hpp"

#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <unordered_set>
#include <utility>

#include "asymunc/core/errors.hpp"

namespace asymunc {
namespace {

const char* operator_symbol(NodeKind kind) {
  switch (kind) {
    case NodeKind::Add:
      return "+";
    case NodeKind::Sub:
      return "-";
    case NodeKind::Mul:
      return "*";
    case NodeKind::Div:
      return "/";
    case NodeKind::Pow:
      return "^";
    default:
      return "?";
  }
}

// Frame of the iterative printer: a node and how many of its parts are written.
struct WriteFrame {
  const ExprNode* node = nullptr;
  int stage = 0;
};

void write_tree(const ExprNode& root, std::ostringstream& out) {
  std::vector<WriteFrame> stack;
  stack.push_back(WriteFrame{&root, 0});

  while (!stack.empty()) {
    WriteFrame& frame = stack.back();
    const ExprNode& node = *frame.node;

    switch (node.kind) {
      case NodeKind::Value: {
        const UncertainValue& v = *node.value;
        out << '{' << v.nominal() << " -" << v.lower_uncertainty() << " +" << v.upper_uncertainty() << '}';
        stack.pop_back();
        continue;
      }
      case NodeKind::Constant:
        out << node.constant;
        stack.pop_back();
        continue;
      case NodeKind::Add:
      case NodeKind::Sub:
      case NodeKind::Mul:
      case NodeKind::Div:
      case NodeKind::Pow:
      case NodeKind::Min:
      case NodeKind::Max: {
        const bool call = node.kind == NodeKind::Min || node.kind == NodeKind::Max;
        if (frame.stage == 0) {
          out << (call ? (node.kind == NodeKind::Min ? "min(" : "max(") : "(");
          frame.stage = 1;
          stack.push_back(WriteFrame{node.lhs.get(), 0});
        } else if (frame.stage == 1) {
          if (call) {
            out << ", ";
          } else {
            out << ' ' << operator_symbol(node.kind) << ' ';
          }
          frame.stage = 2;
          stack.push_back(WriteFrame{node.rhs.get(), 0});
        } else {
          out << ')';
          stack.pop_back();
        }
        continue;
      }
      case NodeKind::Neg:
      case NodeKind::Unary:
        if (frame.stage == 0) {
          if (node.kind == NodeKind::Neg) {
            out << "-(";
          } else {
            out << function_name(node.function) << '(';
          }
          frame.stage = 1;
          stack.push_back(WriteFrame{node.lhs.get(), 0});
        } else {
          out << ')';
          stack.pop_back();
        }
        continue;
    }
  }
}

}  // namespace

ExprNode::~ExprNode() {
  std::vector<std::shared_ptr<const ExprNode>> pending;
  if (lhs) {
    pending.push_back(std::move(lhs));
  }
  if (rhs) {
    pending.push_back(std::move(rhs));
  }

  while (!pending.empty()) {
    std::shared_ptr<const ExprNode> node = std::move(pending.back());
    pending.pop_back();
    if (node.use_count() != 1) {
      continue;
    }
    // Sole owner: detach the children so this node dies without recursing.
    // Every node is created non-const by make_shared, so the cast is well defined.
    auto& owned = const_cast<ExprNode&>(*node);
    if (owned.lhs) {
      pending.push_back(std::move(owned.lhs));
    }
    if (owned.rhs) {
      pending.push_back(std::move(owned.rhs));
    }
  }
}

Expression::Expression(const UncertainValue& value) {
  auto node = std::make_shared<ExprNode>();
  node->kind = NodeKind::Value;
  node->value = value;
  node_ = std::move(node);
}

Expression::Expression(double constant) {
  auto node = std::make_shared<ExprNode>();
  node->kind = NodeKind::Constant;
  node->constant = constant;
  node_ = std::move(node);
}

Expression::Expression(std::shared_ptr<const ExprNode> node) : node_(std::move(node)) {}

Expression Expression::binary(NodeKind kind, const Expression& lhs, const Expression& rhs) {
  switch (kind) {
    case NodeKind::Add:
    case NodeKind::Sub:
    case NodeKind::Mul:
    case NodeKind::Div:
    case NodeKind::Pow:
    case NodeKind::Min:
    case NodeKind::Max:
      break;
    default:
      throw InvalidParameterError("Node kind is not a binary operation");
  }

  auto node = std::make_shared<ExprNode>();
  node->kind = kind;
  node->lhs = lhs.node_;
  node->rhs = rhs.node_;
  return Expression(std::move(node));
}

Expression Expression::unary(UnaryFunction function, const Expression& operand) {
  auto node = std::make_shared<ExprNode>();
  node->kind = NodeKind::Unary;
  node->function = function;
  node->lhs = operand.node_;
  return Expression(std::move(node));
}

Expression Expression::negate(const Expression& operand) {
  auto node = std::make_shared<ExprNode>();
  node->kind = NodeKind::Neg;
  node->lhs = operand.node_;
  return Expression(std::move(node));
}

std::vector<const ExprNode*> Expression::postorder() const {
  std::vector<const ExprNode*> order;
  std::vector<std::pair<const ExprNode*, bool>> stack;
  stack.emplace_back(node_.get(), false);

  while (!stack.empty()) {
    const auto [node, expanded] = stack.back();
    stack.pop_back();
    if (expanded) {
      order.push_back(node);
      continue;
    }
    stack.emplace_back(node, true);
    if (node->rhs) {
      stack.emplace_back(node->rhs.get(), false);
    }
    if (node->lhs) {
      stack.emplace_back(node->lhs.get(), false);
    }
  }
  return order;
}

std::vector<UncertainValue> Expression::values() const {
  std::unordered_set<const void*> seen;
  std::vector<UncertainValue> out;
  for (const ExprNode* node : postorder()) {
    if (node->kind == NodeKind::Value && seen.insert(node->value->identity()).second) {
      out.push_back(*node->value);
    }
  }
  return out;
}

bool Expression::is_constant() const {
  for (const auto& value : values()) {
    if (!value.is_exact()) {
      return false;
    }
  }
  return true;
}

std::size_t Expression::node_count() const {
  return postorder().size();
}

std::string Expression::to_string() const {
  std::ostringstream out;
  out.precision(12);
  write_tree(*node_, out);
  return out.str();
}

std::string function_name(UnaryFunction function) {
  switch (function) {
    case UnaryFunction::Sqrt:
      return "sqrt";
    case UnaryFunction::Log:
      return "log";
    case UnaryFunction::Log10:
      return "log10";
    case UnaryFunction::Exp:
      return "exp";
    case UnaryFunction::Sin:
      return "sin";
    case UnaryFunction::Cos:
      return "cos";
    case UnaryFunction::Tan:
      return "tan";
    case UnaryFunction::Asin:
      return "asin";
    case UnaryFunction::Acos:
      return "acos";
    case UnaryFunction::Atan:
      return "atan";
    case UnaryFunction::Sinh:
      return "sinh";
    case UnaryFunction::Cosh:
      return "cosh";
    case UnaryFunction::Tanh:
      return "tanh";
    case UnaryFunction::Abs:
      return "abs";
  }
  return "unknown";
}

std::optional<UnaryFunction> parse_unary_function(std::string_view name) {
  static const std::pair<std::string_view, UnaryFunction> table[] = {
      {"sqrt", UnaryFunction::Sqrt}, {"log", UnaryFunction::Log},   {"log10", UnaryFunction::Log10},
      {"exp", UnaryFunction::Exp},   {"sin", UnaryFunction::Sin},   {"cos", UnaryFunction::Cos},
      {"tan", UnaryFunction::Tan},   {"asin", UnaryFunction::Asin}, {"acos", UnaryFunction::Acos},
      {"atan", UnaryFunction::Atan}, {"sinh", UnaryFunction::Sinh}, {"cosh", UnaryFunction::Cosh},
      {"tanh", UnaryFunction::Tanh}, {"abs", UnaryFunction::Abs},
  };
  for (const auto& [key, function] : table) {
    if (key == name) {
      return function;
    }
  }
  return std::nullopt;
}

// Domain errors come back as NaN (or inf), never as exceptions.
double apply_unary(UnaryFunction function, double value) {
  switch (function) {
    case UnaryFunction::Sqrt:
      return std::sqrt(value);
    case UnaryFunction::Log:
      return std::log(value);
    case UnaryFunction::Log10:
      return std::log10(value);
    case UnaryFunction::Exp:
      return std::exp(value);
    case UnaryFunction::Sin:
      return std::sin(value);
    case UnaryFunction::Cos:
      return std::cos(value);
    case UnaryFunction::Tan:
      return std::tan(value);
    case UnaryFunction::Asin:
      return std::asin(value);
    case UnaryFunction::Acos:
      return std::acos(value);
    case UnaryFunction::Atan:
      return std::atan(value);
    case UnaryFunction::Sinh:
      return std::sinh(value);
    case UnaryFunction::Cosh:
      return std::cosh(value);
    case UnaryFunction::Tanh:
      return std::tanh(value);
    case UnaryFunction::Abs:
      return std::fabs(value);
  }
  return std::numeric_limits<double>::quiet_NaN();
}

Expression operator+(const Expression& lhs, const Expression& rhs) {
  return Expression::binary(NodeKind::Add, lhs, rhs);
}

Expression operator-(const Expression& lhs, const Expression& rhs) {
  return Expression::binary(NodeKind::Sub, lhs, rhs);
}

Expression operator*(const Expression& lhs, const Expression& rhs) {
  return Expression::binary(NodeKind::Mul, lhs, rhs);
}

Expression operator/(const Expression& lhs, const Expression& rhs) {
  return Expression::binary(NodeKind::Div, lhs, rhs);
}

Expression operator-(const Expression& operand) {
  return Expression::negate(operand);
}

Expression operator+(const Expression& operand) {
  return operand;
}

Expression pow(const Expression& base, const Expression& exponent) {
  return Expression::binary(NodeKind::Pow, base, exponent);
}

Expression min(const Expression& lhs, const Expression& rhs) {
  return Expression::binary(NodeKind::Min, lhs, rhs);
}

Expression max(const Expression& lhs, const Expression& rhs) {
  return Expression::binary(NodeKind::Max, lhs, rhs);
}

Expression sqrt(const Expression& operand) {
  return Expression::unary(UnaryFunction::Sqrt, operand);
}

Expression log(const Expression& operand) {
  return Expression::unary(UnaryFunction::Log, operand);
}

Expression log10(const Expression& operand) {
  return Expression::unary(UnaryFunction::Log10, operand);
}

Expression exp(const Expression& operand) {
  return Expression::unary(UnaryFunction::Exp, operand);
}

Expression sin(const Expression& operand) {
  return Expression::unary(UnaryFunction::Sin, operand);
}

Expression cos(const Expression& operand) {
  return Expression::unary(UnaryFunction::Cos, operand);
}

Expression tan(const Expression& operand) {
  return Expression::unary(UnaryFunction::Tan, operand);
}

Expression asin(const Expression& operand) {
  return Expression::unary(UnaryFunction::Asin, operand);
}

Expression acos(const Expression& operand) {
  return Expression::unary(UnaryFunction::Acos, operand);
}

Expression atan(const Expression& operand) {
  return Expression::unary(UnaryFunction::Atan, operand);
}

Expression sinh(const Expression& operand) {
  return Expression::unary(UnaryFunction::Sinh, operand);
}

Expression cosh(const Expression& operand) {
  return Expression::unary(UnaryFunction::Cosh, operand);
}

Expression tanh(const Expression& operand) {
  return Expression::unary(UnaryFunction::Tanh, operand);
}

Expression abs(const Expression& operand) {
  return Expression::unary(UnaryFunction::Abs, operand);
}

}  // namespace asymunc
