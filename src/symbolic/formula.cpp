#include "asymunc/symbolic/formula.hpp"

#include <cctype>
#include <charconv>
#include <numbers>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>

#include "asymunc/core/errors.hpp"

namespace asymunc {
namespace {

enum class TokenType {
  Number,
  Identifier,
  Operator,
  LeftParen,
  RightParen,
  Comma,
  Function,
};

struct Token {
  TokenType type = TokenType::Number;
  std::string text;
  double number = 0.0;
};

bool is_identifier_start(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_identifier_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

double parse_number(const std::string& text) {
  double value = 0.0;
#if defined(__cpp_lib_to_chars) && __cpp_lib_to_chars >= 201611L
  const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
  if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
    throw InvalidParameterError("Invalid number literal: " + text);
  }
#else
  std::size_t consumed = 0;
  try {
    value = std::stod(text, &consumed);
  } catch (const std::exception&) {
    throw InvalidParameterError("Invalid number literal: " + text);
  }
  if (consumed != text.size()) {
    throw InvalidParameterError("Invalid number literal: " + text);
  }
#endif
  return value;
}

std::vector<Token> tokenize(std::string_view text) {
  std::vector<Token> tokens;
  std::size_t i = 0;

  while (i < text.size()) {
    const char c = text[i];
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      ++i;
      continue;
    }

    if (std::isdigit(static_cast<unsigned char>(c)) != 0 || c == '.') {
      const std::size_t begin = i;
      bool saw_exp = false;
      ++i;
      while (i < text.size()) {
        const char d = text[i];
        if (std::isdigit(static_cast<unsigned char>(d)) != 0 || d == '.') {
          ++i;
          continue;
        }
        if ((d == 'e' || d == 'E') && !saw_exp) {
          saw_exp = true;
          ++i;
          if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
            ++i;
          }
          continue;
        }
        break;
      }

      std::string number_text(text.substr(begin, i - begin));
      const double value = parse_number(number_text);
      tokens.push_back(Token{TokenType::Number, std::move(number_text), value});
      continue;
    }

    if (is_identifier_start(c)) {
      const std::size_t begin = i;
      ++i;
      while (i < text.size() && is_identifier_char(text[i])) {
        ++i;
      }
      tokens.push_back(Token{TokenType::Identifier, std::string(text.substr(begin, i - begin)), 0.0});
      continue;
    }

    switch (c) {
      case '(':
        tokens.push_back(Token{TokenType::LeftParen, "(", 0.0});
        break;
      case ')':
        tokens.push_back(Token{TokenType::RightParen, ")", 0.0});
        break;
      case ',':
        tokens.push_back(Token{TokenType::Comma, ",", 0.0});
        break;
      case '+':
      case '-':
      case '*':
      case '/':
      case '^':
        tokens.push_back(Token{TokenType::Operator, std::string(1, c), 0.0});
        break;
      default:
        throw InvalidParameterError(std::string("Unsupported character in formula: ") + c);
    }
    ++i;
  }

  return tokens;
}

bool is_unary_operator(std::string_view op) {
  return op == "neg" || op == "pos";
}

int precedence(std::string_view op) {
  if (op == "^") {
    return 5;
  }
  if (is_unary_operator(op)) {
    return 4;
  }
  if (op == "*" || op == "/") {
    return 3;
  }
  if (op == "+" || op == "-") {
    return 2;
  }
  return 0;
}

bool right_associative(std::string_view op) {
  return op == "^" || is_unary_operator(op);
}

int function_arity(std::string_view name) {
  if (parse_unary_function(name).has_value()) {
    return 1;
  }
  if (name == "pow" || name == "min" || name == "max") {
    return 2;
  }
  return 0;
}

bool ends_operand(TokenType type) {
  return type == TokenType::Number || type == TokenType::Identifier || type == TokenType::RightParen;
}

// One entry per open parenthesis; function calls count their arguments.
struct OpenGroup {
  std::string function;
  std::size_t arguments = 1;
};

std::vector<Token> to_rpn(const std::vector<Token>& input) {
  std::vector<Token> output;
  std::vector<Token> stack;
  std::vector<OpenGroup> groups;
  stack.reserve(input.size());

  TokenType prev = TokenType::Comma;

  for (std::size_t i = 0; i < input.size(); ++i) {
    Token token = input[i];

    if (token.type == TokenType::Identifier && i + 1 < input.size() && input[i + 1].type == TokenType::LeftParen) {
      if (function_arity(token.text) == 0) {
        throw InvalidParameterError("Unknown function: " + token.text);
      }
      token.type = TokenType::Function;
    }

    switch (token.type) {
      case TokenType::Number:
      case TokenType::Identifier:
      case TokenType::Function:
        if (ends_operand(prev)) {
          throw InvalidParameterError("Missing operator before: " + token.text);
        }
        if (token.type == TokenType::Function) {
          stack.push_back(token);
        } else {
          output.push_back(token);
        }
        prev = token.type;
        break;
      case TokenType::Comma:
        if (!ends_operand(prev)) {
          throw InvalidParameterError("Missing function argument before ','");
        }
        while (!stack.empty() && stack.back().type != TokenType::LeftParen) {
          output.push_back(stack.back());
          stack.pop_back();
        }
        if (groups.empty() || groups.back().function.empty()) {
          throw InvalidParameterError("Comma outside function argument list");
        }
        ++groups.back().arguments;
        prev = token.type;
        break;
      case TokenType::Operator: {
        const bool prefix = !ends_operand(prev);
        if (prefix && (token.text == "-" || token.text == "+")) {
          token.text = token.text == "-" ? "neg" : "pos";
          stack.push_back(token);
          prev = TokenType::Operator;
          break;
        }
        if (prefix) {
          throw InvalidParameterError("Operator without left operand: " + token.text);
        }

        while (!stack.empty() && stack.back().type == TokenType::Operator) {
          const Token& top = stack.back();
          const bool should_pop = right_associative(token.text)
                                      ? (precedence(token.text) < precedence(top.text))
                                      : (precedence(token.text) <= precedence(top.text));
          if (!should_pop) {
            break;
          }
          output.push_back(top);
          stack.pop_back();
        }

        stack.push_back(token);
        prev = TokenType::Operator;
        break;
      }
      case TokenType::LeftParen:
        if (ends_operand(prev)) {
          throw InvalidParameterError("Missing operator before '('");
        }
        groups.push_back(OpenGroup{prev == TokenType::Function ? stack.back().text : std::string(), 1});
        stack.push_back(token);
        prev = token.type;
        break;
      case TokenType::RightParen: {
        if (!ends_operand(prev)) {
          throw InvalidParameterError("Missing operand before ')'");
        }
        while (!stack.empty() && stack.back().type != TokenType::LeftParen) {
          output.push_back(stack.back());
          stack.pop_back();
        }
        if (stack.empty()) {
          throw InvalidParameterError("Mismatched parenthesis");
        }
        stack.pop_back();

        const OpenGroup group = groups.back();
        groups.pop_back();
        if (!group.function.empty()) {
          const auto expected = static_cast<std::size_t>(function_arity(group.function));
          if (group.arguments != expected) {
            throw InvalidParameterError(
                "Function " + group.function + " expects " + std::to_string(expected) + " argument(s), got " +
                std::to_string(group.arguments));
          }
          output.push_back(stack.back());
          stack.pop_back();
        }
        prev = token.type;
        break;
      }
    }
  }

  while (!stack.empty()) {
    if (stack.back().type == TokenType::LeftParen || stack.back().type == TokenType::RightParen) {
      throw InvalidParameterError("Mismatched parenthesis");
    }
    output.push_back(stack.back());
    stack.pop_back();
  }

  return output;
}

OpCode binary_opcode(const std::string& op) {
  if (op == "+") {
    return OpCode::Add;
  }
  if (op == "-") {
    return OpCode::Sub;
  }
  if (op == "*") {
    return OpCode::Mul;
  }
  if (op == "/") {
    return OpCode::Div;
  }
  if (op == "^") {
    return OpCode::Pow;
  }
  throw InvalidParameterError("Unsupported operator: " + op);
}

Expression resolve_symbol(const std::string& name, const Bindings& bindings) {
  if (const auto it = bindings.find(name); it != bindings.end()) {
    return Expression(it->second);
  }
  if (name == "pi") {
    return Expression(std::numbers::pi);
  }
  if (name == "e") {
    return Expression(std::numbers::e);
  }
  throw InvalidParameterError("Unbound symbol in formula: " + name);
}

Expression apply_function2(const std::string& name, const Expression& lhs, const Expression& rhs) {
  if (name == "pow") {
    return pow(lhs, rhs);
  }
  if (name == "min") {
    return min(lhs, rhs);
  }
  if (name == "max") {
    return max(lhs, rhs);
  }
  throw InvalidParameterError("Unsupported binary function: " + name);
}

}  // namespace

Formula Formula::compile(std::string_view text) {
  Formula formula;
  const auto tokens = tokenize(text);
  const auto rpn = to_rpn(tokens);

  std::ostringstream canonical;
  bool first = true;
  std::vector<Instruction> program;
  program.reserve(rpn.size());

  std::size_t stack_depth = 0;
  for (const auto& token : rpn) {
    if (token.type == TokenType::Operator && token.text == "pos") {
      if (stack_depth < 1) {
        throw InvalidParameterError("Invalid unary expression in formula");
      }
      continue;
    }

    if (!first) {
      canonical << ' ';
    }
    canonical << token.text;
    first = false;

    Instruction instruction;
    if (token.type == TokenType::Number) {
      instruction.op = OpCode::PushConstant;
      instruction.constant_value = token.number;
      ++stack_depth;
    } else if (token.type == TokenType::Identifier) {
      instruction.op = OpCode::PushSymbol;
      instruction.symbol = token.text;
      ++stack_depth;
    } else if (token.type == TokenType::Operator) {
      if (token.text == "neg") {
        if (stack_depth < 1) {
          throw InvalidParameterError("Invalid unary expression in formula");
        }
        instruction.op = OpCode::Neg;
      } else {
        if (stack_depth < 2) {
          throw InvalidParameterError("Operator is missing an operand: " + token.text);
        }
        instruction.op = binary_opcode(token.text);
        --stack_depth;
      }
    } else if (token.type == TokenType::Function) {
      const int arity = function_arity(token.text);
      instruction.symbol = token.text;
      instruction.op = arity == 1 ? OpCode::Func1 : OpCode::Func2;
      if (stack_depth < static_cast<std::size_t>(arity)) {
        throw InvalidParameterError("Function is missing arguments: " + token.text);
      }
      stack_depth -= static_cast<std::size_t>(arity - 1);
    } else {
      throw InvalidParameterError("Unexpected token in formula: " + token.text);
    }

    program.push_back(std::move(instruction));
  }

  if (stack_depth != 1) {
    throw InvalidParameterError("Formula does not reduce to a single expression: " + std::string(text));
  }

  formula.canonical_ = canonical.str();
  formula.bytecode_ = std::move(program);
  return formula;
}

Expression Formula::bind(const Bindings& bindings) const {
  if (bytecode_.empty()) {
    throw InvalidParameterError("Formula is empty");
  }

  std::vector<Expression> stack;
  stack.reserve(bytecode_.size());

  auto pop = [&stack]() {
    Expression top = stack.back();
    stack.pop_back();
    return top;
  };

  for (const auto& instruction : bytecode_) {
    switch (instruction.op) {
      case OpCode::PushConstant:
        stack.emplace_back(instruction.constant_value);
        break;
      case OpCode::PushSymbol:
        stack.push_back(resolve_symbol(instruction.symbol, bindings));
        break;
      case OpCode::Add:
      case OpCode::Sub:
      case OpCode::Mul:
      case OpCode::Div:
      case OpCode::Pow: {
        const Expression rhs = pop();
        const Expression lhs = pop();
        switch (instruction.op) {
          case OpCode::Add:
            stack.push_back(lhs + rhs);
            break;
          case OpCode::Sub:
            stack.push_back(lhs - rhs);
            break;
          case OpCode::Mul:
            stack.push_back(lhs * rhs);
            break;
          case OpCode::Div:
            stack.push_back(lhs / rhs);
            break;
          default:
            stack.push_back(pow(lhs, rhs));
            break;
        }
        break;
      }
      case OpCode::Neg:
        stack.push_back(-pop());
        break;
      case OpCode::Func1: {
        const Expression operand = pop();
        stack.push_back(Expression::unary(*parse_unary_function(instruction.symbol), operand));
        break;
      }
      case OpCode::Func2: {
        const Expression rhs = pop();
        const Expression lhs = pop();
        stack.push_back(apply_function2(instruction.symbol, lhs, rhs));
        break;
      }
    }
  }

  return stack.back();
}

std::vector<std::string> Formula::symbols() const {
  std::vector<std::string> names;
  std::unordered_set<std::string> seen;
  for (const auto& instruction : bytecode_) {
    if (instruction.op == OpCode::PushSymbol && seen.insert(instruction.symbol).second) {
      names.push_back(instruction.symbol);
    }
  }
  return names;
}

Expression compile_expression(std::string_view text, const Bindings& bindings) {
  return Formula::compile(text).bind(bindings);
}

}  // namespace asymunc
