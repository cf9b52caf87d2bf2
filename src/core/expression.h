// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef CYCLESPITTER_CORE_EXPRESSION_H_
#define CYCLESPITTER_CORE_EXPRESSION_H_

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace cyclespitter {
namespace core {

// Integer variables visible to a REPT frame (name -> value)
using VariableScope = std::map<std::string, int64_t>;

// Integer arithmetic expression used by REPT counts and SET assignments.
//
// Supports + - * / with the usual precedence, unary minus, parentheses,
// decimal, $hex, 0xhex and %binary literals, and variable references.
// The text is parsed once into postfix form; evaluation is repeatable
// against different scopes.
class Expression {
 public:
  Expression() = default;

  // Parse expression text.
  // Throws MalformedLineException on syntax errors.
  static Expression Parse(const std::string& text, int line_number = 0);

  // Evaluate against a variable scope.
  // Throws UndefinedVariableException for unknown names and
  // MalformedLineException on division by zero.
  int64_t Evaluate(const VariableScope& scope, int line_number = 0,
                   const std::string& rept_path = "") const;

  // Names referenced by the expression, in order of appearance
  std::vector<std::string> Variables() const;

  const std::string& text() const { return text_; }
  bool empty() const { return rpn_.empty(); }

 private:
  enum class TokenType { NUMBER, VARIABLE, BINARY_OP, NEGATE };

  struct Token {
    TokenType type = TokenType::NUMBER;
    int64_t value = 0;
    std::string name;
    char op = 0;
  };

  friend class ExpressionParser;

  std::string text_;
  std::vector<Token> rpn_;
};

// True if `name` is a valid variable identifier ([A-Za-z_][A-Za-z0-9_]*)
bool IsIdentifier(const std::string& name);

}  // namespace core
}  // namespace cyclespitter

#endif  // CYCLESPITTER_CORE_EXPRESSION_H_
