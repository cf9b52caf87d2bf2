// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "core/expression.h"

#include <cctype>
#include <limits>
#include <utility>

#include "core/exceptions.h"

namespace cyclespitter {
namespace core {

namespace {

constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
constexpr int64_t kMin = std::numeric_limits<int64_t>::min();

// Applies `op` to lhs and rhs; returns false when the result does not fit
bool Apply(char op, int64_t lhs, int64_t rhs, int64_t* result) {
  switch (op) {
    case '+':
      if ((rhs > 0 && lhs > kMax - rhs) || (rhs < 0 && lhs < kMin - rhs)) {
        return false;
      }
      *result = lhs + rhs;
      return true;
    case '-':
      if ((rhs < 0 && lhs > kMax + rhs) || (rhs > 0 && lhs < kMin + rhs)) {
        return false;
      }
      *result = lhs - rhs;
      return true;
    case '*':
      if (lhs != 0 && rhs != 0) {
        if (lhs > 0 ? (rhs > 0 ? lhs > kMax / rhs : rhs < kMin / lhs)
                    : (rhs > 0 ? lhs < kMin / rhs : lhs < kMax / rhs)) {
          return false;
        }
      }
      *result = lhs * rhs;
      return true;
    case '/':
      if (lhs == kMin && rhs == -1) {
        return false;
      }
      *result = lhs / rhs;
      return true;
  }
  return false;
}

}  // namespace

// Recursive descent parser emitting postfix tokens
class ExpressionParser {
 public:
  ExpressionParser(const std::string& text, int line_number)
      : text_(text), pos_(0), line_number_(line_number) {}

  std::vector<Expression::Token> Parse() {
    SkipSpaces();
    if (AtEnd()) {
      Fail("empty expression");
    }
    ParseSum();
    SkipSpaces();
    if (!AtEnd()) {
      Fail(std::string("unexpected '") + text_[pos_] + "'");
    }
    return std::move(out_);
  }

 private:
  void ParseSum() {
    ParseProduct();
    for (;;) {
      SkipSpaces();
      if (AtEnd() || (text_[pos_] != '+' && text_[pos_] != '-')) {
        return;
      }
      char op = text_[pos_++];
      ParseProduct();
      EmitOperator(op);
    }
  }

  void ParseProduct() {
    ParseUnary();
    for (;;) {
      SkipSpaces();
      if (AtEnd() || (text_[pos_] != '*' && text_[pos_] != '/')) {
        return;
      }
      char op = text_[pos_++];
      ParseUnary();
      EmitOperator(op);
    }
  }

  void ParseUnary() {
    SkipSpaces();
    if (!AtEnd() && text_[pos_] == '-') {
      ++pos_;
      ParseUnary();
      Expression::Token token;
      token.type = Expression::TokenType::NEGATE;
      out_.push_back(token);
      return;
    }
    if (!AtEnd() && text_[pos_] == '+') {
      ++pos_;
      ParseUnary();
      return;
    }
    ParsePrimary();
  }

  void ParsePrimary() {
    SkipSpaces();
    if (AtEnd()) {
      Fail("operand expected");
    }

    char c = text_[pos_];
    if (c == '(') {
      ++pos_;
      ParseSum();
      SkipSpaces();
      if (AtEnd() || text_[pos_] != ')') {
        Fail("missing ')'");
      }
      ++pos_;
      return;
    }

    if (c == '$') {
      ++pos_;
      EmitNumber(ParseDigits(16, "hex"));
      return;
    }
    if (c == '%') {
      ++pos_;
      EmitNumber(ParseDigits(2, "binary"));
      return;
    }
    if (std::isdigit(static_cast<unsigned char>(c))) {
      if (c == '0' && pos_ + 1 < text_.size() &&
          (text_[pos_ + 1] == 'x' || text_[pos_ + 1] == 'X')) {
        pos_ += 2;
        EmitNumber(ParseDigits(16, "hex"));
        return;
      }
      EmitNumber(ParseDigits(10, "decimal"));
      return;
    }
    if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
      size_t start = pos_;
      while (!AtEnd() && (std::isalnum(static_cast<unsigned char>(text_[pos_])) ||
                          text_[pos_] == '_')) {
        ++pos_;
      }
      Expression::Token token;
      token.type = Expression::TokenType::VARIABLE;
      token.name = text_.substr(start, pos_ - start);
      out_.push_back(token);
      return;
    }

    Fail(std::string("unexpected '") + c + "'");
  }

  int64_t ParseDigits(int base, const char* what) {
    int64_t value = 0;
    size_t start = pos_;
    while (!AtEnd()) {
      int digit = DigitValue(text_[pos_]);
      if (digit < 0 || digit >= base) {
        break;
      }
      if (value > (kMax - digit) / base) {
        Fail(std::string(what) + " literal out of range");
      }
      value = value * base + digit;
      ++pos_;
    }
    if (pos_ == start) {
      Fail(std::string("invalid ") + what + " literal");
    }
    // Reject trailing identifier characters such as "12ab"
    if (!AtEnd() && (std::isalnum(static_cast<unsigned char>(text_[pos_])) ||
                     text_[pos_] == '_')) {
      Fail(std::string("invalid ") + what + " literal");
    }
    return value;
  }

  static int DigitValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  }

  void EmitNumber(int64_t value) {
    Expression::Token token;
    token.type = Expression::TokenType::NUMBER;
    token.value = value;
    out_.push_back(token);
  }

  void EmitOperator(char op) {
    Expression::Token token;
    token.type = Expression::TokenType::BINARY_OP;
    token.op = op;
    out_.push_back(token);
  }

  void SkipSpaces() {
    while (!AtEnd() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
      ++pos_;
    }
  }

  bool AtEnd() const { return pos_ >= text_.size(); }

  [[noreturn]] void Fail(const std::string& reason) const {
    throw MalformedLineException(
        "bad expression '" + text_ + "': " + reason, line_number_);
  }

  const std::string& text_;
  size_t pos_;
  int line_number_;
  std::vector<Expression::Token> out_;
};

Expression Expression::Parse(const std::string& text, int line_number) {
  Expression expr;
  expr.text_ = text;
  ExpressionParser parser(expr.text_, line_number);
  expr.rpn_ = parser.Parse();
  return expr;
}

int64_t Expression::Evaluate(const VariableScope& scope, int line_number,
                             const std::string& rept_path) const {
  std::vector<int64_t> stack;
  stack.reserve(rpn_.size());

  for (const auto& token : rpn_) {
    switch (token.type) {
      case TokenType::NUMBER:
        stack.push_back(token.value);
        break;
      case TokenType::VARIABLE: {
        auto it = scope.find(token.name);
        if (it == scope.end()) {
          throw UndefinedVariableException(token.name, line_number, rept_path);
        }
        stack.push_back(it->second);
        break;
      }
      case TokenType::NEGATE:
        if (stack.back() == kMin) {
          throw MalformedLineException(
              "arithmetic overflow in '" + text_ + "'", line_number, rept_path);
        }
        stack.back() = -stack.back();
        break;
      case TokenType::BINARY_OP: {
        int64_t rhs = stack.back();
        stack.pop_back();
        int64_t lhs = stack.back();
        if (token.op == '/' && rhs == 0) {
          throw MalformedLineException(
              "division by zero in '" + text_ + "'", line_number, rept_path);
        }
        if (!Apply(token.op, lhs, rhs, &stack.back())) {
          throw MalformedLineException(
              "arithmetic overflow in '" + text_ + "'", line_number, rept_path);
        }
        break;
      }
    }
  }

  if (stack.size() != 1) {
    throw MalformedLineException("bad expression '" + text_ + "'", line_number,
                                 rept_path);
  }
  return stack.back();
}

std::vector<std::string> Expression::Variables() const {
  std::vector<std::string> names;
  for (const auto& token : rpn_) {
    if (token.type == TokenType::VARIABLE) {
      names.push_back(token.name);
    }
  }
  return names;
}

bool IsIdentifier(const std::string& name) {
  if (name.empty()) {
    return false;
  }
  if (!std::isalpha(static_cast<unsigned char>(name[0])) && name[0] != '_') {
    return false;
  }
  for (char c : name) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
      return false;
    }
  }
  return true;
}

}  // namespace core
}  // namespace cyclespitter
