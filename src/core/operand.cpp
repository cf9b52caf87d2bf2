// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "core/operand.h"

#include <bitset>
#include <cctype>

namespace cyclespitter {
namespace core {

namespace {

bool IsIdentStart(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool IsIdentChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Register number 0-15 (d0-d7 = 0-7, a0-a7/sp = 8-15), or -1
int RegisterNumber(const std::string& token) {
  std::string t = ToLower(token);
  if (t == "sp") {
    return 15;
  }
  if (t.size() == 2 && t[1] >= '0' && t[1] <= '7') {
    if (t[0] == 'd') return t[1] - '0';
    if (t[0] == 'a') return 8 + (t[1] - '0');
  }
  return -1;
}

// Index register with optional size and scale: "d0", "d0.w", "a1.l*4"
bool IsIndexRegister(const std::string& token) {
  std::string t = ToLower(token);
  size_t star = t.find('*');
  if (star != std::string::npos) {
    t = t.substr(0, star);
  }
  if (t.size() > 2 && (t.substr(t.size() - 2) == ".w" ||
                       t.substr(t.size() - 2) == ".l")) {
    t = t.substr(0, t.size() - 2);
  }
  return RegisterNumber(t) >= 0;
}

std::string StripSpaces(const std::string& text) {
  std::string result;
  result.reserve(text.size());
  for (char c : text) {
    if (!std::isspace(static_cast<unsigned char>(c))) {
      result += c;
    }
  }
  return result;
}

bool EndsWith(const std::string& text, const std::string& suffix) {
  return text.size() >= suffix.size() &&
         text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

AddressingMode ClassifyAbsolute(const std::string& s) {
  if (EndsWith(s, ".w")) {
    return AddressingMode::ABSOLUTE_SHORT;
  }
  return AddressingMode::ABSOLUTE_LONG;
}

}  // namespace

std::string ToLower(const std::string& text) {
  std::string result = text;
  for (char& c : result) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return result;
}

std::string Trim(const std::string& text) {
  size_t start = 0;
  while (start < text.size() &&
         std::isspace(static_cast<unsigned char>(text[start]))) {
    ++start;
  }
  size_t end = text.size();
  while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  return text.substr(start, end - start);
}

std::vector<std::string> SplitOperands(const std::string& text) {
  std::vector<std::string> operands;
  std::string current;
  int depth = 0;
  char quote = 0;

  for (char c : text) {
    if (quote != 0) {
      current += c;
      if (c == quote) {
        quote = 0;
      }
      continue;
    }
    if (c == '\'' || c == '"') {
      quote = c;
    } else if (c == '(') {
      ++depth;
    } else if (c == ')') {
      if (depth > 0) --depth;
    } else if (c == ',' && depth == 0) {
      operands.push_back(Trim(current));
      current.clear();
      continue;
    }
    current += c;
  }

  std::string last = Trim(current);
  if (!last.empty() || !operands.empty()) {
    operands.push_back(last);
  }
  return operands;
}

bool IsDataRegister(const std::string& token) {
  int n = RegisterNumber(token);
  return n >= 0 && n < 8;
}

bool IsAddressRegister(const std::string& token) {
  return RegisterNumber(token) >= 8;
}

bool IsRegisterName(const std::string& token) {
  if (RegisterNumber(token) >= 0) {
    return true;
  }
  std::string t = ToLower(token);
  return t == "pc" || t == "sr" || t == "ccr" || t == "usp";
}

std::optional<int> CountRegisters(const std::string& operand) {
  std::string s = ToLower(StripSpaces(operand));
  if (s.empty()) {
    return std::nullopt;
  }

  std::bitset<16> mask;
  size_t start = 0;
  while (start <= s.size()) {
    size_t slash = s.find('/', start);
    std::string element = s.substr(
        start, slash == std::string::npos ? std::string::npos : slash - start);
    if (element.empty()) {
      return std::nullopt;
    }

    size_t dash = element.find('-');
    if (dash == std::string::npos) {
      int reg = RegisterNumber(element);
      if (reg < 0) {
        return std::nullopt;
      }
      mask.set(reg);
    } else {
      int lo = RegisterNumber(element.substr(0, dash));
      int hi = RegisterNumber(element.substr(dash + 1));
      // A range never crosses from data to address registers
      if (lo < 0 || hi < 0 || lo > hi || (lo < 8) != (hi < 8)) {
        return std::nullopt;
      }
      for (int reg = lo; reg <= hi; ++reg) {
        mask.set(reg);
      }
    }

    if (slash == std::string::npos) {
      break;
    }
    start = slash + 1;
  }
  return static_cast<int>(mask.count());
}

AddressingMode ClassifyOperand(const std::string& operand) {
  std::string s = ToLower(StripSpaces(operand));
  if (s.empty()) {
    return AddressingMode::UNKNOWN;
  }

  if (s[0] == '#') {
    return AddressingMode::IMMEDIATE;
  }
  if (s == "sr") return AddressingMode::STATUS_REGISTER;
  if (s == "ccr") return AddressingMode::CONDITION_CODES;
  if (s == "usp") return AddressingMode::USER_STACK;
  if (IsDataRegister(s)) return AddressingMode::DATA_REGISTER;
  if (IsAddressRegister(s)) return AddressingMode::ADDRESS_REGISTER;

  if ((s.find('/') != std::string::npos || s.find('-') != std::string::npos) &&
      s.find('(') == std::string::npos && CountRegisters(s).has_value()) {
    return AddressingMode::REGISTER_LIST;
  }

  if (s.size() > 3 && s.compare(0, 2, "-(") == 0 && s.back() == ')' &&
      IsAddressRegister(s.substr(2, s.size() - 3))) {
    return AddressingMode::PRE_DECREMENT;
  }
  if (s.size() > 3 && s[0] == '(' && EndsWith(s, ")+") &&
      IsAddressRegister(s.substr(1, s.size() - 3))) {
    return AddressingMode::POST_INCREMENT;
  }

  if (s.back() != ')') {
    return ClassifyAbsolute(s);
  }

  // Find the parenthesis opening the trailing group
  int depth = 0;
  size_t open = std::string::npos;
  for (size_t i = s.size(); i-- > 0;) {
    if (s[i] == ')') {
      ++depth;
    } else if (s[i] == '(') {
      if (--depth == 0) {
        open = i;
        break;
      }
    }
  }
  if (open == std::string::npos) {
    return AddressingMode::UNKNOWN;
  }

  std::string displacement = s.substr(0, open);
  std::vector<std::string> parts =
      SplitOperands(s.substr(open + 1, s.size() - open - 2));
  if (parts.empty()) {
    return AddressingMode::UNKNOWN;
  }

  // Old syntax d(an,xn) or new syntax (d,an,xn)
  std::string base;
  size_t index_pos = 1;
  if (IsAddressRegister(parts[0]) || parts[0] == "pc") {
    base = parts[0];
  } else if (parts.size() >= 2 &&
             (IsAddressRegister(parts[1]) || parts[1] == "pc")) {
    displacement += parts[0];
    base = parts[1];
    index_pos = 2;
  } else {
    // Parenthesized expression such as (SCREEN+8), not register indirect
    return ClassifyAbsolute(s);
  }

  bool indexed = false;
  if (parts.size() > index_pos) {
    if (parts.size() > index_pos + 1 || !IsIndexRegister(parts[index_pos])) {
      return AddressingMode::UNKNOWN;
    }
    indexed = true;
  }

  if (base == "pc") {
    return indexed ? AddressingMode::PC_INDEXED
                   : AddressingMode::PC_DISPLACEMENT;
  }
  if (indexed) {
    return AddressingMode::INDEXED;
  }
  return displacement.empty() ? AddressingMode::INDIRECT
                              : AddressingMode::DISPLACEMENT;
}

std::string AddressingModeShape(AddressingMode mode) {
  switch (mode) {
    case AddressingMode::DATA_REGISTER:
      return "dn";
    case AddressingMode::ADDRESS_REGISTER:
      return "an";
    case AddressingMode::INDIRECT:
      return "(an)";
    case AddressingMode::POST_INCREMENT:
      return "(an)+";
    case AddressingMode::PRE_DECREMENT:
      return "-(an)";
    case AddressingMode::DISPLACEMENT:
      return "d(an)";
    case AddressingMode::INDEXED:
      return "d(an,ix)";
    case AddressingMode::ABSOLUTE_SHORT:
      return "xxx.w";
    case AddressingMode::ABSOLUTE_LONG:
      return "xxx.l";
    case AddressingMode::PC_DISPLACEMENT:
      return "d(pc)";
    case AddressingMode::PC_INDEXED:
      return "d(pc,ix)";
    case AddressingMode::IMMEDIATE:
      return "#xxx";
    case AddressingMode::REGISTER_LIST:
      return "reglist";
    case AddressingMode::STATUS_REGISTER:
      return "sr";
    case AddressingMode::CONDITION_CODES:
      return "ccr";
    case AddressingMode::USER_STACK:
      return "usp";
    default:
      return "?";
  }
}

std::string SubstituteVariables(const std::string& text,
                                const VariableScope& scope) {
  if (scope.empty()) {
    return text;
  }

  std::string result;
  result.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    char c = text[i];

    // Quoted strings pass through untouched
    if (c == '\'' || c == '"') {
      size_t end = text.find(c, i + 1);
      end = (end == std::string::npos) ? text.size() : end + 1;
      result.append(text, i, end - i);
      i = end;
      continue;
    }

    // Numeric literals: 123, $ff, %0101, 0x1f
    if (c == '$' || c == '%' || std::isdigit(static_cast<unsigned char>(c))) {
      size_t end = i + 1;
      while (end < text.size() && IsIdentChar(text[end])) {
        ++end;
      }
      result.append(text, i, end - i);
      i = end;
      continue;
    }

    if (IsIdentStart(c)) {
      size_t end = i + 1;
      while (end < text.size() && IsIdentChar(text[end])) {
        ++end;
      }
      std::string ident = text.substr(i, end - i);
      char prev = (i > 0) ? text[i - 1] : '\0';
      // ".w" suffix, ".local" label, "\1" macro argument, "@x" local
      bool attached = (prev == '.' || prev == '\\' || prev == '@');
      auto it = scope.find(ident);
      if (!attached && it != scope.end() && !IsRegisterName(ident)) {
        result += std::to_string(it->second);
      } else {
        result += ident;
      }
      i = end;
      continue;
    }

    result += c;
    ++i;
  }
  return result;
}

}  // namespace core
}  // namespace cyclespitter
