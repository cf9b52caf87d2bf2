// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef CYCLESPITTER_CORE_OPERAND_H_
#define CYCLESPITTER_CORE_OPERAND_H_

#include <optional>
#include <string>
#include <vector>

#include "core/expression.h"

namespace cyclespitter {
namespace core {

// 68000 effective addressing mode classes
enum class AddressingMode {
  UNKNOWN = 0,
  DATA_REGISTER,     // d0
  ADDRESS_REGISTER,  // a0, sp
  INDIRECT,          // (a0)
  POST_INCREMENT,    // (a0)+
  PRE_DECREMENT,     // -(a0)
  DISPLACEMENT,      // 8(a0), (8,a0)
  INDEXED,           // 8(a0,d0.w), (a0,d1)
  ABSOLUTE_SHORT,    // $ffff8260.w
  ABSOLUTE_LONG,     // label, $ff8240
  PC_DISPLACEMENT,   // table(pc)
  PC_INDEXED,        // table(pc,d0.w)
  IMMEDIATE,         // #$1234
  REGISTER_LIST,     // d0-d7/a1-a3
  STATUS_REGISTER,   // sr
  CONDITION_CODES,   // ccr
  USER_STACK,        // usp
};

// Split operand text on top-level commas; parentheses and quotes nest.
// Each operand is trimmed. "8(a0,d0.w),d1" -> {"8(a0,d0.w)", "d1"}
std::vector<std::string> SplitOperands(const std::string& text);

// Classify a single operand
AddressingMode ClassifyOperand(const std::string& operand);

// Normalized placeholder for a mode ("dn", "(an)+", "xxx.w", ...)
std::string AddressingModeShape(AddressingMode mode);

// Number of distinct registers named by a register list such as
// "d0-d7/a1-a3" (11). A single register counts as one. Returns nullopt
// when the text is not a register list.
std::optional<int> CountRegisters(const std::string& operand);

// Register name predicates (case-insensitive)
bool IsDataRegister(const std::string& token);
bool IsAddressRegister(const std::string& token);
bool IsRegisterName(const std::string& token);

// Replace bare identifiers that name variables in `scope` by their decimal
// value. Register names, size suffixes (.w), local labels (.loop), numeric
// literals ($add, %101) and quoted strings are left alone.
std::string SubstituteVariables(const std::string& text,
                                const VariableScope& scope);

// Lower-case copy
std::string ToLower(const std::string& text);

// Copy without leading/trailing whitespace
std::string Trim(const std::string& text);

}  // namespace core
}  // namespace cyclespitter

#endif  // CYCLESPITTER_CORE_OPERAND_H_
