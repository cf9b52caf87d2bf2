// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef CYCLESPITTER_CYCLES_INSTRUCTION_SHAPE_H_
#define CYCLESPITTER_CYCLES_INSTRUCTION_SHAPE_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/operand.h"

namespace cyclespitter {
namespace cycles {

// Normalized view of one instruction used as the cost lookup key
struct InstructionShape {
  std::string mnemonic;  // Normalized, e.g. "move.w", "bne.b", "nop"
  std::string base;      // Without size, e.g. "move"
  char size = 0;         // 'b', 'w', 'l' or 0 when unsized
  std::vector<std::string> operands;  // Operand text as written
  std::vector<core::AddressingMode> modes;
  std::string key;  // "move.w dn,xxx.w"

  // True when every operand has a recognized addressing mode
  bool IsClassified() const;
};

// Normalize a mnemonic: lower case, default ".w", ".l" for lea/pea/moveq/exg,
// ".b" for short branches and byte-only instructions, no size for
// instructions that take none (nop, rts, jmp...) or whose size does not
// change timing (btst, bset...).
std::string NormalizeMnemonic(const std::string& mnemonic);

// Build the shape of an instruction from its mnemonic and operand text
InstructionShape ClassifyInstruction(const std::string& mnemonic,
                                     const std::string& operands);

// Value of a constant operand expression such as "12" or "$4e71"; nullopt
// when it names symbols that cannot be known here (equates, labels)
std::optional<int64_t> EvaluateConstantOperand(const std::string& text,
                                               int line_number = 0);

// Why the cost of `shape` depends on run-time data ("branch taken or not",
// "operand values"...); empty for instructions with a fixed cost
std::string DataDependentReason(const InstructionShape& shape);

// Count of a "dcb.w n,$4e71" NOP filler line; nullopt for anything else
std::optional<int64_t> NopBlockCount(const InstructionShape& shape,
                                     int line_number = 0);

// Canonical text of an instruction for literal lookups: lower case,
// whitespace collapsed to single spaces, none around commas.
std::string CanonicalInstruction(const std::string& text);

}  // namespace cycles
}  // namespace cyclespitter

#endif  // CYCLESPITTER_CYCLES_INSTRUCTION_SHAPE_H_
