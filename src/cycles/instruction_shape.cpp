// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "cycles/instruction_shape.h"

#include <cctype>
#include <limits>
#include <set>

#include "core/constants.h"
#include "core/exceptions.h"
#include "core/expression.h"
#include "utils/logger.h"

namespace cyclespitter {
namespace cycles {

namespace {

const std::set<std::string>& BranchMnemonics() {
  static const std::set<std::string> kBranches = {
      "bra", "bsr", "bhi", "bls", "bcc", "bcs", "bhs", "blo", "bne", "beq",
      "bvc", "bvs", "bpl", "bmi", "bge", "blt", "bgt", "ble"};
  return kBranches;
}

// Instructions written without a size
const std::set<std::string>& UnsizedMnemonics() {
  static const std::set<std::string> kUnsized = {
      "nop", "rts", "rte", "rtr", "jmp", "jsr", "trap", "trapv",
      "illegal", "reset", "stop", "unlk",
      // Bit operations: timing does not depend on the written size
      "btst", "bchg", "bclr", "bset"};
  return kUnsized;
}

// Byte-only instructions
const std::set<std::string>& ByteMnemonics() {
  static const std::set<std::string> kByte = {
      "abcd", "sbcd", "nbcd", "tas", "st",  "sf",  "shi", "sls", "scc", "scs",
      "shs",  "slo",  "sne",  "seq", "svc", "svs", "spl", "smi", "sge", "slt",
      "sgt",  "sle"};
  return kByte;
}

// Instructions that only exist as long operations
const std::set<std::string>& LongMnemonics() {
  static const std::set<std::string> kLong = {"lea", "pea", "moveq", "exg"};
  return kLong;
}

}  // namespace

std::string DataDependentReason(const InstructionShape& shape) {
  if (shape.base != "bra" && shape.base != "bsr" &&
      BranchMnemonics().count(shape.base) > 0) {
    return "conditional branch, taken and not taken differ";
  }
  if (shape.base.size() > 2 && shape.base.compare(0, 2, "db") == 0) {
    return "loop branch, cost depends on the counter";
  }
  if (shape.base == "mulu" || shape.base == "muls" || shape.base == "divu" ||
      shape.base == "divs") {
    return "cost depends on the operand values";
  }
  static const std::set<std::string> kShifts = {
      "asl", "asr", "lsl", "lsr", "rol", "ror", "roxl", "roxr"};
  if (kShifts.count(shape.base) > 0 && shape.modes.size() == 2 &&
      shape.modes[0] == core::AddressingMode::DATA_REGISTER) {
    return "shift count held in a register";
  }
  return "";
}

bool InstructionShape::IsClassified() const {
  for (core::AddressingMode mode : modes) {
    if (mode == core::AddressingMode::UNKNOWN) {
      return false;
    }
  }
  return true;
}

std::string NormalizeMnemonic(const std::string& mnemonic) {
  std::string lower = core::ToLower(core::Trim(mnemonic));
  std::string base = lower;
  std::string suffix;
  size_t dot = lower.find('.');
  if (dot != std::string::npos) {
    base = lower.substr(0, dot);
    suffix = lower.substr(dot + 1);
  }

  if (BranchMnemonics().count(base) > 0) {
    return base + ((suffix == "s" || suffix == "b") ? ".b" : ".w");
  }
  if (UnsizedMnemonics().count(base) > 0) {
    return base;
  }
  if (LongMnemonics().count(base) > 0) {
    return base + ".l";
  }
  if (ByteMnemonics().count(base) > 0) {
    return base + ".b";
  }
  if (suffix.empty()) {
    return base + ".w";
  }
  if (suffix == "s") {
    return base + ".b";
  }
  return base + "." + suffix;
}

InstructionShape ClassifyInstruction(const std::string& mnemonic,
                                     const std::string& operands) {
  InstructionShape shape;
  shape.mnemonic = NormalizeMnemonic(mnemonic);

  size_t dot = shape.mnemonic.find('.');
  shape.base = shape.mnemonic.substr(0, dot);
  if (dot != std::string::npos && dot + 1 < shape.mnemonic.size()) {
    shape.size = shape.mnemonic[dot + 1];
  }

  shape.operands = core::SplitOperands(operands);
  shape.key = shape.mnemonic;
  for (size_t i = 0; i < shape.operands.size(); ++i) {
    core::AddressingMode mode = core::ClassifyOperand(shape.operands[i]);
    shape.modes.push_back(mode);
    shape.key += (i == 0) ? " " : ",";
    shape.key += mode == core::AddressingMode::UNKNOWN
                     ? "?"
                     : core::AddressingModeShape(mode);
  }
  return shape;
}

std::optional<int64_t> EvaluateConstantOperand(const std::string& text,
                                               int line_number) {
  try {
    return core::Expression::Parse(text, line_number)
        .Evaluate(core::VariableScope(), line_number);
  } catch (const CycleSpitterException& e) {
    LOG_DEBUG("Line " + std::to_string(line_number) +
              ": operand is not constant: " + e.what());
    return std::nullopt;
  }
}

std::optional<int64_t> NopBlockCount(const InstructionShape& shape,
                                     int line_number) {
  if (shape.mnemonic != "dcb.w" || shape.operands.size() != 2) {
    return std::nullopt;
  }
  std::optional<int64_t> count =
      EvaluateConstantOperand(shape.operands[0], line_number);
  std::optional<int64_t> value =
      EvaluateConstantOperand(shape.operands[1], line_number);
  if (!count || !value || *count < 0 || *value != constants::kNopOpcode) {
    return std::nullopt;
  }
  constexpr int64_t kMaxCount =
      std::numeric_limits<int>::max() / constants::kDefaultNopCycles;
  if (*count > kMaxCount) {
    throw MalformedLineException("nop block of " + std::to_string(*count) +
                                     " exceeds " + std::to_string(kMaxCount) +
                                     " nops",
                                 line_number);
  }
  return count;
}

std::string CanonicalInstruction(const std::string& text) {
  std::string lower = core::ToLower(core::Trim(text));
  std::string result;
  bool pending_space = false;
  for (char c : lower) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      pending_space = true;
      continue;
    }
    if (c == ',') {
      pending_space = false;
      while (!result.empty() && result.back() == ' ') {
        result.pop_back();
      }
      result += c;
      continue;
    }
    if (pending_space && !result.empty() && result.back() != ',') {
      result += ' ';
    }
    pending_space = false;
    result += c;
  }
  return result;
}

}  // namespace cycles
}  // namespace cyclespitter
