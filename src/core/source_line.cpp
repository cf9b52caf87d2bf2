// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "core/source_line.h"

namespace cyclespitter {
namespace core {

namespace {

std::string JoinBody(const std::string& mnemonic, const std::string& operands) {
  if (operands.empty()) {
    return mnemonic;
  }
  return mnemonic + " " + operands;
}

}  // namespace

std::string SourceLine::Body() const {
  return JoinBody(mnemonic, operands);
}

std::string ExpandedLine::Body() const {
  return JoinBody(mnemonic, operands);
}

std::string LineKindName(LineKind kind) {
  switch (kind) {
    case LineKind::BLANK:
      return "blank";
    case LineKind::COMMENT:
      return "comment";
    case LineKind::LABEL:
      return "label";
    case LineKind::INSTRUCTION:
      return "instruction";
    case LineKind::EQUATE:
      return "equate";
    case LineKind::DIRECTIVE:
      return "directive";
    default:
      return "unknown";
  }
}

std::string CostRuleKindName(CostRuleKind kind) {
  switch (kind) {
    case CostRuleKind::NONE:
      return "none";
    case CostRuleKind::OVERRIDE:
      return "override";
    case CostRuleKind::DYNAMIC:
      return "dynamic";
    case CostRuleKind::TABLE:
      return "table";
    default:
      return "unknown";
  }
}

}  // namespace core
}  // namespace cyclespitter
