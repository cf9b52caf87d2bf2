// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "core/exceptions.h"

#include "core/constants.h"

namespace cyclespitter {

std::string ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::MALFORMED_LINE:
      return "MalformedLine";
    case ErrorKind::UNBALANCED_REPT:
      return "UnbalancedRept";
    case ErrorKind::UNDEFINED_VARIABLE:
      return "UndefinedVariable";
    case ErrorKind::UNKNOWN_INSTRUCTION_COST:
      return "UnknownInstructionCost";
    case ErrorKind::TEMPLATE_EXCEEDS_BUDGET:
      return "TemplateExceedsBudget";
    case ErrorKind::UNFILLABLE_GAP:
      return "UnfillableGap";
    case ErrorKind::INSTRUCTION_EXCEEDS_BUDGET:
      return "InstructionExceedsBudget";
    case ErrorKind::CONFIG:
      return "ConfigError";
    default:
      return "Error";
  }
}

int ExitCodeFor(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::MALFORMED_LINE:
      return constants::kExitMalformedLine;
    case ErrorKind::UNBALANCED_REPT:
      return constants::kExitUnbalancedRept;
    case ErrorKind::UNDEFINED_VARIABLE:
      return constants::kExitUndefinedVariable;
    case ErrorKind::UNKNOWN_INSTRUCTION_COST:
      return constants::kExitUnknownInstructionCost;
    case ErrorKind::TEMPLATE_EXCEEDS_BUDGET:
      return constants::kExitTemplateExceedsBudget;
    case ErrorKind::UNFILLABLE_GAP:
      return constants::kExitUnfillableGap;
    case ErrorKind::INSTRUCTION_EXCEEDS_BUDGET:
      return constants::kExitInstructionExceedsBudget;
    case ErrorKind::CONFIG:
      return constants::kExitConfig;
    default:
      return constants::kExitGeneric;
  }
}

}  // namespace cyclespitter
