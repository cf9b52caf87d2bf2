// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef CYCLESPITTER_CORE_EXCEPTIONS_H_
#define CYCLESPITTER_CORE_EXCEPTIONS_H_

#include <sstream>
#include <stdexcept>
#include <string>

namespace cyclespitter {

// Fatal error kinds. Every kind aborts the run before any output is written.
enum class ErrorKind {
  MALFORMED_LINE,
  UNBALANCED_REPT,
  UNDEFINED_VARIABLE,
  UNKNOWN_INSTRUCTION_COST,
  TEMPLATE_EXCEEDS_BUDGET,
  UNFILLABLE_GAP,
  INSTRUCTION_EXCEEDS_BUDGET,
  CONFIG,
};

// Short name of an error kind, e.g. "UnbalancedRept"
std::string ErrorKindName(ErrorKind kind);

// Process exit code reported for an error kind
int ExitCodeFor(ErrorKind kind);

// Base exception for all cycleSpitter errors
class CycleSpitterException : public std::runtime_error {
 public:
  CycleSpitterException(ErrorKind kind, const std::string& message,
                        int line_number = 0,
                        const std::string& rept_path = "")
      : std::runtime_error(FormatMessage(kind, message, line_number, rept_path)),
        kind_(kind),
        line_number_(line_number),
        rept_path_(rept_path) {}

  ErrorKind kind() const { return kind_; }
  int line_number() const { return line_number_; }
  const std::string& rept_path() const { return rept_path_; }

 private:
  ErrorKind kind_;
  int line_number_;
  std::string rept_path_;

  static std::string FormatMessage(ErrorKind kind, const std::string& msg,
                                   int line, const std::string& path) {
    std::ostringstream oss;
    oss << ErrorKindName(kind);
    if (line > 0) {
      oss << " at line " << line;
    }
    oss << ": " << msg;
    if (!path.empty()) {
      oss << " (in " << path << ")";
    }
    return oss.str();
  }
};

// Directive recognized but its arguments do not parse
class MalformedLineException : public CycleSpitterException {
 public:
  explicit MalformedLineException(const std::string& message,
                                  int line_number = 0,
                                  const std::string& rept_path = "")
      : CycleSpitterException(ErrorKind::MALFORMED_LINE, message, line_number,
                              rept_path) {}
};

// REPT/ENDR nesting mismatch
class UnbalancedReptException : public CycleSpitterException {
 public:
  explicit UnbalancedReptException(const std::string& message,
                                   int line_number = 0,
                                   const std::string& rept_path = "")
      : CycleSpitterException(ErrorKind::UNBALANCED_REPT, message, line_number,
                              rept_path) {}
};

// SET/REPT expression references an unknown variable
class UndefinedVariableException : public CycleSpitterException {
 public:
  UndefinedVariableException(const std::string& variable, int line_number = 0,
                             const std::string& rept_path = "")
      : CycleSpitterException(ErrorKind::UNDEFINED_VARIABLE,
                              "undefined variable '" + variable + "'",
                              line_number, rept_path),
        variable_(variable) {}

  const std::string& variable() const { return variable_; }

 private:
  std::string variable_;
};

// No override, dynamic rule or table entry matches an instruction
class UnknownInstructionCostException : public CycleSpitterException {
 public:
  UnknownInstructionCostException(const std::string& instruction,
                                  const std::string& shape,
                                  int line_number = 0,
                                  const std::string& reason = "")
      : CycleSpitterException(
            ErrorKind::UNKNOWN_INSTRUCTION_COST,
            "no cycle cost for '" + instruction + "' (shape '" + shape +
                "')" +
                (reason.empty()
                     ? std::string()
                     : ": " + reason +
                           "; give it a '; (cycles)' comment or a --costs "
                           "entry"),
            line_number),
        shape_(shape),
        reason_(reason) {}

  const std::string& shape() const { return shape_; }

  // Set when the cost can only be known at run time
  const std::string& reason() const { return reason_; }

 private:
  std::string shape_;
  std::string reason_;
};

// Border/stabilizer reserved cost leaves no room for scheduled code
class TemplateExceedsBudgetException : public CycleSpitterException {
 public:
  TemplateExceedsBudgetException(int reserved, int width)
      : CycleSpitterException(ErrorKind::TEMPLATE_EXCEEDS_BUDGET,
                              "template reserves " + std::to_string(reserved) +
                                  " cycles of a " + std::to_string(width) +
                                  "-cycle scanline") {}
};

// Closing remainder is not a whole number of NOP units
class UnfillableGapException : public CycleSpitterException {
 public:
  UnfillableGapException(int scanline, int gap, int nop_cycles,
                         int line_number = 0)
      : CycleSpitterException(
            ErrorKind::UNFILLABLE_GAP,
            "scanline " + std::to_string(scanline) + " leaves a gap of " +
                std::to_string(gap) + " cycles, " +
                std::to_string(gap % nop_cycles) +
                " cycles cannot be covered by " + std::to_string(nop_cycles) +
                "-cycle NOPs",
            line_number) {}
};

// A single instruction does not fit into an empty scanline
class InstructionExceedsBudgetException : public CycleSpitterException {
 public:
  InstructionExceedsBudgetException(const std::string& instruction, int cost,
                                    int budget, int line_number = 0)
      : CycleSpitterException(ErrorKind::INSTRUCTION_EXCEEDS_BUDGET,
                              "'" + instruction + "' costs " +
                                  std::to_string(cost) +
                                  " cycles, scanline budget is " +
                                  std::to_string(budget),
                              line_number) {}
};

// Configuration errors - invalid settings, templates or override tables
class ConfigException : public CycleSpitterException {
 public:
  explicit ConfigException(const std::string& message)
      : CycleSpitterException(ErrorKind::CONFIG, message) {}
};

}  // namespace cyclespitter

#endif  // CYCLESPITTER_CORE_EXCEPTIONS_H_
