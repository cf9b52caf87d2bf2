// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef CYCLESPITTER_CORE_SOURCE_LINE_H_
#define CYCLESPITTER_CORE_SOURCE_LINE_H_

#include <optional>
#include <string>

#include "core/expression.h"

namespace cyclespitter {
namespace core {

// What a line carries once directives are set aside
enum class LineKind {
  BLANK,        // Empty or whitespace only
  COMMENT,      // Comment only (";" or "*" in column 0)
  LABEL,        // Label with no instruction
  INSTRUCTION,  // Mnemonic + operands
  EQUATE,       // NAME EQU value (passed through, costs nothing)
  DIRECTIVE,    // REPT / ENDR / SET (consumed by the macro expander)
};

// Assembler directives the macro expander acts on
enum class DirectiveKind {
  NONE,
  REPT,     // REPT <count_expr>
  ENDR,     // ENDR
  SET,      // <var> SET <expr>
  SECTION,  // Boxed comment heading, carries a title
};

struct Directive {
  DirectiveKind kind = DirectiveKind::NONE;
  std::string variable;   // SET target
  Expression expression;  // REPT count or SET value
  std::string title;      // SECTION title
};

// One physical input line, immutable after parsing
struct SourceLine {
  int line_number = 0;      // 1-based
  std::string raw;          // Original text
  LineKind kind = LineKind::BLANK;
  std::string label;        // Without trailing ':'
  Directive directive;
  std::string mnemonic;     // As written, e.g. "move.w"
  std::string operands;     // As written, e.g. "(a0)+,8(a1)"
  std::string comment;      // Text after ';' (trimmed), or the whole "*" line
  std::optional<int> cycle_override;  // "(20)" in the comment

  bool HasInstruction() const { return kind == LineKind::INSTRUCTION; }
  bool HasDirective() const { return directive.kind != DirectiveKind::NONE; }

  // Mnemonic and operands joined by a single space
  std::string Body() const;
};

// Section a line belongs to (last heading seen before it)
struct Origin {
  int section_index = 0;  // 0 = before the first heading
  std::string section_title;

  bool operator==(const Origin& other) const {
    return section_index == other.section_index &&
           section_title == other.section_title;
  }
  bool operator!=(const Origin& other) const { return !(*this == other); }
};

// A directive-free line produced by macro expansion
struct ExpandedLine {
  int line_number = 0;  // Source line it was expanded from
  LineKind kind = LineKind::BLANK;
  std::string label;
  std::string mnemonic;
  std::string operands;  // Variables substituted
  std::string comment;
  std::optional<int> cycle_override;
  Origin origin;
  bool section_heading = false;  // Line that opened `origin`

  bool HasInstruction() const { return kind == LineKind::INSTRUCTION; }
  std::string Body() const;
};

// How a cycle cost was determined
enum class CostRuleKind {
  NONE,      // Not an instruction
  OVERRIDE,  // Inline "(n)" comment or external override table
  DYNAMIC,   // Operand-dependent rule (movem, shift count, dcb nops)
  TABLE,     // Static cost table
};

// An expanded line with its resolved cost
struct CostedLine {
  ExpandedLine source;
  int cycles = 0;
  std::string description;  // Shape or rule text for the annotation
  CostRuleKind rule = CostRuleKind::NONE;

  bool IsInstruction() const { return source.HasInstruction(); }
};

// Name of a line kind for diagnostics
std::string LineKindName(LineKind kind);

// Name of a cost rule kind for diagnostics
std::string CostRuleKindName(CostRuleKind kind);

}  // namespace core
}  // namespace cyclespitter

#endif  // CYCLESPITTER_CORE_SOURCE_LINE_H_
