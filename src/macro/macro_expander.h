// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef CYCLESPITTER_MACRO_MACRO_EXPANDER_H_
#define CYCLESPITTER_MACRO_MACRO_EXPANDER_H_

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "core/constants.h"
#include "core/expression.h"
#include "core/source_line.h"

namespace cyclespitter {
namespace macro {

// Unrolls REPT/ENDR blocks and evaluates SET variables.
//
// Every REPT activation gets its own frame holding a snapshot of the
// enclosing frame's variables taken when the REPT is entered. SET mutates
// only the current frame, and the mutation persists across the iterations
// of that frame. Nothing written by an inner frame is visible once it
// closes. Variable values are substituted into operand text as decimal
// literals before each line is emitted.
class MacroExpander {
 public:
  explicit MacroExpander(size_t max_lines = constants::kMaxExpandedLines);

  // Predefine a top-level variable
  void Define(const std::string& name, int64_t value);

  // Expand a parsed file. Throws UnbalancedReptException,
  // UndefinedVariableException or MalformedLineException.
  std::vector<core::ExpandedLine> Expand(
      const std::vector<core::SourceLine>& lines);

  // Number of REPT activations performed by the last Expand()
  size_t activations() const { return activations_; }

 private:
  struct ReptFrame {
    int line_number = 0;  // REPT line, 0 for the top level
    int64_t count = 1;
    int64_t iteration = 1;
    core::VariableScope variables;
  };

  // Index of the ENDR closing each REPT (indexed by the REPT's position)
  std::vector<size_t> MatchBlocks(
      const std::vector<core::SourceLine>& lines) const;

  // Expand lines[begin, end) inside the innermost frame
  void ExpandRange(const std::vector<core::SourceLine>& lines, size_t begin,
                   size_t end, const std::vector<size_t>& matches,
                   std::vector<core::ExpandedLine>* out);

  void Emit(const core::SourceLine& line, std::vector<core::ExpandedLine>* out);

  // "REPT@7 [2/7] > REPT@11 [28/28]"
  std::string ReptPath() const;

  size_t max_lines_;
  size_t activations_;
  size_t passes_;  // REPT body replays, bounded like the output
  core::VariableScope predefined_;
  std::vector<ReptFrame> frames_;
  core::Origin origin_;
  std::map<int, int> section_ordinals_;  // heading line -> section number
};

}  // namespace macro
}  // namespace cyclespitter

#endif  // CYCLESPITTER_MACRO_MACRO_EXPANDER_H_
