// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "macro/macro_expander.h"

#include <sstream>

#include "core/exceptions.h"
#include "core/operand.h"
#include "utils/logger.h"

namespace cyclespitter {
namespace macro {

MacroExpander::MacroExpander(size_t max_lines)
    : max_lines_(max_lines), activations_(0), passes_(0) {}

void MacroExpander::Define(const std::string& name, int64_t value) {
  predefined_[name] = value;
}

std::vector<core::ExpandedLine> MacroExpander::Expand(
    const std::vector<core::SourceLine>& lines) {
  std::vector<size_t> matches = MatchBlocks(lines);

  frames_.clear();
  activations_ = 0;
  passes_ = 0;
  origin_ = core::Origin();
  section_ordinals_.clear();

  ReptFrame top;
  top.variables = predefined_;
  frames_.push_back(top);

  std::vector<core::ExpandedLine> out;
  ExpandRange(lines, 0, lines.size(), matches, &out);
  frames_.clear();

  LOG_DEBUG("Expanded " + std::to_string(lines.size()) + " source lines to " +
            std::to_string(out.size()) + " lines (" +
            std::to_string(activations_) + " REPT activations)");
  return out;
}

std::vector<size_t> MacroExpander::MatchBlocks(
    const std::vector<core::SourceLine>& lines) const {
  std::vector<size_t> matches(lines.size(), 0);
  std::vector<size_t> open;

  for (size_t i = 0; i < lines.size(); ++i) {
    core::DirectiveKind kind = lines[i].directive.kind;
    if (kind == core::DirectiveKind::REPT) {
      open.push_back(i);
    } else if (kind == core::DirectiveKind::ENDR) {
      if (open.empty()) {
        throw UnbalancedReptException("ENDR without matching REPT",
                                      lines[i].line_number);
      }
      matches[open.back()] = i;
      open.pop_back();
    }
  }

  if (!open.empty()) {
    std::ostringstream path;
    for (size_t k = 0; k < open.size(); ++k) {
      if (k > 0) path << " > ";
      path << "REPT@" << lines[open[k]].line_number;
    }
    throw UnbalancedReptException("REPT without matching ENDR",
                                  lines[open.back()].line_number, path.str());
  }
  return matches;
}

void MacroExpander::ExpandRange(const std::vector<core::SourceLine>& lines,
                                size_t begin, size_t end,
                                const std::vector<size_t>& matches,
                                std::vector<core::ExpandedLine>* out) {
  size_t i = begin;
  while (i < end) {
    const core::SourceLine& line = lines[i];

    switch (line.directive.kind) {
      case core::DirectiveKind::REPT: {
        int64_t count = line.directive.expression.Evaluate(
            frames_.back().variables, line.line_number, ReptPath());
        if (count < 0) {
          throw MalformedLineException(
              "negative repeat count " + std::to_string(count),
              line.line_number, ReptPath());
        }

        size_t body_end = matches[i];
        ReptFrame frame;
        frame.line_number = line.line_number;
        frame.count = count;
        frame.variables = frames_.back().variables;
        frames_.push_back(frame);
        ++activations_;

        for (int64_t pass = 1; pass <= count; ++pass) {
          frames_.back().iteration = pass;
          if (++passes_ > max_lines_) {
            throw MalformedLineException(
                "expansion exceeds " + std::to_string(max_lines_) +
                    " repeat passes",
                line.line_number, ReptPath());
          }
          ExpandRange(lines, i + 1, body_end, matches, out);
        }
        frames_.pop_back();
        i = body_end + 1;
        continue;
      }

      case core::DirectiveKind::SET: {
        ReptFrame& frame = frames_.back();
        int64_t value = line.directive.expression.Evaluate(
            frame.variables, line.line_number, ReptPath());
        frames_.back().variables[line.directive.variable] = value;
        break;
      }

      case core::DirectiveKind::ENDR:
        // Matched block ends are consumed by the REPT case
        break;

      case core::DirectiveKind::SECTION: {
        auto inserted = section_ordinals_.emplace(
            line.line_number, static_cast<int>(section_ordinals_.size()) + 1);
        origin_.section_index = inserted.first->second;
        origin_.section_title = line.directive.title;
        Emit(line, out);
        break;
      }

      case core::DirectiveKind::NONE:
        if (line.kind != core::LineKind::BLANK) {
          Emit(line, out);
        }
        break;
    }
    ++i;
  }
}

void MacroExpander::Emit(const core::SourceLine& line,
                         std::vector<core::ExpandedLine>* out) {
  if (out->size() >= max_lines_) {
    throw MalformedLineException(
        "expansion exceeds " + std::to_string(max_lines_) + " lines",
        line.line_number, ReptPath());
  }

  core::ExpandedLine expanded;
  expanded.line_number = line.line_number;
  expanded.kind = line.kind;
  expanded.label = line.label;
  expanded.mnemonic = line.mnemonic;
  expanded.comment = line.comment;
  expanded.cycle_override = line.cycle_override;
  expanded.origin = origin_;
  expanded.section_heading =
      line.directive.kind == core::DirectiveKind::SECTION;

  const core::VariableScope& scope = frames_.back().variables;
  if (line.kind == core::LineKind::INSTRUCTION ||
      line.kind == core::LineKind::EQUATE) {
    expanded.operands = core::SubstituteVariables(line.operands, scope);
  } else {
    expanded.operands = line.operands;
  }
  out->push_back(std::move(expanded));
}

std::string MacroExpander::ReptPath() const {
  std::ostringstream path;
  bool first = true;
  for (const auto& frame : frames_) {
    if (frame.line_number == 0) {
      continue;
    }
    if (!first) path << " > ";
    path << "REPT@" << frame.line_number << " [" << frame.iteration << "/"
         << frame.count << "]";
    first = false;
  }
  return path.str();
}

}  // namespace macro
}  // namespace cyclespitter
