// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "schedule/template_loader.h"

#include <fstream>
#include <iterator>
#include <vector>

#include "core/exceptions.h"
#include "cycles/instruction_shape.h"
#include "macro/macro_expander.h"
#include "parse/line_parser.h"
#include "utils/logger.h"

namespace cyclespitter {
namespace schedule {

namespace {

void Finish(TemplateSegment* segment, size_t ordinal) {
  if (segment->label.empty()) {
    segment->label = "Segment " + std::to_string(ordinal);
  }
  segment->total_cycles = 0;
  for (const auto& line : segment->lines) {
    segment->total_cycles += line.cycles;
  }
}

}  // namespace

TemplateLoader::TemplateLoader(const cycles::CycleResolver& resolver)
    : resolver_(resolver) {}

TemplateSet TemplateLoader::LoadFile(const std::string& file_path) const {
  std::ifstream file(file_path);
  if (!file.is_open()) {
    throw ConfigException("Failed to open template file: " + file_path);
  }
  std::string text((std::istreambuf_iterator<char>(file)),
                   std::istreambuf_iterator<char>());
  return Load(text, file_path);
}

TemplateSet TemplateLoader::Load(const std::string& text,
                                 const std::string& source) const {
  parse::LineParser parser;
  macro::MacroExpander expander;
  std::vector<core::ExpandedLine> expanded =
      expander.Expand(parser.ParseText(text));

  std::vector<TemplateSegment> segments;
  TemplateSegment current;
  std::string pending_label;

  for (const auto& line : expanded) {
    if (line.HasInstruction()) {
      cycles::InstructionShape shape =
          cycles::ClassifyInstruction(line.mnemonic, line.operands);
      if (auto window = cycles::NopBlockCount(shape, line.line_number)) {
        if (!current.lines.empty()) {
          Finish(&current, segments.size() + 1);
          segments.push_back(current);
          LOG_DEBUG("Template segment '" + current.label + "' is followed by a " +
                    std::to_string(*window) + " nop window");
        }
        current = TemplateSegment();
        pending_label.clear();
        continue;
      }
    }

    // The segment is named by its first comment
    if (pending_label.empty() && !line.comment.empty() &&
        !parse::IsRuleComment(line.comment) &&
        (line.kind == core::LineKind::COMMENT ||
         line.kind == core::LineKind::INSTRUCTION)) {
      pending_label = line.comment;
    }

    if (line.HasInstruction()) {
      if (current.label.empty()) {
        current.label = pending_label;
      }
      current.lines.push_back(resolver_.Resolve(line));
    } else if (line.kind == core::LineKind::LABEL ||
               line.kind == core::LineKind::EQUATE) {
      LOG_WARNING("Template line " + std::to_string(line.line_number) +
                  " is not an instruction and is not injected");
    }
  }
  if (!current.lines.empty()) {
    Finish(&current, segments.size() + 1);
    segments.push_back(current);
  }

  if (segments.size() != 3) {
    throw ConfigException("Template " + source + " has " +
                          std::to_string(segments.size()) +
                          " segments, expected 3 (left border, right border, "
                          "stabilizer)");
  }

  TemplateSet templates;
  templates.source = source;
  templates.left_border = segments[0];
  templates.left_border.role = SegmentRole::LEFT_BORDER;
  templates.right_border = segments[1];
  templates.right_border.role = SegmentRole::RIGHT_BORDER;
  templates.stabilizer = segments[2];
  templates.stabilizer.role = SegmentRole::STABILIZER;

  LOG_INFO("Template " + source + ": left border " +
           std::to_string(templates.left_border.total_cycles) +
           ", right border " +
           std::to_string(templates.right_border.total_cycles) +
           ", stabilizer " +
           std::to_string(templates.stabilizer.total_cycles) + " cycles");
  return templates;
}

}  // namespace schedule
}  // namespace cyclespitter
