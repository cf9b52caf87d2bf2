// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "output/base_formatter.h"

#include <algorithm>
#include <sstream>

#include "core/constants.h"
#include "utils/logger.h"

namespace cyclespitter {
namespace output {

namespace {

void PadTo(std::string* text, int column) {
  int length = static_cast<int>(text->length());
  *text += std::string(std::max(1, column - length), ' ');
}

const char* const kRule = "------------------------------------------";

}  // namespace

std::string BaseFormatter::Format(const schedule::Schedule& schedule,
                                  const DocumentInfo& info) {
  std::ostringstream out;
  last_origin_ = core::Origin();

  // Header
  out << FormatHeader(info, static_cast<int>(schedule.scanlines.size()));

  for (const auto& scanline : schedule.scanlines) {
    WriteScanline(out, scanline);
  }

  // Footer
  out << FormatFooter();

  LOG_DEBUG("Formatted " + std::to_string(schedule.scanlines.size()) +
            " scanlines with " + Name());
  return out.str();
}

std::string BaseFormatter::FormatStream(
    const std::vector<core::CostedLine>& lines, const DocumentInfo& info) {
  std::ostringstream out;
  last_origin_ = core::Origin();

  int total = 0;
  for (const auto& line : lines) {
    total += line.cycles;
  }

  out << CommentLine(kRule) << std::endl;
  out << CommentLine("This file is generated using") << std::endl;
  out << CommentLine(std::string(constants::kToolName) + " " +
                     constants::kToolVersion)
      << std::endl;
  if (!info.input_source.empty()) {
    out << CommentLine("Expanded from: " + info.input_source) << std::endl;
  }
  out << CommentLine("Lines: " + std::to_string(lines.size()) +
                     ", total cycles: " + std::to_string(total))
      << std::endl;
  out << CommentLine(kRule) << std::endl;

  int offset = 0;
  for (const auto& line : lines) {
    WriteSourceLine(out, line, offset);
    offset += line.cycles;
  }

  out << FormatFooter();
  return out.str();
}

std::string BaseFormatter::FormatLine(const core::CostedLine& line,
                                      int offset) {
  const core::ExpandedLine& source = line.source;
  switch (source.kind) {
    case core::LineKind::COMMENT:
      return CommentLine(source.comment);

    case core::LineKind::LABEL:
      return AppendComment(FormatLabel(source.label), source.comment);

    case core::LineKind::EQUATE:
      return AppendComment(FormatEquate(source.label, source.operands),
                           source.comment);

    case core::LineKind::INSTRUCTION: {
      std::string comment =
          Annotation(line.cycles, line.description, offset);
      if (!source.comment.empty()) {
        comment += " " + source.comment;
      }
      return Layout(source.label, source.mnemonic, source.operands, comment);
    }

    case core::LineKind::BLANK:
    case core::LineKind::DIRECTIVE:
      break;
  }
  return "";
}

std::string BaseFormatter::FormatPadding(int nop_count, int cycles,
                                         int offset) {
  if (nop_count <= 0) {
    return "";
  }

  if (!config_.expand_padding) {
    return Layout("", GetNopBlockDirective(), FormatNopBlockOperands(nop_count),
                  Annotation(cycles,
                             "padding, " + std::to_string(nop_count) + " x nop",
                             offset));
  }

  std::ostringstream out;
  int nop_cycles = cycles / nop_count;
  for (int i = 0; i < nop_count; ++i) {
    if (i > 0) out << std::endl;
    out << Layout("", "nop", "",
                  Annotation(nop_cycles, "nop", offset + i * nop_cycles));
  }
  return out.str();
}

std::string BaseFormatter::FormatHeader(const DocumentInfo& info,
                                        int scanline_count) {
  std::ostringstream out;

  out << CommentLine(kRule) << std::endl;
  out << CommentLine("This file is generated using") << std::endl;
  out << CommentLine(std::string(constants::kToolName) + " " +
                     constants::kToolVersion)
      << std::endl;
  out << CommentLine("Total scanlines created: " +
                     std::to_string(scanline_count))
      << std::endl;
  out << CommentLine("Template used: " + info.template_source) << std::endl;
  out << CommentLine(kRule) << std::endl;
  out << FormatEquate(info.scanlines_label, std::to_string(scanline_count))
      << std::endl;

  return out.str();
}

std::string BaseFormatter::FormatFooter() {
  return FormatFooterContent();
}

std::string BaseFormatter::Layout(const std::string& label,
                                  const std::string& mnemonic,
                                  const std::string& operands,
                                  const std::string& comment) const {
  std::string code = label.empty() ? "" : FormatLabel(label);
  if (code.empty()) {
    code = std::string(config_.opcode_column, ' ');
  } else {
    PadTo(&code, config_.opcode_column);
  }

  code += mnemonic;
  if (!operands.empty()) {
    PadTo(&code, config_.operand_column);
    code += operands;
  }
  return AppendComment(code, comment);
}

std::string BaseFormatter::AppendComment(const std::string& code,
                                         const std::string& comment) const {
  if (comment.empty()) {
    return code;
  }
  std::string line = code;
  PadTo(&line, config_.comment_column);
  return line + GetCommentPrefix() + comment;
}

std::string BaseFormatter::Annotation(int cycles,
                                      const std::string& description,
                                      int offset) const {
  std::string text = "(" + std::to_string(cycles) + ")";
  if (config_.show_descriptions && !description.empty()) {
    text += " " + description;
  }
  if (config_.show_offsets) {
    text += " [" + std::to_string(offset) + "]";
  }
  return text;
}

std::string BaseFormatter::CommentLine(const std::string& text) const {
  std::string prefix = GetCommentPrefix();
  if (text.empty()) {
    while (!prefix.empty() && prefix.back() == ' ') {
      prefix.pop_back();
    }
  }
  return prefix + text;
}

void BaseFormatter::WriteSectionChange(std::ostream& out,
                                       const core::Origin& origin) {
  if (origin == last_origin_) {
    return;
  }
  last_origin_ = origin;
  if (origin.section_index > 0) {
    out << CommentLine("--- Section " + std::to_string(origin.section_index) +
                       ": " + origin.section_title + " ---")
        << std::endl;
  }
}

void BaseFormatter::WriteSourceLine(std::ostream& out,
                                    const core::CostedLine& line,
                                    int offset) {
  // A heading is written in full before the marker of the section it opens
  if (line.source.section_heading) {
    out << FormatLine(line, offset) << std::endl;
    WriteSectionChange(out, line.source.origin);
    return;
  }
  WriteSectionChange(out, line.source.origin);
  out << FormatLine(line, offset) << std::endl;
}

void BaseFormatter::WriteScanline(std::ostream& out,
                                  const schedule::Scanline& scanline) {
  out << std::endl;
  out << CommentLine("=== Scanline " + std::to_string(scanline.index) + " ===")
      << std::endl;

  for (const auto& entry : scanline.entries) {
    switch (entry.kind) {
      case schedule::EntryKind::TEMPLATE:
        if (entry.segment_start) {
          out << CommentLine("--- " + schedule::SegmentRoleName(entry.role) +
                             ": " + entry.segment_label + " ---")
              << std::endl;
        }
        out << FormatLine(entry.line, entry.offset) << std::endl;
        break;

      case schedule::EntryKind::SCHEDULED:
        WriteSourceLine(out, entry.line, entry.offset);
        break;

      case schedule::EntryKind::PADDING:
        out << FormatPadding(entry.nop_count, entry.cycles, entry.offset)
            << std::endl;
        break;
    }
  }

  out << CommentLine("Total cycles for scanline: " +
                     std::to_string(scanline.total_cycles))
      << std::endl;
}

}  // namespace output
}  // namespace cyclespitter
