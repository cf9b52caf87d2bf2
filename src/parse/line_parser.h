// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef CYCLESPITTER_PARSE_LINE_PARSER_H_
#define CYCLESPITTER_PARSE_LINE_PARSER_H_

#include <optional>
#include <string>
#include <vector>

#include "core/source_line.h"

namespace cyclespitter {
namespace parse {

// Converts raw assembly text into SourceLines.
//
// The parser is stateful only for section headings: a boxed comment
// heading spans several lines, so the rule/title/rule sequence is tracked
// across calls and the SECTION directive lands on the closing rule line.
class LineParser {
 public:
  LineParser();

  // Parse one line. Throws MalformedLineException when a directive is
  // recognized but its arguments do not parse.
  core::SourceLine ParseLine(const std::string& text, int line_number);

  // Parse a whole file. Lines are numbered from 1; "\r\n" is accepted.
  std::vector<core::SourceLine> ParseText(const std::string& text);

  // Forget any partially seen section heading
  void Reset();

  // Extract an explicit cycle override: the first parenthesized group of a
  // comment when it holds a decimal integer, e.g. "; (20)" or "( 4) note".
  static std::optional<int> ParseCycleOverride(const std::string& comment);

  // `comment` without its cycle override group: "(12) wait" -> "wait"
  static std::string StripCycleOverride(const std::string& comment);

 private:
  enum class HeadingState {
    NONE,    // Not inside a boxed heading
    OPEN,    // Saw the opening rule line
    TITLED,  // Saw the opening rule and a title line
  };

  // Update heading state for a comment-only line; returns a title when the
  // line completes a heading
  std::optional<std::string> TrackHeading(const std::string& comment);

  void ParseCode(const std::string& code, bool column_zero,
                 core::SourceLine* line) const;

  HeadingState heading_state_;
  std::string pending_title_;
};

// True if `comment` is a rule line such as "------------" or "=========="
bool IsRuleComment(const std::string& comment);

// Title of an inline heading such as "------ copy phase ------"
std::optional<std::string> InlineHeadingTitle(const std::string& comment);

}  // namespace parse
}  // namespace cyclespitter

#endif  // CYCLESPITTER_PARSE_LINE_PARSER_H_
