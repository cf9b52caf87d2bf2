// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "parse/line_parser.h"

#include <cctype>

#include "core/constants.h"
#include "core/exceptions.h"
#include "core/operand.h"

namespace cyclespitter {
namespace parse {

namespace {

bool IsRuleChar(char c) {
  return c == '-' || c == '=' || c == '*' || c == '~' || c == '#';
}

// Position of the ';' starting a trailing comment, ignoring quoted text
size_t FindCommentStart(const std::string& text) {
  char quote = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (quote != 0) {
      if (c == quote) quote = 0;
    } else if (c == '\'' || c == '"') {
      quote = c;
    } else if (c == ';') {
      return i;
    }
  }
  return std::string::npos;
}

// Remove and return the first whitespace-delimited token of *text
std::string PopToken(std::string* text) {
  size_t start = 0;
  while (start < text->size() &&
         std::isspace(static_cast<unsigned char>((*text)[start]))) {
    ++start;
  }
  size_t end = start;
  while (end < text->size() &&
         !std::isspace(static_cast<unsigned char>((*text)[end]))) {
    ++end;
  }
  std::string token = text->substr(start, end - start);
  *text = core::Trim(text->substr(end));
  return token;
}

std::string PeekToken(const std::string& text) {
  std::string copy = text;
  return PopToken(&copy);
}

core::Expression ParseDirectiveExpression(const std::string& text,
                                          const std::string& directive,
                                          int line_number) {
  if (text.empty()) {
    throw MalformedLineException(directive + " requires an expression",
                                 line_number);
  }
  return core::Expression::Parse(text, line_number);
}

}  // namespace

bool IsRuleComment(const std::string& comment) {
  std::string text = core::Trim(comment);
  if (text.size() < constants::kMinBoxRuleLength) {
    return false;
  }
  for (char c : text) {
    if (!IsRuleChar(c)) {
      return false;
    }
  }
  return true;
}

std::optional<std::string> InlineHeadingTitle(const std::string& comment) {
  std::string text = core::Trim(comment);
  size_t lead = 0;
  while (lead < text.size() && IsRuleChar(text[lead])) {
    ++lead;
  }
  size_t trail = 0;
  while (trail < text.size() - lead && IsRuleChar(text[text.size() - 1 - trail])) {
    ++trail;
  }
  if (lead < constants::kMinInlineRuleLength ||
      trail < constants::kMinInlineRuleLength) {
    return std::nullopt;
  }

  std::string title = core::Trim(text.substr(lead, text.size() - lead - trail));
  bool has_text = false;
  for (char c : title) {
    if (std::isalnum(static_cast<unsigned char>(c))) {
      has_text = true;
      break;
    }
  }
  if (!has_text) {
    return std::nullopt;
  }
  return title;
}

LineParser::LineParser() : heading_state_(HeadingState::NONE) {}

void LineParser::Reset() {
  heading_state_ = HeadingState::NONE;
  pending_title_.clear();
}

std::optional<int> LineParser::ParseCycleOverride(const std::string& comment) {
  size_t open = comment.find('(');
  if (open == std::string::npos) {
    return std::nullopt;
  }
  size_t close = comment.find(')', open + 1);
  if (close == std::string::npos) {
    return std::nullopt;
  }

  std::string content = core::Trim(comment.substr(open + 1, close - open - 1));
  if (content.empty() || content.size() > 9) {
    return std::nullopt;
  }
  for (char c : content) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
  }
  return std::stoi(content);
}

std::string LineParser::StripCycleOverride(const std::string& comment) {
  if (!ParseCycleOverride(comment)) {
    return comment;
  }
  size_t open = comment.find('(');
  size_t close = comment.find(')', open + 1);
  std::string before = core::Trim(comment.substr(0, open));
  std::string after = core::Trim(comment.substr(close + 1));
  if (before.empty() || after.empty()) {
    return before + after;
  }
  return before + " " + after;
}

std::optional<std::string> LineParser::TrackHeading(const std::string& comment) {
  if (auto title = InlineHeadingTitle(comment)) {
    heading_state_ = HeadingState::NONE;
    return title;
  }

  bool rule = IsRuleComment(comment);
  switch (heading_state_) {
    case HeadingState::NONE:
      if (rule) {
        heading_state_ = HeadingState::OPEN;
      }
      break;
    case HeadingState::OPEN:
      if (!rule && !comment.empty()) {
        pending_title_ = comment;
        heading_state_ = HeadingState::TITLED;
      }
      break;
    case HeadingState::TITLED:
      if (rule) {
        heading_state_ = HeadingState::NONE;
        return pending_title_;
      }
      break;
  }
  return std::nullopt;
}

core::SourceLine LineParser::ParseLine(const std::string& text,
                                       int line_number) {
  core::SourceLine line;
  line.line_number = line_number;
  line.raw = text;
  if (!line.raw.empty() && line.raw.back() == '\r') {
    line.raw.pop_back();
  }

  const std::string& raw = line.raw;
  std::string trimmed = core::Trim(raw);
  if (trimmed.empty()) {
    line.kind = core::LineKind::BLANK;
    heading_state_ = HeadingState::NONE;
    return line;
  }

  // Comment-only line: ';' anywhere first, or '*' in column 0
  if (raw[0] == '*' || trimmed[0] == ';') {
    line.kind = core::LineKind::COMMENT;
    line.comment = core::Trim(raw[0] == '*' ? raw.substr(1) : trimmed.substr(1));
    if (auto title = TrackHeading(line.comment)) {
      line.directive.kind = core::DirectiveKind::SECTION;
      line.directive.title = *title;
    }
    return line;
  }
  heading_state_ = HeadingState::NONE;

  size_t comment_start = FindCommentStart(raw);
  std::string code = raw.substr(0, comment_start);
  if (comment_start != std::string::npos) {
    line.comment = core::Trim(raw.substr(comment_start + 1));
  }

  bool column_zero = !std::isspace(static_cast<unsigned char>(raw[0]));
  ParseCode(code, column_zero, &line);

  if (line.kind == core::LineKind::INSTRUCTION) {
    line.cycle_override = ParseCycleOverride(line.comment);
    line.comment = StripCycleOverride(line.comment);
  }
  return line;
}

void LineParser::ParseCode(const std::string& code, bool column_zero,
                           core::SourceLine* line) const {
  std::string rest = core::Trim(code);

  // "name = expr" (with or without spaces) is SET
  size_t equals = rest.find('=');
  if (equals != std::string::npos && equals > 0) {
    std::string name = core::Trim(rest.substr(0, equals));
    if (name.size() > 1 && name.back() == ':') {
      name.pop_back();
    }
    if (core::IsIdentifier(name)) {
      line->kind = core::LineKind::DIRECTIVE;
      line->label = name;
      line->mnemonic = "=";
      line->operands = core::Trim(rest.substr(equals + 1));
      line->directive.kind = core::DirectiveKind::SET;
      line->directive.variable = name;
      line->directive.expression = ParseDirectiveExpression(
          line->operands, "SET", line->line_number);
      return;
    }
  }

  std::string first = PopToken(&rest);
  std::string second_lower = core::ToLower(PeekToken(rest));
  std::string first_lower = core::ToLower(first);

  if (!first.empty() && first.back() == ':') {
    while (!first.empty() && first.back() == ':') {
      first.pop_back();
    }
    line->label = first;
    first = PopToken(&rest);
  } else if (second_lower == "set" || second_lower == "equ") {
    line->label = first;
    first = PopToken(&rest);
  } else if (column_zero && first_lower != "rept" && first_lower != "endr") {
    line->label = first;
    first = PopToken(&rest);
  }

  if (first.empty()) {
    line->kind = core::LineKind::LABEL;
    return;
  }

  line->mnemonic = first;
  line->operands = rest;
  std::string mnemonic = core::ToLower(first);
  int number = line->line_number;

  if (mnemonic == "rept") {
    line->kind = core::LineKind::DIRECTIVE;
    line->directive.kind = core::DirectiveKind::REPT;
    line->directive.expression = ParseDirectiveExpression(rest, "REPT", number);
  } else if (mnemonic == "endr") {
    if (!rest.empty()) {
      throw MalformedLineException("ENDR takes no arguments", number);
    }
    line->kind = core::LineKind::DIRECTIVE;
    line->directive.kind = core::DirectiveKind::ENDR;
  } else if (mnemonic == "set") {
    if (!core::IsIdentifier(line->label)) {
      throw MalformedLineException(
          "SET requires a variable name, got '" + line->label + "'", number);
    }
    line->kind = core::LineKind::DIRECTIVE;
    line->directive.kind = core::DirectiveKind::SET;
    line->directive.variable = line->label;
    line->directive.expression = ParseDirectiveExpression(rest, "SET", number);
  } else if (mnemonic == "equ") {
    if (line->label.empty()) {
      throw MalformedLineException("EQU requires a name", number);
    }
    line->kind = core::LineKind::EQUATE;
  } else {
    line->kind = core::LineKind::INSTRUCTION;
  }
}

std::vector<core::SourceLine> LineParser::ParseText(const std::string& text) {
  std::vector<core::SourceLine> lines;
  size_t start = 0;
  int line_number = 1;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string::npos) {
      end = text.size();
    }
    lines.push_back(ParseLine(text.substr(start, end - start), line_number++));
    start = end + 1;
  }
  return lines;
}

}  // namespace parse
}  // namespace cyclespitter
