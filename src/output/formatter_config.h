// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef CYCLESPITTER_OUTPUT_FORMATTER_CONFIG_H_
#define CYCLESPITTER_OUTPUT_FORMATTER_CONFIG_H_

#include "core/constants.h"

namespace cyclespitter {
namespace output {

// Configuration for output formatting
struct FormatterConfig {
  // Column positions
  int opcode_column = constants::kTabWidth;
  int operand_column = 2 * constants::kTabWidth;
  int comment_column = constants::kDefaultCommentColumn;

  // Padding as one nop block line, or one nop per line
  bool expand_padding = false;

  // Annotation content
  bool show_descriptions = true;
  bool show_offsets = true;

  // Create default configuration
  static FormatterConfig Default() {
    return FormatterConfig{};
  }

  // Create configuration with individual nop lines for padding
  static FormatterConfig WithExpandedPadding() {
    FormatterConfig config;
    config.expand_padding = true;
    return config;
  }

  // Create configuration with a custom comment column
  static FormatterConfig WithCommentColumn(int comment_col) {
    FormatterConfig config;
    config.comment_column = comment_col;
    return config;
  }
};

}  // namespace output
}  // namespace cyclespitter

#endif  // CYCLESPITTER_OUTPUT_FORMATTER_CONFIG_H_
