// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef CYCLESPITTER_OUTPUT_FORMATTER_H_
#define CYCLESPITTER_OUTPUT_FORMATTER_H_

#include <memory>
#include <string>
#include <vector>

#include "core/source_line.h"
#include "output/formatter_config.h"
#include "schedule/scanline.h"

namespace cyclespitter {

namespace output {

// What the generated file is about, for its header
struct DocumentInfo {
  std::string scanlines_label;  // Equate bound to the scanline count
  std::string template_source;  // Template file name
  std::string input_source;     // Input file name
};

// Abstract output formatter interface
class Formatter {
 public:
  virtual ~Formatter() = default;

  // Formatter identification
  virtual std::string Name() const = 0;

  virtual void SetConfig(const FormatterConfig& config) = 0;

  // Format a complete schedule to string
  virtual std::string Format(const schedule::Schedule& schedule,
                             const DocumentInfo& info) = 0;

  // Format the expanded, costed stream without scanlines
  virtual std::string FormatStream(const std::vector<core::CostedLine>& lines,
                                   const DocumentInfo& info) = 0;

  // Format one costed line at a cycle offset
  virtual std::string FormatLine(const core::CostedLine& line, int offset) = 0;

  // Format nop padding of `cycles` cycles starting at `offset`
  virtual std::string FormatPadding(int nop_count, int cycles, int offset) = 0;

  // Format header/prologue
  virtual std::string FormatHeader(const DocumentInfo& info,
                                   int scanline_count) = 0;

  // Format footer/epilogue
  virtual std::string FormatFooter() = 0;
};

// Factory function type for creating formatters
using FormatterFactory = std::unique_ptr<Formatter> (*)();

}  // namespace output
}  // namespace cyclespitter

#endif  // CYCLESPITTER_OUTPUT_FORMATTER_H_
