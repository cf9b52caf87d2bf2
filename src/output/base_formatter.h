// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef CYCLESPITTER_OUTPUT_BASE_FORMATTER_H_
#define CYCLESPITTER_OUTPUT_BASE_FORMATTER_H_

#include <ostream>
#include <string>
#include <vector>

#include "output/formatter.h"

namespace cyclespitter {
namespace output {

// Base formatter implementing Template Method pattern.
// Layout, annotations and scanline structure are shared; dialects supply
// comment syntax, equates and nop blocks.
class BaseFormatter : public Formatter {
 public:
  BaseFormatter() = default;
  ~BaseFormatter() override = default;

  void SetConfig(const FormatterConfig& config) final { config_ = config; }
  const FormatterConfig& config() const { return config_; }

  // Formatter interface - final implementations (Template Method pattern)
  std::string Format(const schedule::Schedule& schedule,
                     const DocumentInfo& info) final;

  std::string FormatStream(const std::vector<core::CostedLine>& lines,
                           const DocumentInfo& info) final;

  std::string FormatLine(const core::CostedLine& line, int offset) final;

  std::string FormatPadding(int nop_count, int cycles, int offset) final;

  std::string FormatHeader(const DocumentInfo& info,
                           int scanline_count) final;

  std::string FormatFooter() final;

 protected:
  // Template methods - subclasses must implement these

  // Comment style
  virtual std::string GetCommentPrefix() const = 0;  // "; ", "| "

  // "NAME equ value", ".equ NAME,value"
  virtual std::string FormatEquate(const std::string& name,
                                   const std::string& value) const = 0;

  // Nop block directive and its operands: "dcb.w" + "n,$4e71",
  // ".fill" + "n,2,0x4e71"
  virtual std::string GetNopBlockDirective() const = 0;
  virtual std::string FormatNopBlockOperands(int nop_count) const = 0;

  // Hook methods - optional overrides for format-specific behavior
  virtual std::string FormatLabel(const std::string& label) const {
    return label + ":";
  }
  virtual std::string FormatFooterContent() { return ""; }

 private:
  // Code text padded to the comment column, followed by the comment
  std::string Layout(const std::string& label, const std::string& mnemonic,
                     const std::string& operands,
                     const std::string& comment) const;

  // "(8) move.w #xxx,dn [24]"
  std::string Annotation(int cycles, const std::string& description,
                         int offset) const;

  // `code` padded to the comment column, followed by the comment
  std::string AppendComment(const std::string& code,
                            const std::string& comment) const;

  std::string CommentLine(const std::string& text) const;

  // Section marker when `origin` differs from the last one written
  void WriteSectionChange(std::ostream& out, const core::Origin& origin);

  // Input line with its section marker
  void WriteSourceLine(std::ostream& out, const core::CostedLine& line,
                       int offset);

  void WriteScanline(std::ostream& out, const schedule::Scanline& scanline);

  core::Origin last_origin_;
  FormatterConfig config_;
};

}  // namespace output
}  // namespace cyclespitter

#endif  // CYCLESPITTER_OUTPUT_BASE_FORMATTER_H_
