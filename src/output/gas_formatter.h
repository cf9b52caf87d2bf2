// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef CYCLESPITTER_OUTPUT_GAS_FORMATTER_H_
#define CYCLESPITTER_OUTPUT_GAS_FORMATTER_H_

#include <memory>
#include <string>

#include "output/base_formatter.h"

namespace cyclespitter {
namespace output {

// GNU as (m68k-elf) formatter.
// Instructions are passed through as written; only comments, equates and
// padding use GNU syntax.
class GasFormatter : public BaseFormatter {
 public:
  GasFormatter() = default;
  ~GasFormatter() override = default;

  std::string Name() const override { return "GNU as"; }

 protected:
  std::string GetCommentPrefix() const override { return "| "; }

  std::string FormatEquate(const std::string& name,
                           const std::string& value) const override;

  std::string GetNopBlockDirective() const override { return ".fill"; }
  std::string FormatNopBlockOperands(int nop_count) const override;
};

// Factory function
std::unique_ptr<Formatter> CreateGasFormatter();

}  // namespace output
}  // namespace cyclespitter

#endif  // CYCLESPITTER_OUTPUT_GAS_FORMATTER_H_
