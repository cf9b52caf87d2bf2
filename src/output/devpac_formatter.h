// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef CYCLESPITTER_OUTPUT_DEVPAC_FORMATTER_H_
#define CYCLESPITTER_OUTPUT_DEVPAC_FORMATTER_H_

#include <memory>
#include <string>

#include "output/base_formatter.h"

namespace cyclespitter {
namespace output {

// Devpac / vasm (mot syntax) formatter, the native dialect of the input
class DevpacFormatter : public BaseFormatter {
 public:
  DevpacFormatter() = default;
  ~DevpacFormatter() override = default;

  std::string Name() const override { return "Devpac"; }

 protected:
  std::string GetCommentPrefix() const override { return "; "; }

  std::string FormatEquate(const std::string& name,
                           const std::string& value) const override;

  std::string GetNopBlockDirective() const override { return "dcb.w"; }
  std::string FormatNopBlockOperands(int nop_count) const override;
};

// Factory function
std::unique_ptr<Formatter> CreateDevpacFormatter();

}  // namespace output
}  // namespace cyclespitter

#endif  // CYCLESPITTER_OUTPUT_DEVPAC_FORMATTER_H_
