// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "output/devpac_formatter.h"

namespace cyclespitter {
namespace output {

std::string DevpacFormatter::FormatEquate(const std::string& name,
                                          const std::string& value) const {
  return name + "\tequ " + value;
}

std::string DevpacFormatter::FormatNopBlockOperands(int nop_count) const {
  return std::to_string(nop_count) + ",$4e71";
}

std::unique_ptr<Formatter> CreateDevpacFormatter() {
  return std::make_unique<DevpacFormatter>();
}

}  // namespace output
}  // namespace cyclespitter
