// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "output/gas_formatter.h"

namespace cyclespitter {
namespace output {

std::string GasFormatter::FormatEquate(const std::string& name,
                                       const std::string& value) const {
  return "\t.equ " + name + "," + value;
}

std::string GasFormatter::FormatNopBlockOperands(int nop_count) const {
  // count, size in bytes, value
  return std::to_string(nop_count) + ",2,0x4e71";
}

std::unique_ptr<Formatter> CreateGasFormatter() {
  return std::make_unique<GasFormatter>();
}

}  // namespace output
}  // namespace cyclespitter
