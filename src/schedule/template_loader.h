// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef CYCLESPITTER_SCHEDULE_TEMPLATE_LOADER_H_
#define CYCLESPITTER_SCHEDULE_TEMPLATE_LOADER_H_

#include <string>

#include "cycles/cycle_resolver.h"
#include "schedule/scanline.h"

namespace cyclespitter {
namespace schedule {

// Loads the border/stabilizer template.
//
// The template uses the same syntax as the input. NOP filler lines
// ("dcb.w n,$4e71") mark the windows left for scheduled code and split the
// file into segments, in the fixed order left border, right border,
// stabilizer. Only instruction lines are injected; comments name the
// segment they appear in.
class TemplateLoader {
 public:
  explicit TemplateLoader(const cycles::CycleResolver& resolver);

  // Read and load a template file.
  // Throws ConfigException when the file cannot be read or does not hold
  // exactly three segments; parse and cost errors propagate unchanged.
  TemplateSet LoadFile(const std::string& file_path) const;

  // Load template text; `source` is recorded for the output header
  TemplateSet Load(const std::string& text, const std::string& source) const;

 private:
  const cycles::CycleResolver& resolver_;
};

}  // namespace schedule
}  // namespace cyclespitter

#endif  // CYCLESPITTER_SCHEDULE_TEMPLATE_LOADER_H_
