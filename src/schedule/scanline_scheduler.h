// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef CYCLESPITTER_SCHEDULE_SCANLINE_SCHEDULER_H_
#define CYCLESPITTER_SCHEDULE_SCANLINE_SCHEDULER_H_

#include <vector>

#include "core/constants.h"
#include "core/source_line.h"
#include "schedule/scanline.h"

namespace cyclespitter {
namespace schedule {

// Packs a costed stream into scanlines of exactly `width` cycles.
//
// Every scanline opens with the left border and the stabilizer and closes
// with the right border followed by nop padding. Instructions are placed in
// source order and never split: one that does not fit in the space left
// starts the next scanline. Zero-cost lines (comments, equates) travel with
// the instruction that follows them.
class ScanlineScheduler {
 public:
  // Throws TemplateExceedsBudgetException when the template leaves no room
  // for scheduled code, ConfigException for a non-positive nop cost.
  ScanlineScheduler(const TemplateSet& templates,
                    int width = constants::kDefaultScanlineCycles,
                    int nop_cycles = constants::kDefaultNopCycles);

  // Schedule a whole stream. Throws InstructionExceedsBudgetException and
  // UnfillableGapException. An input without instructions yields no
  // scanlines.
  Schedule Run(const std::vector<core::CostedLine>& lines) const;

  int opening_cycles() const { return opening_cycles_; }
  int closing_cycles() const { return closing_cycles_; }
  int budget() const { return width_ - opening_cycles_ - closing_cycles_; }

 private:
  // Open a new scanline with the opening segments
  void Open(Schedule* schedule, int* running) const;

  // Append the right border and the padding
  void Close(Scanline* scanline, int* running, int last_line) const;

  void AppendSegment(const TemplateSegment& segment, Scanline* scanline,
                     int* running) const;

  TemplateSet templates_;
  int width_;
  int nop_cycles_;
  int opening_cycles_;
  int closing_cycles_;
};

}  // namespace schedule
}  // namespace cyclespitter

#endif  // CYCLESPITTER_SCHEDULE_SCANLINE_SCHEDULER_H_
