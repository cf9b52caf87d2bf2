// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "schedule/scanline_scheduler.h"

#include "core/exceptions.h"
#include "utils/logger.h"

namespace cyclespitter {
namespace schedule {

ScanlineScheduler::ScanlineScheduler(const TemplateSet& templates, int width,
                                     int nop_cycles)
    : templates_(templates),
      width_(width),
      nop_cycles_(nop_cycles),
      opening_cycles_(templates.left_border.total_cycles +
                      templates.stabilizer.total_cycles),
      closing_cycles_(templates.right_border.total_cycles) {
  if (nop_cycles_ <= 0) {
    throw ConfigException("nop cost must be positive, got " +
                          std::to_string(nop_cycles_));
  }
  if (budget() <= 0) {
    throw TemplateExceedsBudgetException(opening_cycles_ + closing_cycles_,
                                         width_);
  }
  LOG_DEBUG("Scanline budget: " + std::to_string(width_) + " - " +
            std::to_string(opening_cycles_) + " - " +
            std::to_string(closing_cycles_) + " = " +
            std::to_string(budget()));
}

Schedule ScanlineScheduler::Run(
    const std::vector<core::CostedLine>& lines) const {
  Schedule schedule;
  schedule.width = width_;
  schedule.nop_cycles = nop_cycles_;
  schedule.opening_cycles = opening_cycles_;
  schedule.closing_cycles = closing_cycles_;
  schedule.budget = budget();

  int running = 0;
  int last_line = 0;
  bool open = false;
  std::vector<core::CostedLine> pending;  // Zero-cost lines awaiting placement

  for (const auto& line : lines) {
    if (!line.IsInstruction()) {
      pending.push_back(line);
      continue;
    }

    if (line.cycles > budget()) {
      throw InstructionExceedsBudgetException(line.source.Body(), line.cycles,
                                              budget(),
                                              line.source.line_number);
    }

    if (open && running + line.cycles > width_ - closing_cycles_) {
      Close(&schedule.scanlines.back(), &running, last_line);
      open = false;
    }
    if (!open) {
      Open(&schedule, &running);
      open = true;
    }

    Scanline& scanline = schedule.scanlines.back();
    for (const auto& zero_cost : pending) {
      ScanlineEntry entry;
      entry.kind = EntryKind::SCHEDULED;
      entry.line = zero_cost;
      entry.offset = running;
      scanline.entries.push_back(entry);
    }
    pending.clear();

    ScanlineEntry entry;
    entry.kind = EntryKind::SCHEDULED;
    entry.line = line;
    entry.offset = running;
    entry.cycles = line.cycles;
    scanline.entries.push_back(entry);
    running += line.cycles;
    last_line = line.source.line_number;
  }

  if (open) {
    Scanline& scanline = schedule.scanlines.back();
    for (const auto& zero_cost : pending) {
      ScanlineEntry entry;
      entry.kind = EntryKind::SCHEDULED;
      entry.line = zero_cost;
      entry.offset = running;
      scanline.entries.push_back(entry);
    }
    Close(&scanline, &running, last_line);
  } else if (!pending.empty()) {
    LOG_WARNING("Input holds no instructions; " +
                std::to_string(pending.size()) + " lines not scheduled");
  }

  LOG_INFO("Scheduled " + std::to_string(schedule.scanlines.size()) +
           " scanlines of " + std::to_string(width_) + " cycles");
  return schedule;
}

void ScanlineScheduler::Open(Schedule* schedule, int* running) const {
  Scanline scanline;
  scanline.index = static_cast<int>(schedule->scanlines.size()) + 1;
  *running = 0;
  AppendSegment(templates_.left_border, &scanline, running);
  AppendSegment(templates_.stabilizer, &scanline, running);
  schedule->scanlines.push_back(scanline);
}

void ScanlineScheduler::Close(Scanline* scanline, int* running,
                              int last_line) const {
  AppendSegment(templates_.right_border, scanline, running);

  int gap = width_ - *running;
  if (gap % nop_cycles_ != 0) {
    throw UnfillableGapException(scanline->index, gap, nop_cycles_, last_line);
  }
  if (gap > 0) {
    ScanlineEntry padding;
    padding.kind = EntryKind::PADDING;
    padding.offset = *running;
    padding.cycles = gap;
    padding.nop_count = gap / nop_cycles_;
    scanline->entries.push_back(padding);
    *running += gap;
  }
  scanline->total_cycles = *running;

  LOG_DEBUG("Scanline " + std::to_string(scanline->index) + " closed with " +
            std::to_string(gap) + " cycles of padding");
}

void ScanlineScheduler::AppendSegment(const TemplateSegment& segment,
                                      Scanline* scanline, int* running) const {
  bool first = true;
  for (const auto& line : segment.lines) {
    ScanlineEntry entry;
    entry.kind = EntryKind::TEMPLATE;
    entry.line = line;
    entry.offset = *running;
    entry.cycles = line.cycles;
    entry.role = segment.role;
    entry.segment_label = segment.label;
    entry.segment_start = first;
    scanline->entries.push_back(entry);
    *running += line.cycles;
    first = false;
  }
}

}  // namespace schedule
}  // namespace cyclespitter
