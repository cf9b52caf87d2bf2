// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef CYCLESPITTER_SCHEDULE_SCANLINE_H_
#define CYCLESPITTER_SCHEDULE_SCANLINE_H_

#include <string>
#include <vector>

#include "core/source_line.h"

namespace cyclespitter {
namespace schedule {

// Position of a template segment at a scanline boundary
enum class SegmentRole {
  LEFT_BORDER,
  RIGHT_BORDER,
  STABILIZER,
};

// Injected template code, shared by every scanline
struct TemplateSegment {
  SegmentRole role = SegmentRole::LEFT_BORDER;
  std::string label;  // First comment in the segment, or "Segment <n>"
  std::vector<core::CostedLine> lines;
  int total_cycles = 0;
};

// The three segments of a template file
struct TemplateSet {
  std::string source;  // File name, for the output header
  TemplateSegment left_border;
  TemplateSegment right_border;
  TemplateSegment stabilizer;
};

enum class EntryKind {
  TEMPLATE,   // Line of an injected segment
  SCHEDULED,  // Line from the input stream
  PADDING,    // Nop filler closing the scanline
};

// One emitted line of a scanline
struct ScanlineEntry {
  EntryKind kind = EntryKind::SCHEDULED;
  core::CostedLine line;  // Unused for PADDING
  int offset = 0;         // Cycles elapsed in the scanline before this entry
  int cycles = 0;

  // TEMPLATE only
  SegmentRole role = SegmentRole::LEFT_BORDER;
  std::string segment_label;
  bool segment_start = false;

  // PADDING only
  int nop_count = 0;
};

struct Scanline {
  int index = 0;  // 1-based
  std::vector<ScanlineEntry> entries;
  int total_cycles = 0;
};

// Result of scheduling a whole stream
struct Schedule {
  std::vector<Scanline> scanlines;
  int width = 0;
  int nop_cycles = 0;
  int opening_cycles = 0;  // left border + stabilizer
  int closing_cycles = 0;  // right border
  int budget = 0;          // width - opening - closing
};

// Display name of a role ("left border", ...)
std::string SegmentRoleName(SegmentRole role);

}  // namespace schedule
}  // namespace cyclespitter

#endif  // CYCLESPITTER_SCHEDULE_SCANLINE_H_
