// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef CYCLESPITTER_CORE_CONSTANTS_H_
#define CYCLESPITTER_CORE_CONSTANTS_H_

#include <cstddef>
#include <cstdint>

namespace cyclespitter {
namespace constants {

// Tool identification
constexpr const char* kToolName = "cycleSpitter";
constexpr const char* kToolVersion = "1.0.0";

// Scanline defaults (Atari ST, 50Hz PAL: 512 cycles per raster line)
constexpr int kDefaultScanlineCycles = 512;
constexpr int kDefaultNopCycles = 4;
constexpr const char* kDefaultScanlinesLabel = "SCANLINES_CONSUMED";
constexpr const char* kDefaultInputFile = "sample.s";
constexpr const char* kDefaultTemplateFile = "template.s";

// NOP opcode used by dcb.w filler lines
constexpr uint16_t kNopOpcode = 0x4E71;

// Macro expansion limits
constexpr size_t kMaxExpandedLines = 1000000;

// Section heading detection
constexpr size_t kMinBoxRuleLength = 8;
constexpr size_t kMinInlineRuleLength = 3;

// Formatting constants
constexpr int kDefaultCommentColumn = 40;
constexpr int kTabWidth = 8;

// Exit codes (one per fatal error kind)
constexpr int kExitSuccess = 0;
constexpr int kExitGeneric = 1;
constexpr int kExitConfig = 2;
constexpr int kExitMalformedLine = 10;
constexpr int kExitUnbalancedRept = 11;
constexpr int kExitUndefinedVariable = 12;
constexpr int kExitUnknownInstructionCost = 13;
constexpr int kExitTemplateExceedsBudget = 14;
constexpr int kExitUnfillableGap = 15;
constexpr int kExitInstructionExceedsBudget = 16;

}  // namespace constants
}  // namespace cyclespitter

#endif  // CYCLESPITTER_CORE_CONSTANTS_H_
