// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "schedule/scanline.h"

namespace cyclespitter {
namespace schedule {

std::string SegmentRoleName(SegmentRole role) {
  switch (role) {
    case SegmentRole::LEFT_BORDER:
      return "left border";
    case SegmentRole::RIGHT_BORDER:
      return "right border";
    case SegmentRole::STABILIZER:
      return "stabilizer";
  }
  return "unknown";
}

}  // namespace schedule
}  // namespace cyclespitter
