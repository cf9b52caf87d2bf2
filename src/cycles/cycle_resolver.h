// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef CYCLESPITTER_CYCLES_CYCLE_RESOLVER_H_
#define CYCLESPITTER_CYCLES_CYCLE_RESOLVER_H_

#include <optional>
#include <string>
#include <vector>

#include "core/source_line.h"
#include "cycles/cost_overrides.h"
#include "cycles/cost_table.h"
#include "cycles/instruction_shape.h"

namespace cyclespitter {
namespace cycles {

// Assigns a cycle cost and a shape description to expanded lines.
//
// Rules are tried in a fixed order and the first match wins:
//   1. OVERRIDE: inline "(n)" comment, then the external cost table
//   2. DYNAMIC:  movem register lists, immediate shift counts, dcb nops
//   3. TABLE:    static cost table keyed by shape
// Anything else is an UnknownInstructionCostException; costs are never
// guessed. Non-instruction lines cost 0.
class CycleResolver {
 public:
  explicit CycleResolver(const CostTable& table = CostTable::Instance(),
                         const CostOverrides* overrides = nullptr);

  core::CostedLine Resolve(const core::ExpandedLine& line) const;

  std::vector<core::CostedLine> ResolveAll(
      const std::vector<core::ExpandedLine>& lines) const;

  // Cost of one padding nop
  int NopCycles() const { return table_.NopCycles(); }

 private:
  struct DynamicCost {
    int cycles = 0;
    std::string description;
  };

  std::optional<DynamicCost> ResolveDynamic(const InstructionShape& shape,
                                            int line_number) const;
  std::optional<DynamicCost> ResolveRegisterList(
      const InstructionShape& shape) const;
  std::optional<DynamicCost> ResolveShiftCount(const InstructionShape& shape,
                                               int line_number) const;
  std::optional<DynamicCost> ResolveNopBlock(const InstructionShape& shape,
                                             int line_number) const;

  const CostTable& table_;
  const CostOverrides* overrides_;
};

}  // namespace cycles
}  // namespace cyclespitter

#endif  // CYCLESPITTER_CYCLES_CYCLE_RESOLVER_H_
