// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "cycles/cycle_resolver.h"

#include "core/exceptions.h"
#include "core/operand.h"
#include "utils/logger.h"

namespace cyclespitter {
namespace cycles {

namespace {

bool IsRegisterOperand(core::AddressingMode mode) {
  return mode == core::AddressingMode::REGISTER_LIST ||
         mode == core::AddressingMode::DATA_REGISTER ||
         mode == core::AddressingMode::ADDRESS_REGISTER;
}

}  // namespace

CycleResolver::CycleResolver(const CostTable& table,
                             const CostOverrides* overrides)
    : table_(table), overrides_(overrides) {}

core::CostedLine CycleResolver::Resolve(const core::ExpandedLine& line) const {
  core::CostedLine costed;
  costed.source = line;
  if (!line.HasInstruction()) {
    return costed;
  }

  InstructionShape shape = ClassifyInstruction(line.mnemonic, line.operands);

  // 1. Overrides
  std::optional<int> override_cycles = line.cycle_override;
  if (!override_cycles && overrides_ != nullptr) {
    override_cycles = overrides_->Find(line.Body(), shape.key);
  }

  if (override_cycles) {
    costed.cycles = *override_cycles;
    costed.rule = core::CostRuleKind::OVERRIDE;
    costed.description = shape.IsClassified() ? shape.key : "(override)";
  } else if (auto dynamic = ResolveDynamic(shape, line.line_number)) {
    // 2. Operand-dependent rules
    costed.cycles = dynamic->cycles;
    costed.rule = core::CostRuleKind::DYNAMIC;
    costed.description = dynamic->description;
  } else if (auto cycles = table_.Lookup(shape.key)) {
    // 3. Static table
    costed.cycles = *cycles;
    costed.rule = core::CostRuleKind::TABLE;
    costed.description = shape.key;
  } else {
    throw UnknownInstructionCostException(line.Body(), shape.key,
                                          line.line_number,
                                          DataDependentReason(shape));
  }

  if (costed.cycles % table_.NopCycles() != 0) {
    LOG_WARNING("Line " + std::to_string(line.line_number) + ": '" +
                line.Body() + "' costs " + std::to_string(costed.cycles) +
                " cycles, not a multiple of " +
                std::to_string(table_.NopCycles()));
  }
  LOG_DEBUG("Line " + std::to_string(line.line_number) + ": " + line.Body() +
            " -> " + std::to_string(costed.cycles) + " (" +
            core::CostRuleKindName(costed.rule) + ": " + costed.description +
            ")");
  return costed;
}

std::vector<core::CostedLine> CycleResolver::ResolveAll(
    const std::vector<core::ExpandedLine>& lines) const {
  std::vector<core::CostedLine> costed;
  costed.reserve(lines.size());
  for (const auto& line : lines) {
    costed.push_back(Resolve(line));
  }
  return costed;
}

std::optional<CycleResolver::DynamicCost> CycleResolver::ResolveDynamic(
    const InstructionShape& shape, int line_number) const {
  switch (CostTable::RuleFor(shape.base)) {
    case DynamicRule::REGISTER_LIST:
      return ResolveRegisterList(shape);
    case DynamicRule::SHIFT_COUNT:
      return ResolveShiftCount(shape, line_number);
    case DynamicRule::NOP_BLOCK:
      return ResolveNopBlock(shape, line_number);
    case DynamicRule::NONE:
      break;
  }
  return std::nullopt;
}

std::optional<CycleResolver::DynamicCost> CycleResolver::ResolveRegisterList(
    const InstructionShape& shape) const {
  if (shape.modes.size() != 2 || (shape.size != 'w' && shape.size != 'l')) {
    return std::nullopt;
  }

  bool to_memory = IsRegisterOperand(shape.modes[0]) &&
                   !IsRegisterOperand(shape.modes[1]);
  bool to_registers = IsRegisterOperand(shape.modes[1]) &&
                      !IsRegisterOperand(shape.modes[0]);
  if (!to_memory && !to_registers) {
    return std::nullopt;
  }

  const std::string& list = shape.operands[to_memory ? 0 : 1];
  core::AddressingMode memory = shape.modes[to_memory ? 1 : 0];
  std::optional<int> count = core::CountRegisters(list);
  std::optional<int> base = table_.MovemBase(memory, to_memory);
  if (!count || !base) {
    return std::nullopt;
  }

  std::string memory_shape = core::AddressingModeShape(memory);
  DynamicCost cost;
  cost.cycles = *base + CostTable::MovemPerRegister(shape.size) * *count;
  cost.description = shape.mnemonic + " " +
                     (to_memory ? "reglist," + memory_shape
                                : memory_shape + ",reglist") +
                     " " + std::to_string(*base) + "+" +
                     std::to_string(*count) + "x" +
                     std::to_string(CostTable::MovemPerRegister(shape.size));
  return cost;
}

std::optional<CycleResolver::DynamicCost> CycleResolver::ResolveShiftCount(
    const InstructionShape& shape, int line_number) const {
  if (shape.modes.size() != 2 ||
      shape.modes[0] != core::AddressingMode::IMMEDIATE ||
      shape.modes[1] != core::AddressingMode::DATA_REGISTER) {
    return std::nullopt;
  }

  std::optional<int64_t> count =
      EvaluateConstantOperand(shape.operands[0].substr(1), line_number);
  if (!count || *count < 1 || *count > 8) {
    return std::nullopt;
  }

  DynamicCost cost;
  cost.cycles = CostTable::ShiftCost(shape.size, static_cast<int>(*count));
  cost.description = shape.key + " n=" + std::to_string(*count);
  return cost;
}

std::optional<CycleResolver::DynamicCost> CycleResolver::ResolveNopBlock(
    const InstructionShape& shape, int line_number) const {
  std::optional<int64_t> count = NopBlockCount(shape, line_number);
  if (!count) {
    return std::nullopt;
  }

  DynamicCost cost;
  cost.cycles = static_cast<int>(*count) * table_.NopCycles();
  cost.description = "dcb.w " + std::to_string(*count) + " x nop";
  return cost;
}

}  // namespace cycles
}  // namespace cyclespitter
