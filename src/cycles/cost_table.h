// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef CYCLESPITTER_CYCLES_COST_TABLE_H_
#define CYCLESPITTER_CYCLES_COST_TABLE_H_

#include <map>
#include <optional>
#include <string>
#include <unordered_map>

#include "core/operand.h"

namespace cyclespitter {
namespace cycles {

// Operand-dependent cost rules
enum class DynamicRule {
  NONE,
  REGISTER_LIST,  // movem: base + per-register x count
  SHIFT_COUNT,    // lsl.w #n,dn: 6 + 2n (8 + 2n for .l)
  NOP_BLOCK,      // dcb.w n,$4e71: n x nop
};

// Static 68000 timing table (cycles, no wait states), keyed by normalized
// shape such as "move.w dn,xxx.w" or "lea.l d(an),an".
//
// Data-dependent instructions (mulu/muls/divu/divs, conditional branches,
// dbcc, shifts by a register count) are not in the table and need an
// explicit override.
class CostTable {
 public:
  // Get singleton instance
  static CostTable& Instance();

  // Cost of a shape; nullopt when the shape is not in the table
  std::optional<int> Lookup(const std::string& key) const;

  bool Contains(const std::string& key) const;

  // Cost of one nop (the padding unit)
  int NopCycles() const;

  // Dynamic rule applicable to a normalized base mnemonic
  static DynamicRule RuleFor(const std::string& base);

  // movem base cost for the memory operand's mode; nullopt for modes the
  // instruction does not support in that direction
  std::optional<int> MovemBase(core::AddressingMode mode,
                               bool to_memory) const;

  // movem cost per transferred register
  static int MovemPerRegister(char size);

  // Register shift/rotate by an immediate count
  static int ShiftCost(char size, int count);

  // Effective address calculation time for a mode
  static int EffectiveAddressCycles(core::AddressingMode mode, char size);

  size_t size() const { return costs_.size(); }

  // Prevent copying
  CostTable(const CostTable&) = delete;
  CostTable& operator=(const CostTable&) = delete;

 private:
  CostTable();

  void Add(const std::string& key, int cycles);

  void BuildMoves();
  void BuildArithmetic();
  void BuildImmediates();
  void BuildSingleOperand();
  void BuildControl();
  void BuildBitOperations();
  void BuildShifts();
  void BuildMisc();

  std::unordered_map<std::string, int> costs_;
  std::map<core::AddressingMode, int> movem_to_registers_;
  std::map<core::AddressingMode, int> movem_to_memory_;
};

}  // namespace cycles
}  // namespace cyclespitter

#endif  // CYCLESPITTER_CYCLES_COST_TABLE_H_
