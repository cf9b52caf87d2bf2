// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "cycles/cost_table.h"

#include <initializer_list>
#include <vector>

#include "core/constants.h"
#include "utils/logger.h"

namespace cyclespitter {
namespace cycles {

namespace {

using core::AddressingMode;

const std::vector<AddressingMode> kAllSources = {
    AddressingMode::DATA_REGISTER,   AddressingMode::ADDRESS_REGISTER,
    AddressingMode::INDIRECT,        AddressingMode::POST_INCREMENT,
    AddressingMode::PRE_DECREMENT,   AddressingMode::DISPLACEMENT,
    AddressingMode::INDEXED,         AddressingMode::ABSOLUTE_SHORT,
    AddressingMode::ABSOLUTE_LONG,   AddressingMode::PC_DISPLACEMENT,
    AddressingMode::PC_INDEXED,      AddressingMode::IMMEDIATE,
};

// Memory alterable destinations
const std::vector<AddressingMode> kMemory = {
    AddressingMode::INDIRECT,      AddressingMode::POST_INCREMENT,
    AddressingMode::PRE_DECREMENT, AddressingMode::DISPLACEMENT,
    AddressingMode::INDEXED,       AddressingMode::ABSOLUTE_SHORT,
    AddressingMode::ABSOLUTE_LONG,
};

// Memory modes readable by btst (adds pc-relative forms)
const std::vector<AddressingMode> kReadableMemory = {
    AddressingMode::INDIRECT,        AddressingMode::POST_INCREMENT,
    AddressingMode::PRE_DECREMENT,   AddressingMode::DISPLACEMENT,
    AddressingMode::INDEXED,         AddressingMode::ABSOLUTE_SHORT,
    AddressingMode::ABSOLUTE_LONG,   AddressingMode::PC_DISPLACEMENT,
    AddressingMode::PC_INDEXED,
};

struct ControlTiming {
  AddressingMode mode;
  int lea;
  int pea;
  int jmp;
  int jsr;
};

const ControlTiming kControlTimings[] = {
    {AddressingMode::INDIRECT, 4, 12, 8, 16},
    {AddressingMode::DISPLACEMENT, 8, 16, 10, 18},
    {AddressingMode::INDEXED, 12, 20, 14, 22},
    {AddressingMode::ABSOLUTE_SHORT, 8, 16, 10, 18},
    {AddressingMode::ABSOLUTE_LONG, 12, 20, 12, 20},
    {AddressingMode::PC_DISPLACEMENT, 8, 16, 10, 18},
    {AddressingMode::PC_INDEXED, 12, 20, 14, 22},
};

const char* const kSizes[] = {"b", "w", "l"};

std::string Key(const std::string& mnemonic,
                std::initializer_list<AddressingMode> modes) {
  std::string key = mnemonic;
  bool first = true;
  for (AddressingMode mode : modes) {
    key += first ? " " : ",";
    key += core::AddressingModeShape(mode);
    first = false;
  }
  return key;
}

bool IsRegisterOrImmediate(AddressingMode mode) {
  return mode == AddressingMode::DATA_REGISTER ||
         mode == AddressingMode::ADDRESS_REGISTER ||
         mode == AddressingMode::IMMEDIATE;
}

// MOVE destination time including the operand write
int MoveDestination(AddressingMode mode, char size) {
  bool is_long = size == 'l';
  switch (mode) {
    case AddressingMode::DATA_REGISTER:
      return 4;
    case AddressingMode::INDIRECT:
    case AddressingMode::POST_INCREMENT:
    case AddressingMode::PRE_DECREMENT:
      return is_long ? 12 : 8;
    case AddressingMode::DISPLACEMENT:
    case AddressingMode::ABSOLUTE_SHORT:
      return is_long ? 16 : 12;
    case AddressingMode::INDEXED:
      return is_long ? 18 : 14;
    case AddressingMode::ABSOLUTE_LONG:
      return is_long ? 20 : 16;
    default:
      return 0;
  }
}

}  // namespace

CostTable& CostTable::Instance() {
  static CostTable instance;
  return instance;
}

CostTable::CostTable() {
  BuildMoves();
  BuildArithmetic();
  BuildImmediates();
  BuildSingleOperand();
  BuildControl();
  BuildBitOperations();
  BuildShifts();
  BuildMisc();
  LOG_DEBUG("Cost table holds " + std::to_string(costs_.size()) + " shapes");
}

void CostTable::Add(const std::string& key, int cycles) {
  costs_[key] = cycles;
}

std::optional<int> CostTable::Lookup(const std::string& key) const {
  auto it = costs_.find(key);
  if (it == costs_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool CostTable::Contains(const std::string& key) const {
  return costs_.find(key) != costs_.end();
}

int CostTable::NopCycles() const {
  return Lookup("nop").value_or(constants::kDefaultNopCycles);
}

int CostTable::EffectiveAddressCycles(AddressingMode mode, char size) {
  bool is_long = size == 'l';
  switch (mode) {
    case AddressingMode::INDIRECT:
    case AddressingMode::POST_INCREMENT:
    case AddressingMode::IMMEDIATE:
      return is_long ? 8 : 4;
    case AddressingMode::PRE_DECREMENT:
      return is_long ? 10 : 6;
    case AddressingMode::DISPLACEMENT:
    case AddressingMode::ABSOLUTE_SHORT:
    case AddressingMode::PC_DISPLACEMENT:
      return is_long ? 12 : 8;
    case AddressingMode::INDEXED:
    case AddressingMode::PC_INDEXED:
      return is_long ? 14 : 10;
    case AddressingMode::ABSOLUTE_LONG:
      return is_long ? 16 : 12;
    default:
      return 0;
  }
}

DynamicRule CostTable::RuleFor(const std::string& base) {
  if (base == "movem") {
    return DynamicRule::REGISTER_LIST;
  }
  if (base == "asl" || base == "asr" || base == "lsl" || base == "lsr" ||
      base == "rol" || base == "ror" || base == "roxl" || base == "roxr") {
    return DynamicRule::SHIFT_COUNT;
  }
  if (base == "dcb") {
    return DynamicRule::NOP_BLOCK;
  }
  return DynamicRule::NONE;
}

std::optional<int> CostTable::MovemBase(AddressingMode mode,
                                        bool to_memory) const {
  const auto& bases = to_memory ? movem_to_memory_ : movem_to_registers_;
  auto it = bases.find(mode);
  if (it == bases.end()) {
    return std::nullopt;
  }
  return it->second;
}

int CostTable::MovemPerRegister(char size) {
  return size == 'l' ? 8 : 4;
}

int CostTable::ShiftCost(char size, int count) {
  return (size == 'l' ? 8 : 6) + 2 * count;
}

void CostTable::BuildMoves() {
  for (const char* s : kSizes) {
    char size = s[0];
    std::string move = std::string("move.") + s;
    for (AddressingMode src : kAllSources) {
      if (src == AddressingMode::ADDRESS_REGISTER && size == 'b') {
        continue;
      }
      int ea = EffectiveAddressCycles(src, size);
      Add(Key(move, {src, AddressingMode::DATA_REGISTER}),
          MoveDestination(AddressingMode::DATA_REGISTER, size) + ea);
      for (AddressingMode dst : kMemory) {
        Add(Key(move, {src, dst}), MoveDestination(dst, size) + ea);
      }
      if (size != 'b') {
        // movea, also reached through "move.w <ea>,an"
        Add(Key(move, {src, AddressingMode::ADDRESS_REGISTER}), 4 + ea);
        Add(Key(std::string("movea.") + s,
                {src, AddressingMode::ADDRESS_REGISTER}),
            4 + ea);
      }
    }
  }

  Add(Key("moveq.l", {AddressingMode::IMMEDIATE, AddressingMode::DATA_REGISTER}),
      4);

  // Status register and user stack pointer
  Add(Key("move.w", {AddressingMode::STATUS_REGISTER,
                     AddressingMode::DATA_REGISTER}),
      6);
  for (AddressingMode dst : kMemory) {
    Add(Key("move.w", {AddressingMode::STATUS_REGISTER, dst}),
        8 + EffectiveAddressCycles(dst, 'w'));
  }
  for (AddressingMode src : kAllSources) {
    if (src == AddressingMode::ADDRESS_REGISTER) {
      continue;
    }
    int ea = EffectiveAddressCycles(src, 'w');
    Add(Key("move.w", {src, AddressingMode::CONDITION_CODES}), 12 + ea);
    Add(Key("move.w", {src, AddressingMode::STATUS_REGISTER}), 12 + ea);
  }
  for (const char* s : {"move.w", "move.l"}) {
    Add(Key(s, {AddressingMode::USER_STACK, AddressingMode::ADDRESS_REGISTER}),
        4);
    Add(Key(s, {AddressingMode::ADDRESS_REGISTER, AddressingMode::USER_STACK}),
        4);
  }

  // movep
  for (const char* s : {"movep.w", "movep.l"}) {
    int cycles = s[6] == 'l' ? 24 : 16;
    Add(Key(s, {AddressingMode::DATA_REGISTER, AddressingMode::DISPLACEMENT}),
        cycles);
    Add(Key(s, {AddressingMode::DISPLACEMENT, AddressingMode::DATA_REGISTER}),
        cycles);
  }
}

void CostTable::BuildArithmetic() {
  for (const char* op : {"add", "sub", "and", "or"}) {
    bool logical = std::string(op) == "and" || std::string(op) == "or";
    for (const char* s : kSizes) {
      char size = s[0];
      std::string mnemonic = std::string(op) + "." + s;

      // <ea>,dn
      for (AddressingMode src : kAllSources) {
        if (src == AddressingMode::ADDRESS_REGISTER && (logical || size == 'b')) {
          continue;
        }
        int ea = EffectiveAddressCycles(src, size);
        int cycles = size == 'l'
                         ? 6 + ea + (IsRegisterOrImmediate(src) ? 2 : 0)
                         : 4 + ea;
        Add(Key(mnemonic, {src, AddressingMode::DATA_REGISTER}), cycles);
      }

      // dn,<mem>
      for (AddressingMode dst : kMemory) {
        Add(Key(mnemonic, {AddressingMode::DATA_REGISTER, dst}),
            (size == 'l' ? 12 : 8) + EffectiveAddressCycles(dst, size));
      }
    }
  }

  // adda/suba, also reached through "add.w <ea>,an"
  for (const char* op : {"add", "sub"}) {
    for (const char* s : {"w", "l"}) {
      char size = s[0];
      for (AddressingMode src : kAllSources) {
        int ea = EffectiveAddressCycles(src, size);
        int cycles = size == 'l'
                         ? 6 + ea + (IsRegisterOrImmediate(src) ? 2 : 0)
                         : 8 + ea;
        Add(Key(std::string(op) + "." + s,
                {src, AddressingMode::ADDRESS_REGISTER}),
            cycles);
        Add(Key(std::string(op) + "a." + s,
                {src, AddressingMode::ADDRESS_REGISTER}),
            cycles);
      }
    }
  }

  // cmp <ea>,dn and cmpa <ea>,an
  for (const char* s : kSizes) {
    char size = s[0];
    for (AddressingMode src : kAllSources) {
      int ea = EffectiveAddressCycles(src, size);
      if (!(src == AddressingMode::ADDRESS_REGISTER && size == 'b')) {
        Add(Key(std::string("cmp.") + s, {src, AddressingMode::DATA_REGISTER}),
            (size == 'l' ? 6 : 4) + ea);
      }
      if (size != 'b') {
        Add(Key(std::string("cmp.") + s,
                {src, AddressingMode::ADDRESS_REGISTER}),
            6 + ea);
        Add(Key(std::string("cmpa.") + s,
                {src, AddressingMode::ADDRESS_REGISTER}),
            6 + ea);
      }
    }
  }

  for (const char* s : kSizes) {
    char size = s[0];
    bool is_long = size == 'l';

    // eor dn,<ea>
    std::string eor = std::string("eor.") + s;
    Add(Key(eor, {AddressingMode::DATA_REGISTER, AddressingMode::DATA_REGISTER}),
        is_long ? 8 : 4);
    for (AddressingMode dst : kMemory) {
      Add(Key(eor, {AddressingMode::DATA_REGISTER, dst}),
          (is_long ? 12 : 8) + EffectiveAddressCycles(dst, size));
    }

    // Extended arithmetic
    for (const char* op : {"addx.", "subx."}) {
      Add(Key(op + std::string(s), {AddressingMode::DATA_REGISTER,
                                    AddressingMode::DATA_REGISTER}),
          is_long ? 8 : 4);
      Add(Key(op + std::string(s), {AddressingMode::PRE_DECREMENT,
                                    AddressingMode::PRE_DECREMENT}),
          is_long ? 30 : 18);
    }

    Add(Key(std::string("cmpm.") + s, {AddressingMode::POST_INCREMENT,
                                       AddressingMode::POST_INCREMENT}),
        is_long ? 20 : 12);
  }

  for (const char* op : {"abcd.b", "sbcd.b"}) {
    Add(Key(op, {AddressingMode::DATA_REGISTER, AddressingMode::DATA_REGISTER}),
        6);
    Add(Key(op, {AddressingMode::PRE_DECREMENT, AddressingMode::PRE_DECREMENT}),
        18);
  }
}

void CostTable::BuildImmediates() {
  // addi/subi/andi/ori/eori; the plain mnemonic with an immediate source and
  // a memory destination assembles to the same instruction
  for (const char* op : {"add", "sub", "and", "or", "eor"}) {
    for (const char* s : kSizes) {
      char size = s[0];
      bool is_long = size == 'l';
      std::string immediate = std::string(op) + "i." + s;
      std::string plain = std::string(op) + "." + s;

      Add(Key(immediate,
              {AddressingMode::IMMEDIATE, AddressingMode::DATA_REGISTER}),
          is_long ? 16 : 8);
      for (AddressingMode dst : kMemory) {
        int cycles = (is_long ? 20 : 12) + EffectiveAddressCycles(dst, size);
        Add(Key(immediate, {AddressingMode::IMMEDIATE, dst}), cycles);
        Add(Key(plain, {AddressingMode::IMMEDIATE, dst}), cycles);
      }
    }
  }
  // eor has no <ea>,dn form, so "eor #n,dn" is eori
  for (const char* s : kSizes) {
    Add(Key(std::string("eor.") + s,
            {AddressingMode::IMMEDIATE, AddressingMode::DATA_REGISTER}),
        s[0] == 'l' ? 16 : 8);
  }

  // Logical immediates to the status register
  for (const char* op : {"and", "or", "eor"}) {
    for (const std::string& mnemonic :
         {std::string(op) + "i", std::string(op)}) {
      Add(Key(mnemonic + ".b",
              {AddressingMode::IMMEDIATE, AddressingMode::CONDITION_CODES}),
          20);
      Add(Key(mnemonic + ".w",
              {AddressingMode::IMMEDIATE, AddressingMode::CONDITION_CODES}),
          20);
      Add(Key(mnemonic + ".w",
              {AddressingMode::IMMEDIATE, AddressingMode::STATUS_REGISTER}),
          20);
    }
  }

  // cmpi
  for (const char* s : kSizes) {
    char size = s[0];
    bool is_long = size == 'l';
    Add(Key(std::string("cmpi.") + s,
            {AddressingMode::IMMEDIATE, AddressingMode::DATA_REGISTER}),
        is_long ? 14 : 8);
    for (AddressingMode dst : kMemory) {
      int cycles = (is_long ? 12 : 8) + EffectiveAddressCycles(dst, size);
      Add(Key(std::string("cmpi.") + s, {AddressingMode::IMMEDIATE, dst}),
          cycles);
      Add(Key(std::string("cmp.") + s, {AddressingMode::IMMEDIATE, dst}),
          cycles);
    }
  }

  // addq/subq
  for (const char* op : {"addq.", "subq."}) {
    for (const char* s : kSizes) {
      char size = s[0];
      bool is_long = size == 'l';
      std::string mnemonic = op + std::string(s);
      Add(Key(mnemonic,
              {AddressingMode::IMMEDIATE, AddressingMode::DATA_REGISTER}),
          is_long ? 8 : 4);
      if (size != 'b') {
        Add(Key(mnemonic,
                {AddressingMode::IMMEDIATE, AddressingMode::ADDRESS_REGISTER}),
            8);
      }
      for (AddressingMode dst : kMemory) {
        Add(Key(mnemonic, {AddressingMode::IMMEDIATE, dst}),
            (is_long ? 12 : 8) + EffectiveAddressCycles(dst, size));
      }
    }
  }
}

void CostTable::BuildSingleOperand() {
  for (const char* op : {"clr.", "neg.", "negx.", "not."}) {
    for (const char* s : kSizes) {
      char size = s[0];
      bool is_long = size == 'l';
      std::string mnemonic = op + std::string(s);
      Add(Key(mnemonic, {AddressingMode::DATA_REGISTER}), is_long ? 6 : 4);
      for (AddressingMode dst : kMemory) {
        Add(Key(mnemonic, {dst}),
            (is_long ? 12 : 8) + EffectiveAddressCycles(dst, size));
      }
    }
  }

  for (const char* s : kSizes) {
    std::string tst = std::string("tst.") + s;
    Add(Key(tst, {AddressingMode::DATA_REGISTER}), 4);
    for (AddressingMode dst : kMemory) {
      Add(Key(tst, {dst}), 4 + EffectiveAddressCycles(dst, s[0]));
    }
  }

  Add(Key("nbcd.b", {AddressingMode::DATA_REGISTER}), 6);
  for (AddressingMode dst : kMemory) {
    Add(Key("nbcd.b", {dst}), 8 + EffectiveAddressCycles(dst, 'b'));
  }

  // Scc to memory is fixed; Scc to a register depends on the condition
  // except for st/sf
  for (const char* op : {"st", "sf", "shi", "sls", "scc", "scs", "shs", "slo",
                         "sne", "seq", "svc", "svs", "spl", "smi", "sge",
                         "slt", "sgt", "sle"}) {
    for (AddressingMode dst : kMemory) {
      Add(Key(std::string(op) + ".b", {dst}),
          8 + EffectiveAddressCycles(dst, 'b'));
    }
  }
  Add(Key("st.b", {AddressingMode::DATA_REGISTER}), 6);
  Add(Key("sf.b", {AddressingMode::DATA_REGISTER}), 4);

  Add(Key("swap.w", {AddressingMode::DATA_REGISTER}), 4);
  Add(Key("ext.w", {AddressingMode::DATA_REGISTER}), 4);
  Add(Key("ext.l", {AddressingMode::DATA_REGISTER}), 4);

  for (AddressingMode a :
       {AddressingMode::DATA_REGISTER, AddressingMode::ADDRESS_REGISTER}) {
    for (AddressingMode b :
         {AddressingMode::DATA_REGISTER, AddressingMode::ADDRESS_REGISTER}) {
      Add(Key("exg.l", {a, b}), 6);
    }
  }
}

void CostTable::BuildControl() {
  Add("nop", constants::kDefaultNopCycles);
  Add("rts", 16);
  Add("rte", 20);
  Add("rtr", 20);
  Add(Key("trap", {AddressingMode::IMMEDIATE}), 34);

  for (AddressingMode target :
       {AddressingMode::ABSOLUTE_LONG, AddressingMode::ABSOLUTE_SHORT}) {
    Add(Key("bra.b", {target}), 10);
    Add(Key("bra.w", {target}), 10);
    Add(Key("bsr.b", {target}), 18);
    Add(Key("bsr.w", {target}), 18);
  }

  for (const auto& timing : kControlTimings) {
    Add(Key("lea.l", {timing.mode, AddressingMode::ADDRESS_REGISTER}),
        timing.lea);
    Add(Key("pea.l", {timing.mode}), timing.pea);
    Add(Key("jmp", {timing.mode}), timing.jmp);
    Add(Key("jsr", {timing.mode}), timing.jsr);
  }

  Add(Key("link.w", {AddressingMode::ADDRESS_REGISTER, AddressingMode::IMMEDIATE}),
      16);
  Add(Key("unlk", {AddressingMode::ADDRESS_REGISTER}), 12);
}

void CostTable::BuildBitOperations() {
  struct BitTiming {
    const char* mnemonic;
    int dynamic_register;
    int static_register;
    int dynamic_memory;
    int static_memory;
  };
  const BitTiming timings[] = {
      {"btst", 6, 10, 4, 8},
      {"bchg", 8, 12, 8, 12},
      {"bset", 8, 12, 8, 12},
      {"bclr", 10, 14, 8, 12},
  };

  for (const auto& t : timings) {
    bool test_only = std::string(t.mnemonic) == "btst";
    Add(Key(t.mnemonic,
            {AddressingMode::DATA_REGISTER, AddressingMode::DATA_REGISTER}),
        t.dynamic_register);
    Add(Key(t.mnemonic,
            {AddressingMode::IMMEDIATE, AddressingMode::DATA_REGISTER}),
        t.static_register);
    for (AddressingMode dst : test_only ? kReadableMemory : kMemory) {
      int ea = EffectiveAddressCycles(dst, 'b');
      Add(Key(t.mnemonic, {AddressingMode::DATA_REGISTER, dst}),
          t.dynamic_memory + ea);
      Add(Key(t.mnemonic, {AddressingMode::IMMEDIATE, dst}),
          t.static_memory + ea);
    }
  }
}

void CostTable::BuildShifts() {
  // Register shifts by an immediate count are a dynamic rule; by a register
  // count they depend on the register's value
  for (const char* op :
       {"asl", "asr", "lsl", "lsr", "rol", "ror", "roxl", "roxr"}) {
    for (AddressingMode dst : kMemory) {
      Add(Key(std::string(op) + ".w", {dst}),
          8 + EffectiveAddressCycles(dst, 'w'));
    }
    // "lsl.w d0" shifts by one
    Add(Key(std::string(op) + ".b", {AddressingMode::DATA_REGISTER}),
        ShiftCost('b', 1));
    Add(Key(std::string(op) + ".w", {AddressingMode::DATA_REGISTER}),
        ShiftCost('w', 1));
    Add(Key(std::string(op) + ".l", {AddressingMode::DATA_REGISTER}),
        ShiftCost('l', 1));
  }
}

void CostTable::BuildMisc() {
  movem_to_registers_ = {
      {AddressingMode::INDIRECT, 12},
      {AddressingMode::POST_INCREMENT, 12},
      {AddressingMode::DISPLACEMENT, 16},
      {AddressingMode::INDEXED, 18},
      {AddressingMode::ABSOLUTE_SHORT, 16},
      {AddressingMode::ABSOLUTE_LONG, 20},
      {AddressingMode::PC_DISPLACEMENT, 16},
      {AddressingMode::PC_INDEXED, 18},
  };
  movem_to_memory_ = {
      {AddressingMode::INDIRECT, 8},
      {AddressingMode::PRE_DECREMENT, 8},
      {AddressingMode::DISPLACEMENT, 12},
      {AddressingMode::INDEXED, 14},
      {AddressingMode::ABSOLUTE_SHORT, 12},
      {AddressingMode::ABSOLUTE_LONG, 16},
  };
}

}  // namespace cycles
}  // namespace cyclespitter
