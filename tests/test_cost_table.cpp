// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "cycles/cost_table.h"

#include <gtest/gtest.h>

namespace cyclespitter {
namespace cycles {
namespace {

using core::AddressingMode;

// Test fixture for CostTable tests
class CostTableTest : public ::testing::Test {
 protected:
  CostTable& table_ = CostTable::Instance();
};

TEST_F(CostTableTest, SingletonIsPopulated) {
  EXPECT_EQ(&CostTable::Instance(), &table_);
  EXPECT_GT(table_.size(), 500u);
}

TEST_F(CostTableTest, NopCost) {
  EXPECT_EQ(table_.NopCycles(), 4);
  EXPECT_EQ(table_.Lookup("nop"), 4);
}

TEST_F(CostTableTest, Moves) {
  EXPECT_EQ(table_.Lookup("move.w dn,dn"), 4);
  EXPECT_EQ(table_.Lookup("move.l dn,dn"), 4);
  EXPECT_EQ(table_.Lookup("move.w #xxx,dn"), 8);
  EXPECT_EQ(table_.Lookup("move.l #xxx,dn"), 12);
  EXPECT_EQ(table_.Lookup("move.w dn,(an)"), 8);
  EXPECT_EQ(table_.Lookup("move.l (an)+,(an)+"), 20);
  EXPECT_EQ(table_.Lookup("move.w dn,xxx.w"), 12);
  EXPECT_EQ(table_.Lookup("move.b d(an),dn"), 12);
  EXPECT_EQ(table_.Lookup("move.l xxx.l,xxx.l"), 36);
  EXPECT_EQ(table_.Lookup("moveq.l #xxx,dn"), 4);
  EXPECT_EQ(table_.Lookup("movea.l dn,an"), 4);
}

TEST_F(CostTableTest, ByteMovesFromAddressRegisterDoNotExist) {
  EXPECT_FALSE(table_.Contains("move.b an,dn"));
  EXPECT_TRUE(table_.Contains("move.w an,dn"));
}

TEST_F(CostTableTest, Arithmetic) {
  EXPECT_EQ(table_.Lookup("add.w dn,dn"), 4);
  EXPECT_EQ(table_.Lookup("add.l dn,dn"), 8);
  EXPECT_EQ(table_.Lookup("add.l (an),dn"), 14);
  EXPECT_EQ(table_.Lookup("sub.w dn,(an)"), 12);
  EXPECT_EQ(table_.Lookup("adda.w dn,an"), 8);
  EXPECT_EQ(table_.Lookup("add.w #xxx,dn"), 8);
  EXPECT_EQ(table_.Lookup("eor.w dn,dn"), 4);
}

TEST_F(CostTableTest, Control) {
  EXPECT_EQ(table_.Lookup("rts"), 16);
  EXPECT_EQ(table_.Lookup("bra.b xxx.l"), 10);
  EXPECT_EQ(table_.Lookup("jmp (an)"), 8);
  EXPECT_EQ(table_.Lookup("jsr xxx.l"), 20);
  EXPECT_EQ(table_.Lookup("lea.l d(an),an"), 8);
  EXPECT_EQ(table_.Lookup("lea.l xxx.l,an"), 12);
}

TEST_F(CostTableTest, Shifts) {
  EXPECT_EQ(table_.Lookup("lsl.w dn"), 8);
  EXPECT_EQ(table_.Lookup("lsl.l dn"), 10);
  EXPECT_EQ(table_.Lookup("asr.w (an)"), 12);
}

TEST_F(CostTableTest, DataDependentInstructionsAreAbsent) {
  EXPECT_FALSE(table_.Contains("mulu.w dn,dn"));
  EXPECT_FALSE(table_.Contains("divs.w dn,dn"));
  EXPECT_FALSE(table_.Contains("bne.b xxx.l"));
  EXPECT_FALSE(table_.Contains("lsl.w dn,dn"));
  EXPECT_FALSE(table_.Lookup("not-an-instruction").has_value());
}

TEST_F(CostTableTest, DynamicRules) {
  EXPECT_EQ(CostTable::RuleFor("movem"), DynamicRule::REGISTER_LIST);
  EXPECT_EQ(CostTable::RuleFor("lsl"), DynamicRule::SHIFT_COUNT);
  EXPECT_EQ(CostTable::RuleFor("roxr"), DynamicRule::SHIFT_COUNT);
  EXPECT_EQ(CostTable::RuleFor("dcb"), DynamicRule::NOP_BLOCK);
  EXPECT_EQ(CostTable::RuleFor("move"), DynamicRule::NONE);
}

TEST_F(CostTableTest, MovemBases) {
  EXPECT_EQ(table_.MovemBase(AddressingMode::PRE_DECREMENT, true), 8);
  EXPECT_EQ(table_.MovemBase(AddressingMode::POST_INCREMENT, false), 12);
  EXPECT_EQ(table_.MovemBase(AddressingMode::ABSOLUTE_LONG, false), 20);
  EXPECT_FALSE(table_.MovemBase(AddressingMode::PRE_DECREMENT, false));
  EXPECT_FALSE(table_.MovemBase(AddressingMode::POST_INCREMENT, true));
  EXPECT_EQ(CostTable::MovemPerRegister('l'), 8);
  EXPECT_EQ(CostTable::MovemPerRegister('w'), 4);
}

TEST_F(CostTableTest, ShiftCost) {
  EXPECT_EQ(CostTable::ShiftCost('w', 1), 8);
  EXPECT_EQ(CostTable::ShiftCost('w', 8), 22);
  EXPECT_EQ(CostTable::ShiftCost('l', 4), 16);
}

TEST_F(CostTableTest, EffectiveAddressCycles) {
  EXPECT_EQ(CostTable::EffectiveAddressCycles(AddressingMode::DATA_REGISTER,
                                              'w'),
            0);
  EXPECT_EQ(CostTable::EffectiveAddressCycles(AddressingMode::PRE_DECREMENT,
                                              'l'),
            10);
  EXPECT_EQ(CostTable::EffectiveAddressCycles(AddressingMode::PC_INDEXED, 'w'),
            10);
}

}  // namespace
}  // namespace cycles
}  // namespace cyclespitter
