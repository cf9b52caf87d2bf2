// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "cycles/instruction_shape.h"

#include <gtest/gtest.h>

#include "core/exceptions.h"

namespace cyclespitter {
namespace cycles {
namespace {

TEST(InstructionShapeTest, NormalizeDefaultsToWord) {
  EXPECT_EQ(NormalizeMnemonic("move"), "move.w");
  EXPECT_EQ(NormalizeMnemonic("MOVE.L"), "move.l");
  EXPECT_EQ(NormalizeMnemonic("add.b"), "add.b");
}

TEST(InstructionShapeTest, NormalizeBranches) {
  EXPECT_EQ(NormalizeMnemonic("bra.s"), "bra.b");
  EXPECT_EQ(NormalizeMnemonic("bne.b"), "bne.b");
  EXPECT_EQ(NormalizeMnemonic("bra"), "bra.w");
  EXPECT_EQ(NormalizeMnemonic("beq.w"), "beq.w");
}

TEST(InstructionShapeTest, NormalizeFixedSizes) {
  EXPECT_EQ(NormalizeMnemonic("nop"), "nop");
  EXPECT_EQ(NormalizeMnemonic("jmp"), "jmp");
  EXPECT_EQ(NormalizeMnemonic("btst.b"), "btst");
  EXPECT_EQ(NormalizeMnemonic("lea"), "lea.l");
  EXPECT_EQ(NormalizeMnemonic("moveq"), "moveq.l");
  EXPECT_EQ(NormalizeMnemonic("sne"), "sne.b");
  EXPECT_EQ(NormalizeMnemonic("abcd"), "abcd.b");
}

TEST(InstructionShapeTest, ClassifyBuildsKey) {
  InstructionShape shape = ClassifyInstruction("Move.W", "d0,$ffff8240.w");
  EXPECT_EQ(shape.mnemonic, "move.w");
  EXPECT_EQ(shape.base, "move");
  EXPECT_EQ(shape.size, 'w');
  ASSERT_EQ(shape.operands.size(), 2u);
  EXPECT_EQ(shape.key, "move.w dn,xxx.w");
  EXPECT_TRUE(shape.IsClassified());
}

TEST(InstructionShapeTest, EquivalentSpellingsShareKey) {
  EXPECT_EQ(ClassifyInstruction("move.l", "(a0)+,(a1)+").key,
            ClassifyInstruction("MOVE.L", "(A5)+, (A6)+").key);
  EXPECT_EQ(ClassifyInstruction("lea", "8(a0),a1").key,
            ClassifyInstruction("lea.l", "(8,a2),a3").key);
}

TEST(InstructionShapeTest, UnsizedShape) {
  InstructionShape shape = ClassifyInstruction("nop", "");
  EXPECT_EQ(shape.key, "nop");
  EXPECT_EQ(shape.size, 0);
  EXPECT_TRUE(shape.operands.empty());
}

TEST(InstructionShapeTest, UnknownOperandMarked) {
  InstructionShape shape = ClassifyInstruction("move.w", "8(a0,d0,d1),d2");
  EXPECT_EQ(shape.key, "move.w ?,dn");
  EXPECT_FALSE(shape.IsClassified());
}

TEST(InstructionShapeTest, EvaluateConstantOperand) {
  EXPECT_EQ(EvaluateConstantOperand("12"), 12);
  EXPECT_EQ(EvaluateConstantOperand("$4e71"), 0x4E71);
  EXPECT_FALSE(EvaluateConstantOperand("SCREEN").has_value());
  EXPECT_FALSE(EvaluateConstantOperand("(a0)").has_value());
}

TEST(InstructionShapeTest, NopBlockCount) {
  EXPECT_EQ(NopBlockCount(ClassifyInstruction("dcb.w", "12,$4e71")), 12);
  EXPECT_EQ(NopBlockCount(ClassifyInstruction("DCB.W", "0,$4E71")), 0);
  EXPECT_FALSE(NopBlockCount(ClassifyInstruction("dcb.w", "12,$0000")));
  EXPECT_FALSE(NopBlockCount(ClassifyInstruction("dcb.l", "12,$4e71")));
  EXPECT_FALSE(NopBlockCount(ClassifyInstruction("dcb.w", "n,$4e71")));
  EXPECT_FALSE(NopBlockCount(ClassifyInstruction("dcb.w", "-1,$4e71")));
}

TEST(InstructionShapeTest, DataDependentReason) {
  EXPECT_FALSE(DataDependentReason(ClassifyInstruction("beq", "x")).empty());
  EXPECT_FALSE(
      DataDependentReason(ClassifyInstruction("dbf", "d0,x")).empty());
  EXPECT_FALSE(
      DataDependentReason(ClassifyInstruction("divs", "d1,d0")).empty());
  EXPECT_FALSE(
      DataDependentReason(ClassifyInstruction("lsl.w", "d1,d0")).empty());
  EXPECT_TRUE(DataDependentReason(ClassifyInstruction("bra", "x")).empty());
  EXPECT_TRUE(
      DataDependentReason(ClassifyInstruction("lsl.w", "#2,d0")).empty());
  EXPECT_TRUE(
      DataDependentReason(ClassifyInstruction("move.w", "d0,d1")).empty());
}

TEST(InstructionShapeTest, NopBlockCountBoundedByCycleRange) {
  EXPECT_EQ(NopBlockCount(ClassifyInstruction("dcb.w", "536870911,$4e71")),
            536870911);
  EXPECT_THROW(NopBlockCount(ClassifyInstruction("dcb.w", "536870912,$4e71")),
               MalformedLineException);
  EXPECT_THROW(
      NopBlockCount(ClassifyInstruction("dcb.w", "1000000000,$4e71"), 7),
      MalformedLineException);
}

TEST(InstructionShapeTest, CanonicalInstruction) {
  EXPECT_EQ(CanonicalInstruction("  MULU.W   D0 , D1 "), "mulu.w d0,d1");
  EXPECT_EQ(CanonicalInstruction("divu #7,d0"), "divu #7,d0");
  EXPECT_EQ(CanonicalInstruction("nop"), "nop");
}

}  // namespace
}  // namespace cycles
}  // namespace cyclespitter
