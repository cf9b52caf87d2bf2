// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "core/operand.h"

#include <gtest/gtest.h>

namespace cyclespitter {
namespace core {
namespace {

TEST(OperandTest, SplitOperandsRespectsParentheses) {
  std::vector<std::string> parts = SplitOperands("8(a0,d0.w), d1");
  ASSERT_EQ(parts.size(), 2u);
  EXPECT_EQ(parts[0], "8(a0,d0.w)");
  EXPECT_EQ(parts[1], "d1");
}

TEST(OperandTest, SplitOperandsEmpty) {
  EXPECT_TRUE(SplitOperands("").empty());
  EXPECT_EQ(SplitOperands("d0").size(), 1u);
}

TEST(OperandTest, ClassifyRegisters) {
  EXPECT_EQ(ClassifyOperand("d0"), AddressingMode::DATA_REGISTER);
  EXPECT_EQ(ClassifyOperand("D7"), AddressingMode::DATA_REGISTER);
  EXPECT_EQ(ClassifyOperand("a3"), AddressingMode::ADDRESS_REGISTER);
  EXPECT_EQ(ClassifyOperand("sp"), AddressingMode::ADDRESS_REGISTER);
  EXPECT_EQ(ClassifyOperand("sr"), AddressingMode::STATUS_REGISTER);
  EXPECT_EQ(ClassifyOperand("ccr"), AddressingMode::CONDITION_CODES);
  EXPECT_EQ(ClassifyOperand("usp"), AddressingMode::USER_STACK);
}

TEST(OperandTest, ClassifyIndirectModes) {
  EXPECT_EQ(ClassifyOperand("(a0)"), AddressingMode::INDIRECT);
  EXPECT_EQ(ClassifyOperand("(a0)+"), AddressingMode::POST_INCREMENT);
  EXPECT_EQ(ClassifyOperand("-(sp)"), AddressingMode::PRE_DECREMENT);
  EXPECT_EQ(ClassifyOperand("8(a0)"), AddressingMode::DISPLACEMENT);
  EXPECT_EQ(ClassifyOperand("(8,a0)"), AddressingMode::DISPLACEMENT);
  EXPECT_EQ(ClassifyOperand("-160(a1)"), AddressingMode::DISPLACEMENT);
  EXPECT_EQ(ClassifyOperand("8(a0,d0.w)"), AddressingMode::INDEXED);
  EXPECT_EQ(ClassifyOperand("(a0,d1)"), AddressingMode::INDEXED);
}

TEST(OperandTest, ClassifyPcRelative) {
  EXPECT_EQ(ClassifyOperand("table(pc)"), AddressingMode::PC_DISPLACEMENT);
  EXPECT_EQ(ClassifyOperand("table(pc,d0.w)"), AddressingMode::PC_INDEXED);
}

TEST(OperandTest, ClassifyAbsoluteAndImmediate) {
  EXPECT_EQ(ClassifyOperand("#$1234"), AddressingMode::IMMEDIATE);
  EXPECT_EQ(ClassifyOperand("#1"), AddressingMode::IMMEDIATE);
  EXPECT_EQ(ClassifyOperand("$ffff8260.w"), AddressingMode::ABSOLUTE_SHORT);
  EXPECT_EQ(ClassifyOperand("$ff8240"), AddressingMode::ABSOLUTE_LONG);
  EXPECT_EQ(ClassifyOperand("screen"), AddressingMode::ABSOLUTE_LONG);
  EXPECT_EQ(ClassifyOperand("(SCREEN+8)"), AddressingMode::ABSOLUTE_LONG);
}

TEST(OperandTest, ClassifyRegisterList) {
  EXPECT_EQ(ClassifyOperand("d0-d7/a1-a3"), AddressingMode::REGISTER_LIST);
  EXPECT_EQ(ClassifyOperand("d0/d2"), AddressingMode::REGISTER_LIST);
}

TEST(OperandTest, ClassifyUnknown) {
  EXPECT_EQ(ClassifyOperand(""), AddressingMode::UNKNOWN);
  EXPECT_EQ(ClassifyOperand("8(a0,d0,d1)"), AddressingMode::UNKNOWN);
}

TEST(OperandTest, ModeShapes) {
  EXPECT_EQ(AddressingModeShape(AddressingMode::DATA_REGISTER), "dn");
  EXPECT_EQ(AddressingModeShape(AddressingMode::PRE_DECREMENT), "-(an)");
  EXPECT_EQ(AddressingModeShape(AddressingMode::ABSOLUTE_SHORT), "xxx.w");
  EXPECT_EQ(AddressingModeShape(AddressingMode::REGISTER_LIST), "reglist");
  EXPECT_EQ(AddressingModeShape(AddressingMode::UNKNOWN), "?");
}

TEST(OperandTest, CountRegisters) {
  EXPECT_EQ(CountRegisters("d0-d7/a1-a3"), 11);
  EXPECT_EQ(CountRegisters("d0"), 1);
  EXPECT_EQ(CountRegisters("d0/d0"), 1);  // Duplicates count once
  EXPECT_EQ(CountRegisters("D0-D3/A6"), 5);
  EXPECT_EQ(CountRegisters("a0-a6/d0-d7"), 15);
}

TEST(OperandTest, CountRegistersRejectsBadLists) {
  EXPECT_FALSE(CountRegisters("").has_value());
  EXPECT_FALSE(CountRegisters("d7-d0").has_value());
  EXPECT_FALSE(CountRegisters("d0-a3").has_value());
  EXPECT_FALSE(CountRegisters("d0//d1").has_value());
  EXPECT_FALSE(CountRegisters("x0-x3").has_value());
}

TEST(OperandTest, SubstituteVariablesReplacesIdentifiers) {
  VariableScope scope = {{"add", 216}, {"line", 3}};
  EXPECT_EQ(SubstituteVariables("d0,add(a0)", scope), "d0,216(a0)");
  EXPECT_EQ(SubstituteVariables("#line*160,d1", scope), "#3*160,d1");
}

TEST(OperandTest, SubstituteVariablesLeavesOtherTokensAlone) {
  VariableScope scope = {{"d0", 1}, {"w", 2}, {"loop", 3}, {"ad", 4}};
  // Register names, size suffixes and local labels are not variables
  EXPECT_EQ(SubstituteVariables("d0,8(a0,d1.w)", scope), "d0,8(a0,d1.w)");
  EXPECT_EQ(SubstituteVariables(".loop", scope), ".loop");
  // Hex literals are not identifiers
  EXPECT_EQ(SubstituteVariables("$ad,d1", scope), "$ad,d1");
  // No substring collisions
  EXPECT_EQ(SubstituteVariables("address", scope), "address");
  EXPECT_EQ(SubstituteVariables("'ad'", scope), "'ad'");
}

TEST(OperandTest, SubstituteVariablesEmptyScope) {
  EXPECT_EQ(SubstituteVariables("d0,add(a0)", {}), "d0,add(a0)");
}

TEST(OperandTest, StringHelpers) {
  EXPECT_EQ(ToLower("MoVe.W"), "move.w");
  EXPECT_EQ(Trim("  d0 \t"), "d0");
  EXPECT_EQ(Trim("   "), "");
}

}  // namespace
}  // namespace core
}  // namespace cyclespitter
