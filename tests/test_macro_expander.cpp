// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "macro/macro_expander.h"

#include <gtest/gtest.h>

#include "core/exceptions.h"
#include "parse/line_parser.h"

namespace cyclespitter {
namespace macro {
namespace {

// Test fixture for MacroExpander tests
class MacroExpanderTest : public ::testing::Test {
 protected:
  std::vector<core::ExpandedLine> Expand(const std::string& text) {
    parse::LineParser parser;
    return expander_.Expand(parser.ParseText(text));
  }

  // Bodies of the instruction lines only
  std::vector<std::string> Bodies(const std::string& text) {
    std::vector<std::string> bodies;
    for (const auto& line : Expand(text)) {
      if (line.HasInstruction()) {
        bodies.push_back(line.Body());
      }
    }
    return bodies;
  }

  MacroExpander expander_;
};

TEST_F(MacroExpanderTest, NoDirectivesPassThrough) {
  std::vector<core::ExpandedLine> lines =
      Expand(" move.w d0,d1\n\n ; note\n nop ; (4)\n");
  ASSERT_EQ(lines.size(), 3u);  // Blank line dropped
  EXPECT_EQ(lines[0].Body(), "move.w d0,d1");
  EXPECT_EQ(lines[0].line_number, 1);
  EXPECT_EQ(lines[1].kind, core::LineKind::COMMENT);
  EXPECT_EQ(lines[2].line_number, 4);
  ASSERT_TRUE(lines[2].cycle_override.has_value());
  EXPECT_EQ(*lines[2].cycle_override, 4);
}

TEST_F(MacroExpanderTest, SimpleRepeat) {
  std::vector<std::string> bodies = Bodies(
      " REPT 3\n"
      " move.w #1,d0\n"
      " ENDR\n");
  ASSERT_EQ(bodies.size(), 3u);
  for (const auto& body : bodies) {
    EXPECT_EQ(body, "move.w #1,d0");
  }
  EXPECT_EQ(expander_.activations(), 1u);
}

TEST_F(MacroExpanderTest, ZeroRepeatEmitsNothing) {
  std::vector<std::string> bodies = Bodies(
      " nop\n"
      " REPT 0\n"
      " move.w #1,d0\n"
      " ENDR\n"
      " nop\n");
  ASSERT_EQ(bodies.size(), 2u);
  EXPECT_EQ(bodies[0], "nop");
  EXPECT_EQ(bodies[1], "nop");
}

TEST_F(MacroExpanderTest, SetWalksOffsetsAcrossIterations) {
  std::vector<std::string> bodies = Bodies(
      "add set 224\n"
      " REPT 3\n"
      "add set add-8\n"
      " move.w d0,add(a0)\n"
      " ENDR\n");
  ASSERT_EQ(bodies.size(), 3u);
  EXPECT_EQ(bodies[0], "move.w d0,216(a0)");
  EXPECT_EQ(bodies[1], "move.w d0,208(a0)");
  EXPECT_EQ(bodies[2], "move.w d0,200(a0)");
}

TEST_F(MacroExpanderTest, SetAppliesInTextualOrder) {
  std::vector<std::string> bodies = Bodies(
      "x set 0\n"
      " REPT 2\n"
      " move.w d0,x(a0)\n"
      "x set x+2\n"
      " move.w d1,x(a0)\n"
      " ENDR\n");
  ASSERT_EQ(bodies.size(), 4u);
  EXPECT_EQ(bodies[0], "move.w d0,0(a0)");
  EXPECT_EQ(bodies[1], "move.w d1,2(a0)");
  EXPECT_EQ(bodies[2], "move.w d0,2(a0)");
  EXPECT_EQ(bodies[3], "move.w d1,4(a0)");
}

TEST_F(MacroExpanderTest, ReptCountUsesEnclosingVariables) {
  std::vector<std::string> bodies = Bodies(
      "n set 2\n"
      " REPT n*2\n"
      " nop\n"
      " ENDR\n");
  EXPECT_EQ(bodies.size(), 4u);
}

TEST_F(MacroExpanderTest, NestedFramesResetOnEveryOuterIteration) {
  std::vector<std::string> bodies = Bodies(
      "x set 0\n"
      " REPT 2\n"
      " move.w d0,x(a0)\n"
      " REPT 2\n"
      "x set x+4\n"
      " move.w d1,x(a1)\n"
      " ENDR\n"
      " ENDR\n");
  ASSERT_EQ(bodies.size(), 6u);
  EXPECT_EQ(bodies[0], "move.w d0,0(a0)");
  EXPECT_EQ(bodies[1], "move.w d1,4(a1)");
  EXPECT_EQ(bodies[2], "move.w d1,8(a1)");
  // The inner mutation does not leak into the next outer pass
  EXPECT_EQ(bodies[3], "move.w d0,0(a0)");
  EXPECT_EQ(bodies[4], "move.w d1,4(a1)");
  EXPECT_EQ(bodies[5], "move.w d1,8(a1)");
  EXPECT_EQ(expander_.activations(), 3u);
}

TEST_F(MacroExpanderTest, OuterSetIsInheritedFresh) {
  std::vector<std::string> bodies = Bodies(
      "row set 0\n"
      " REPT 2\n"
      "col set row\n"
      " REPT 2\n"
      " move.w d0,col(a0)\n"
      "col set col+2\n"
      " ENDR\n"
      "row set row+160\n"
      " ENDR\n");
  ASSERT_EQ(bodies.size(), 4u);
  EXPECT_EQ(bodies[0], "move.w d0,0(a0)");
  EXPECT_EQ(bodies[1], "move.w d0,2(a0)");
  EXPECT_EQ(bodies[2], "move.w d0,160(a0)");
  EXPECT_EQ(bodies[3], "move.w d0,162(a0)");
}

TEST_F(MacroExpanderTest, SubstitutionSkipsLabelsAndMnemonics) {
  std::vector<core::ExpandedLine> lines = Expand(
      "move set 4\n"
      "move move.w move,d0\n");
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0].label, "move");
  EXPECT_EQ(lines[0].mnemonic, "move.w");
  EXPECT_EQ(lines[0].operands, "4,d0");
}

TEST_F(MacroExpanderTest, PredefinedVariables) {
  expander_.Define("lines", 3);
  std::vector<std::string> bodies = Bodies(
      " REPT lines\n"
      " nop\n"
      " ENDR\n");
  EXPECT_EQ(bodies.size(), 3u);
}

TEST_F(MacroExpanderTest, SectionsCarryOrdinalAndTitle) {
  std::vector<core::ExpandedLine> lines = Expand(
      " nop\n"
      "; ---- first ----\n"
      " REPT 2\n"
      " nop\n"
      " ENDR\n"
      "; ---- second ----\n"
      " nop\n");
  std::vector<core::ExpandedLine> instructions;
  for (const auto& line : lines) {
    if (line.HasInstruction()) instructions.push_back(line);
  }
  ASSERT_EQ(instructions.size(), 4u);
  EXPECT_EQ(instructions[0].origin.section_index, 0);
  EXPECT_EQ(instructions[1].origin.section_index, 1);
  EXPECT_EQ(instructions[1].origin.section_title, "first");
  EXPECT_EQ(instructions[2].origin, instructions[1].origin);
  EXPECT_EQ(instructions[3].origin.section_index, 2);
  EXPECT_EQ(instructions[3].origin.section_title, "second");
}

TEST_F(MacroExpanderTest, SectionInsideRepeatKeepsOneOrdinal) {
  std::vector<core::ExpandedLine> lines = Expand(
      " REPT 3\n"
      "; ---- body ----\n"
      " nop\n"
      " ENDR\n");
  for (const auto& line : lines) {
    EXPECT_EQ(line.origin.section_index, 1);
  }
}

TEST_F(MacroExpanderTest, EndrWithoutReptThrows) {
  try {
    Expand(" nop\n ENDR\n");
    FAIL() << "Expected UnbalancedReptException";
  } catch (const UnbalancedReptException& e) {
    EXPECT_EQ(e.line_number(), 2);
    EXPECT_EQ(e.kind(), ErrorKind::UNBALANCED_REPT);
  }
}

TEST_F(MacroExpanderTest, UnclosedReptThrowsWithPath) {
  try {
    Expand(" REPT 2\n nop\n REPT 3\n nop\n ENDR\n REPT 4\n");
    FAIL() << "Expected UnbalancedReptException";
  } catch (const UnbalancedReptException& e) {
    EXPECT_EQ(e.line_number(), 6);
    EXPECT_EQ(e.rept_path(), "REPT@1 > REPT@6");
  }
}

TEST_F(MacroExpanderTest, UndefinedVariableThrows) {
  EXPECT_THROW(Expand(" REPT count\n nop\n ENDR\n"),
               UndefinedVariableException);
  EXPECT_THROW(Expand("x set y+1\n"), UndefinedVariableException);
}

TEST_F(MacroExpanderTest, UndefinedVariableReportsNestingPath) {
  try {
    Expand(
        " REPT 2\n"
        " REPT 3\n"
        " nop\n"
        "v set w+1\n"
        " ENDR\n"
        " ENDR\n");
    FAIL() << "Expected UndefinedVariableException";
  } catch (const UndefinedVariableException& e) {
    EXPECT_EQ(e.variable(), "w");
    EXPECT_EQ(e.line_number(), 4);
    EXPECT_EQ(e.rept_path(), "REPT@1 [1/2] > REPT@2 [1/3]");
  }
}

TEST_F(MacroExpanderTest, NegativeCountThrows) {
  EXPECT_THROW(Expand(" REPT 1-2\n nop\n ENDR\n"), MalformedLineException);
}

TEST_F(MacroExpanderTest, ExpansionLimit) {
  MacroExpander limited(5);
  parse::LineParser parser;
  EXPECT_THROW(limited.Expand(parser.ParseText(" REPT 6\n nop\n ENDR\n")),
               MalformedLineException);
  EXPECT_EQ(limited.Expand(parser.ParseText(" REPT 5\n nop\n ENDR\n")).size(),
            5u);
}

TEST_F(MacroExpanderTest, ExpansionLimitCountsSilentPasses) {
  MacroExpander limited(5);
  parse::LineParser parser;
  try {
    limited.Expand(parser.ParseText(" REPT 10000000000\nx set 1\n ENDR\n"));
    FAIL() << "Expected MalformedLineException";
  } catch (const MalformedLineException& e) {
    EXPECT_EQ(e.line_number(), 1);
    EXPECT_EQ(e.rept_path(), "REPT@1 [6/10000000000]");
  }

  // Empty bodies are replayed too
  EXPECT_THROW(limited.Expand(parser.ParseText(" REPT 6\n ENDR\n")),
               MalformedLineException);
  EXPECT_TRUE(
      limited.Expand(parser.ParseText(" REPT 5\nx set 1\n ENDR\n")).empty());
}

TEST_F(MacroExpanderTest, OversizedRepeatCountThrows) {
  EXPECT_THROW(Expand(" REPT 99999999999999999999\n nop\n ENDR\n"),
               MalformedLineException);
  EXPECT_THROW(Expand("n set $7fffffffffffffff\n REPT n+1\n nop\n ENDR\n"),
               MalformedLineException);
}

}  // namespace
}  // namespace macro
}  // namespace cyclespitter
