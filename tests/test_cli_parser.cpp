// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "utils/cli_parser.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace cyclespitter {
namespace utils {
namespace {

// Test fixture for CliParser tests
class CliParserTest : public ::testing::Test {
 protected:
  bool Parse(std::vector<std::string> args) {
    args.insert(args.begin(), "cyclespitter");
    std::vector<char*> argv;
    for (auto& arg : args) {
      argv.push_back(&arg[0]);
    }
    return parser_.Parse(static_cast<int>(argv.size()), argv.data(), &options_,
                         &error_);
  }

  CliParser parser_;
  CliOptions options_;
  std::string error_;
};

TEST_F(CliParserTest, Defaults) {
  EXPECT_TRUE(Parse({})) << error_;
  EXPECT_EQ(options_.input_file, "sample.s");
  EXPECT_EQ(options_.label, "SCANLINES_CONSUMED");
  EXPECT_EQ(options_.template_file, "template.s");
  EXPECT_EQ(options_.output_format, "devpac");
  EXPECT_EQ(options_.scanline_cycles, 512);
  EXPECT_TRUE(options_.output_file.empty());
  EXPECT_FALSE(options_.expand_nops);
  EXPECT_FALSE(options_.expand_only);
  EXPECT_FALSE(options_.show_help);
}

TEST_F(CliParserTest, Positionals) {
  EXPECT_TRUE(Parse({"fx.s", "FX_LINES", "borders.s"})) << error_;
  EXPECT_EQ(options_.input_file, "fx.s");
  EXPECT_EQ(options_.label, "FX_LINES");
  EXPECT_EQ(options_.template_file, "borders.s");
}

TEST_F(CliParserTest, NamedOptions) {
  EXPECT_TRUE(Parse({"-i", "fx.s", "-t", "borders.s", "-o", "out.s", "-f",
                     "gas", "-w", "256", "--expand-nops"}))
      << error_;
  EXPECT_EQ(options_.input_file, "fx.s");
  EXPECT_EQ(options_.template_file, "borders.s");
  EXPECT_EQ(options_.output_file, "out.s");
  EXPECT_EQ(options_.output_format, "gas");
  EXPECT_EQ(options_.scanline_cycles, 256);
  EXPECT_TRUE(options_.expand_nops);
}

TEST_F(CliParserTest, ExpandOnly) {
  EXPECT_TRUE(Parse({"--expand-only"})) << error_;
  EXPECT_TRUE(options_.expand_only);
}

TEST_F(CliParserTest, Help) {
  EXPECT_TRUE(Parse({"--help"}));
  EXPECT_TRUE(options_.show_help);
  EXPECT_NE(parser_.GetHelp().find("--template"), std::string::npos);
}

TEST_F(CliParserTest, Version) {
  EXPECT_TRUE(Parse({"--version"}));
  EXPECT_TRUE(options_.show_help);
  EXPECT_EQ(parser_.GetHelp(), "cycleSpitter 1.0.0");
}

TEST_F(CliParserTest, RejectsNonPositiveWidth) {
  EXPECT_FALSE(Parse({"-w", "0"}));
  EXPECT_FALSE(error_.empty());
}

TEST_F(CliParserTest, VerboseAndQuietConflict) {
  EXPECT_FALSE(Parse({"-v", "-q"}));
}

TEST_F(CliParserTest, MissingCostsFile) {
  EXPECT_FALSE(Parse({"--costs", "/nonexistent/costs.json"}));
}

TEST_F(CliParserTest, UnknownOption) {
  EXPECT_FALSE(Parse({"--frobnicate"}));
  EXPECT_NE(error_.find("parse error"), std::string::npos);
}

}  // namespace
}  // namespace utils
}  // namespace cyclespitter
