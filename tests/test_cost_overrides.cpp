// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "cycles/cost_overrides.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

namespace cyclespitter {
namespace cycles {
namespace {

// Test fixture for CostOverrides tests
class CostOverridesTest : public ::testing::Test {
 protected:
  CostOverrides overrides_;
  std::string error_;
};

TEST_F(CostOverridesTest, ParseShapesAndLiterals) {
  std::string json = R"({
    "overrides": {
      "mulu.w dn,dn": 70,
      "DIVU  #7 , D0": 140
    }
  })";

  EXPECT_TRUE(overrides_.ParseJson(json, &error_)) << error_;
  EXPECT_EQ(overrides_.size(), 2u);
  EXPECT_EQ(overrides_.Find("mulu.w d4,d5", "mulu.w dn,dn"), 70);
  EXPECT_EQ(overrides_.Find("divu #7,d0", "divu.w #xxx,dn"), 140);
}

TEST_F(CostOverridesTest, LiteralMatchWinsOverShape) {
  overrides_.Set("mulu.w dn,dn", 70);
  overrides_.Set("mulu.w #0,d0", 38);
  EXPECT_EQ(overrides_.Find("mulu.w #0,d0", "mulu.w #xxx,dn"), 38);
  EXPECT_EQ(overrides_.Find("mulu.w d0,d1", "mulu.w dn,dn"), 70);
  EXPECT_FALSE(overrides_.Find("mulu.w #3,d0", "mulu.w #xxx,dn"));
}

TEST_F(CostOverridesTest, EmptyOverrides) {
  EXPECT_TRUE(overrides_.empty());
  EXPECT_TRUE(overrides_.ParseJson(R"({"overrides": {}})", &error_)) << error_;
  EXPECT_TRUE(overrides_.empty());
}

TEST_F(CostOverridesTest, MissingOverridesObject) {
  EXPECT_FALSE(overrides_.ParseJson(R"({"costs": {}})", &error_));
  EXPECT_NE(error_.find("overrides"), std::string::npos);
  EXPECT_FALSE(overrides_.ParseJson(R"({"overrides": [1, 2]})", &error_));
}

TEST_F(CostOverridesTest, RejectsNonIntegerCosts) {
  EXPECT_FALSE(overrides_.ParseJson(R"({"overrides": {"nop": "4"}})", &error_));
  EXPECT_FALSE(overrides_.ParseJson(R"({"overrides": {"nop": 4.5}})", &error_));
  EXPECT_FALSE(overrides_.ParseJson(R"({"overrides": {"nop": -4}})", &error_));
  EXPECT_TRUE(overrides_.empty());
}

TEST_F(CostOverridesTest, RejectsEmptyKey) {
  EXPECT_FALSE(overrides_.ParseJson(R"({"overrides": {"  ": 4}})", &error_));
}

TEST_F(CostOverridesTest, InvalidJson) {
  EXPECT_FALSE(overrides_.ParseJson("{ not json", &error_));
  EXPECT_NE(error_.find("JSON parse error"), std::string::npos);
}

TEST_F(CostOverridesTest, ParseFile) {
  std::string path = ::testing::TempDir() + "cyclespitter_costs.json";
  {
    std::ofstream out(path);
    out << R"({"overrides": {"bne.b xxx.l": 10}})";
  }
  EXPECT_TRUE(overrides_.ParseFile(path, &error_)) << error_;
  EXPECT_EQ(overrides_.Find("bne.s loop", "bne.b xxx.l"), 10);
  std::remove(path.c_str());
}

TEST_F(CostOverridesTest, MissingFile) {
  EXPECT_FALSE(overrides_.ParseFile("/nonexistent/costs.json", &error_));
  EXPECT_NE(error_.find("Failed to open"), std::string::npos);
}

}  // namespace
}  // namespace cycles
}  // namespace cyclespitter
