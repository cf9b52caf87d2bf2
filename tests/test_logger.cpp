// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "utils/logger.h"

#include <gtest/gtest.h>

#include <sstream>

namespace cyclespitter {
namespace utils {
namespace {

// Test fixture capturing log output
class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    saved_level_ = Logger::Instance().GetLevel();
    Logger::Instance().SetStream(&captured_);
  }

  void TearDown() override {
    Logger::Instance().SetStream(&std::cerr);
    Logger::Instance().SetLevel(saved_level_);
  }

  std::ostringstream captured_;
  LogLevel saved_level_ = LogLevel::INFO;
};

TEST_F(LoggerTest, PrefixesByLevel) {
  Logger::Instance().SetLevel(LogLevel::DEBUG);
  LOG_DEBUG("d");
  LOG_INFO("i");
  LOG_WARNING("w");
  LOG_ERROR("e");
  EXPECT_EQ(captured_.str(), "[DEBUG] d\n[INFO] i\n[WARNING] w\n[ERROR] e\n");
}

TEST_F(LoggerTest, LevelFiltersMessages) {
  Logger::Instance().SetLevel(LogLevel::WARNING);
  LOG_DEBUG("hidden");
  LOG_INFO("hidden");
  LOG_WARNING("shown");
  EXPECT_EQ(captured_.str(), "[WARNING] shown\n");
}

TEST_F(LoggerTest, SingletonKeepsLevel) {
  Logger::Instance().SetLevel(LogLevel::ERROR);
  EXPECT_EQ(Logger::Instance().GetLevel(), LogLevel::ERROR);
}

}  // namespace
}  // namespace utils
}  // namespace cyclespitter
