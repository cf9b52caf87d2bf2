// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "utils/logger.h"

namespace cyclespitter {
namespace utils {

Logger& Logger::Instance() {
  static Logger instance;
  return instance;
}

void Logger::Debug(const std::string& message) {
  if (level_ <= LogLevel::DEBUG) {
    Log("[DEBUG] ", message);
  }
}

void Logger::Info(const std::string& message) {
  if (level_ <= LogLevel::INFO) {
    Log("[INFO] ", message);
  }
}

void Logger::Warning(const std::string& message) {
  if (level_ <= LogLevel::WARNING) {
    Log("[WARNING] ", message);
  }
}

void Logger::Error(const std::string& message) {
  if (level_ <= LogLevel::ERROR) {
    Log("[ERROR] ", message);
  }
}

void Logger::Log(const std::string& prefix, const std::string& message) {
  std::ostream& stream = stream_ != nullptr ? *stream_ : std::cerr;
  stream << prefix << message << std::endl;
}

}  // namespace utils
}  // namespace cyclespitter
