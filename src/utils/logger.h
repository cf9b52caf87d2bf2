// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef CYCLESPITTER_UTILS_LOGGER_H_
#define CYCLESPITTER_UTILS_LOGGER_H_

#include <iostream>
#include <string>

namespace cyclespitter {
namespace utils {

// Log levels
enum class LogLevel {
  DEBUG,
  INFO,
  WARNING,
  ERROR,
};

// Simple logger class. Everything goes to stderr (or the stream set with
// SetStream) so generated assembly can be written to stdout.
class Logger {
 public:
  static Logger& Instance();

  void SetLevel(LogLevel level) { level_ = level; }
  LogLevel GetLevel() const { return level_; }

  void SetStream(std::ostream* stream) { stream_ = stream; }

  void Debug(const std::string& message);
  void Info(const std::string& message);
  void Warning(const std::string& message);
  void Error(const std::string& message);

  // Prevent copying
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

 private:
  Logger() : level_(LogLevel::INFO), stream_(&std::cerr) {}

  void Log(const std::string& prefix, const std::string& message);

  LogLevel level_;
  std::ostream* stream_;
};

// Convenience macros
#define LOG_DEBUG(msg) cyclespitter::utils::Logger::Instance().Debug(msg)
#define LOG_INFO(msg) cyclespitter::utils::Logger::Instance().Info(msg)
#define LOG_WARNING(msg) cyclespitter::utils::Logger::Instance().Warning(msg)
#define LOG_ERROR(msg) cyclespitter::utils::Logger::Instance().Error(msg)

}  // namespace utils
}  // namespace cyclespitter

#endif  // CYCLESPITTER_UTILS_LOGGER_H_
