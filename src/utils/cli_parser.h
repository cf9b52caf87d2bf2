// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef CYCLESPITTER_UTILS_CLI_PARSER_H_
#define CYCLESPITTER_UTILS_CLI_PARSER_H_

#include <string>

#include "core/constants.h"

namespace cyclespitter {
namespace utils {

// Command-line options parsed from arguments
struct CliOptions {
  // Inputs
  std::string input_file = constants::kDefaultInputFile;
  std::string template_file = constants::kDefaultTemplateFile;
  std::string costs_file;

  // Output options
  std::string output_file;  // empty means stdout
  std::string label = constants::kDefaultScanlinesLabel;
  std::string output_format = "devpac";
  bool expand_nops = false;
  bool expand_only = false;

  // Scheduling
  int scanline_cycles = constants::kDefaultScanlineCycles;

  // Logging
  bool verbose = false;
  bool quiet = false;

  // Set when --help or --version was requested
  bool show_help = false;
};

// CLI parser
class CliParser {
 public:
  CliParser();

  // Parse command-line arguments
  bool Parse(int argc, char** argv, CliOptions* options, std::string* error);

  // Get help text
  std::string GetHelp() const;

 private:
  std::string help_text_;
};

}  // namespace utils
}  // namespace cyclespitter

#endif  // CYCLESPITTER_UTILS_CLI_PARSER_H_
