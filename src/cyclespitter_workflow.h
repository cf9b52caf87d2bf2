// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef CYCLESPITTER_CYCLESPITTER_WORKFLOW_H_
#define CYCLESPITTER_CYCLESPITTER_WORKFLOW_H_

#include <string>

#include "cycles/cost_overrides.h"
#include "utils/cli_parser.h"

namespace cyclespitter {

// Orchestrates the complete workflow from CLI to output:
// parse -> expand -> resolve cycles -> schedule -> format
class CycleSpitterWorkflow {
 public:
  CycleSpitterWorkflow() = default;

  // Main entry point - runs the complete workflow and returns the exit
  // status (0, or the code of the first error)
  int Run(int argc, char** argv);

  // Run the pipeline on in-memory text. `template_text` is unused with
  // --expand-only. Throws CycleSpitterException subclasses.
  std::string Process(const std::string& input_text,
                      const std::string& template_text,
                      const cycles::CostOverrides* overrides,
                      const utils::CliOptions& options) const;

 private:
  // Read a whole file; throws ConfigException
  std::string ReadFile(const std::string& path,
                       const std::string& what) const;

  // Write to the output file, or stdout when none is set
  void WriteOutput(const utils::CliOptions& options,
                   const std::string& text) const;
};

}  // namespace cyclespitter

#endif  // CYCLESPITTER_CYCLESPITTER_WORKFLOW_H_
