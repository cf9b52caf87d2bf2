// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "utils/cli_parser.h"

#include <CLI/CLI.hpp>

namespace cyclespitter {
namespace utils {

CliParser::CliParser() {}

bool CliParser::Parse(int argc, char** argv, CliOptions* options,
                      std::string* error) {
  CLI::App app{"cycleSpitter - 68000 scanline cycle scheduler"};
  app.set_version_flag("--version", constants::kToolVersion);

  // Inputs. The positionals mirror "cyclespitter file.s LABEL template.s".
  app.add_option("-i,--input,input", options->input_file,
                 "Assembly source to schedule")
      ->default_val(constants::kDefaultInputFile);
  app.add_option("-l,--label,label", options->label,
                 "Equate label bound to the scanline count")
      ->default_val(constants::kDefaultScanlinesLabel);
  app.add_option("-t,--template,template", options->template_file,
                 "Template with left-border, right-border and stabilizer code")
      ->default_val(constants::kDefaultTemplateFile);
  app.add_option("--costs", options->costs_file,
                 "Cycle cost override table (JSON)")
      ->check(CLI::ExistingFile);

  // Output options
  app.add_option("-o,--output", options->output_file,
                 "Output assembly file (default: stdout)");
  app.add_option("-f,--format", options->output_format,
                 "Output dialect (devpac, gas)")
      ->default_val("devpac");
  app.add_flag("--expand-nops", options->expand_nops,
               "Pad with individual nop lines instead of dcb.w");
  app.add_flag("--expand-only", options->expand_only,
               "Emit the expanded, costed stream without scheduling");

  // Scheduling
  app.add_option("-w,--width", options->scanline_cycles,
                 "Scanline width in cycles")
      ->default_val(constants::kDefaultScanlineCycles)
      ->check(CLI::PositiveNumber);

  // Logging
  auto verbose = app.add_flag("-v,--verbose", options->verbose,
                              "Verbose output");
  app.add_flag("-q,--quiet", options->quiet, "Only report warnings and errors")
      ->excludes(verbose);

  // Parse
  try {
    app.parse(argc, argv);
    help_text_ = app.help();
    return true;
  } catch (const CLI::CallForHelp&) {
    options->show_help = true;
    help_text_ = app.help();
    return true;
  } catch (const CLI::CallForVersion&) {
    options->show_help = true;
    help_text_ = std::string(constants::kToolName) + " " +
                 constants::kToolVersion;
    return true;
  } catch (const CLI::ParseError& e) {
    *error = "Command-line parse error: ";
    *error += e.what();
    help_text_ = app.help();
    return false;
  }
}

std::string CliParser::GetHelp() const {
  return help_text_;
}

}  // namespace utils
}  // namespace cyclespitter
