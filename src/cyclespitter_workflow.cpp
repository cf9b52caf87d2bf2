// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "cyclespitter_workflow.h"

#include <fstream>
#include <iterator>
#include <iostream>
#include <vector>

#include "core/constants.h"
#include "core/exceptions.h"
#include "core/expression.h"
#include "cycles/cost_table.h"
#include "cycles/cycle_resolver.h"
#include "macro/macro_expander.h"
#include "output/formatter_registry.h"
#include "parse/line_parser.h"
#include "schedule/scanline_scheduler.h"
#include "schedule/template_loader.h"
#include "utils/logger.h"

namespace cyclespitter {

int CycleSpitterWorkflow::Run(int argc, char** argv) {
  // Parse command-line arguments
  utils::CliParser parser;
  utils::CliOptions options;
  std::string error;

  if (!parser.Parse(argc, argv, &options, &error)) {
    LOG_ERROR(error);
    std::cerr << parser.GetHelp() << std::endl;
    return constants::kExitConfig;
  }
  if (options.show_help) {
    std::cout << parser.GetHelp() << std::endl;
    return constants::kExitSuccess;
  }

  // Set log level
  if (options.verbose) {
    utils::Logger::Instance().SetLevel(utils::LogLevel::DEBUG);
  } else if (options.quiet) {
    utils::Logger::Instance().SetLevel(utils::LogLevel::WARNING);
  }

  LOG_INFO(std::string(constants::kToolName) + " " + constants::kToolVersion);

  try {
    std::string input_text = ReadFile(options.input_file, "input");
    std::string template_text;
    if (!options.expand_only) {
      template_text = ReadFile(options.template_file, "template");
    }

    // Load cost overrides if specified
    cycles::CostOverrides overrides;
    if (!options.costs_file.empty()) {
      LOG_INFO("Loading cost table from: " + options.costs_file);
      std::string costs_error;
      if (!overrides.ParseFile(options.costs_file, &costs_error)) {
        throw ConfigException("Failed to parse cost table: " + costs_error);
      }
      LOG_INFO("Loaded " + std::to_string(overrides.size()) + " cost overrides");
    }

    std::string output = Process(input_text, template_text, &overrides, options);

    // Nothing is written unless every stage succeeded
    WriteOutput(options, output);
    return constants::kExitSuccess;

  } catch (const CycleSpitterException& e) {
    LOG_ERROR(e.what());
    return ExitCodeFor(e.kind());
  } catch (const std::exception& e) {
    LOG_ERROR("Fatal error: " + std::string(e.what()));
    return constants::kExitGeneric;
  }
}

std::string CycleSpitterWorkflow::Process(
    const std::string& input_text, const std::string& template_text,
    const cycles::CostOverrides* overrides,
    const utils::CliOptions& options) const {
  if (!core::IsIdentifier(options.label)) {
    throw ConfigException("Invalid equate label: '" + options.label + "'");
  }
  if (options.scanline_cycles <= 0) {
    throw ConfigException("Scanline width must be positive, got " +
                          std::to_string(options.scanline_cycles));
  }

  // Create output formatter
  auto formatter =
      output::FormatterRegistry::Instance().Create(options.output_format);
  if (!formatter) {
    throw ConfigException("Unknown output format: " + options.output_format);
  }
  output::FormatterConfig config = output::FormatterConfig::Default();
  config.expand_padding = options.expand_nops;
  formatter->SetConfig(config);
  LOG_DEBUG("Using formatter: " + formatter->Name());

  // Parse and expand
  parse::LineParser parser;
  std::vector<core::SourceLine> lines = parser.ParseText(input_text);
  LOG_INFO("Parsed " + std::to_string(lines.size()) + " lines from " +
           options.input_file);

  macro::MacroExpander expander;
  std::vector<core::ExpandedLine> expanded = expander.Expand(lines);
  LOG_INFO("Expanded to " + std::to_string(expanded.size()) + " lines");

  // Resolve cycle costs
  cycles::CycleResolver resolver(cycles::CostTable::Instance(), overrides);
  std::vector<core::CostedLine> costed = resolver.ResolveAll(expanded);

  output::DocumentInfo info;
  info.scanlines_label = options.label;
  info.template_source = options.template_file;
  info.input_source = options.input_file;

  if (options.expand_only) {
    return formatter->FormatStream(costed, info);
  }

  // Schedule
  schedule::TemplateLoader loader(resolver);
  schedule::TemplateSet templates =
      loader.Load(template_text, options.template_file);
  schedule::ScanlineScheduler scheduler(templates, options.scanline_cycles,
                                        resolver.NopCycles());
  schedule::Schedule result = scheduler.Run(costed);

  return formatter->Format(result, info);
}

std::string CycleSpitterWorkflow::ReadFile(const std::string& path,
                                           const std::string& what) const {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigException("Failed to open " + what + " file: " + path);
  }
  std::string text((std::istreambuf_iterator<char>(file)),
                   std::istreambuf_iterator<char>());
  LOG_DEBUG("Read " + std::to_string(text.size()) + " bytes from " + path);
  return text;
}

void CycleSpitterWorkflow::WriteOutput(const utils::CliOptions& options,
                                       const std::string& text) const {
  if (options.output_file.empty()) {
    std::cout << text;
    std::cout.flush();
    return;
  }

  std::ofstream out_file(options.output_file);
  if (!out_file) {
    throw ConfigException("Failed to open output file: " +
                          options.output_file);
  }
  out_file << text;
  out_file.close();
  if (!out_file) {
    throw ConfigException("Failed to write output file: " +
                          options.output_file);
  }
  LOG_INFO("Output written to: " + options.output_file);
}

}  // namespace cyclespitter
