// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef CYCLESPITTER_OUTPUT_FORMATTER_REGISTRY_H_
#define CYCLESPITTER_OUTPUT_FORMATTER_REGISTRY_H_

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "output/formatter.h"

namespace cyclespitter {
namespace output {

// Registry for output dialects, selected with --format.
// Built in: "devpac" (Devpac / vasm mot syntax) and "gas" (GNU as).
class FormatterRegistry {
 public:
  static FormatterRegistry& Instance();

  // Register a formatter
  void Register(const std::string& name, FormatterFactory factory);

  // Create a formatter by name
  std::unique_ptr<Formatter> Create(const std::string& name) const;

  // Check if a formatter is registered
  bool IsRegistered(const std::string& name) const;

  // Get list of registered formatter names
  std::vector<std::string> GetRegisteredNames() const;

  // Prevent copying
  FormatterRegistry(const FormatterRegistry&) = delete;
  FormatterRegistry& operator=(const FormatterRegistry&) = delete;

 private:
  FormatterRegistry();
  void RegisterBuiltinFormatters();

  std::map<std::string, FormatterFactory> factories_;
};

}  // namespace output
}  // namespace cyclespitter

#endif  // CYCLESPITTER_OUTPUT_FORMATTER_REGISTRY_H_
