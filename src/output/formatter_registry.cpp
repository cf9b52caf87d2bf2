// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "output/formatter_registry.h"

#include "output/devpac_formatter.h"
#include "output/gas_formatter.h"
#include "utils/logger.h"

namespace cyclespitter {
namespace output {

FormatterRegistry& FormatterRegistry::Instance() {
  static FormatterRegistry instance;
  return instance;
}

FormatterRegistry::FormatterRegistry() {
  RegisterBuiltinFormatters();
}

void FormatterRegistry::RegisterBuiltinFormatters() {
  // Register Devpac formatter
  Register("devpac", &CreateDevpacFormatter);

  // Register GNU as formatter
  Register("gas", &CreateGasFormatter);

  LOG_DEBUG("Registered output formatters");
}

void FormatterRegistry::Register(const std::string& name,
                                 FormatterFactory factory) {
  factories_[name] = factory;
  LOG_DEBUG("Registered output formatter: " + name);
}

std::unique_ptr<Formatter> FormatterRegistry::Create(
    const std::string& name) const {
  auto it = factories_.find(name);
  if (it != factories_.end()) {
    return it->second();
  }
  std::string known;
  for (const auto& pair : factories_) {
    known += (known.empty() ? "" : ", ") + pair.first;
  }
  LOG_ERROR("Output formatter not found: " + name + " (available: " + known +
            ")");
  return nullptr;
}

bool FormatterRegistry::IsRegistered(const std::string& name) const {
  return factories_.find(name) != factories_.end();
}

std::vector<std::string> FormatterRegistry::GetRegisteredNames() const {
  std::vector<std::string> names;
  for (const auto& pair : factories_) {
    names.push_back(pair.first);
  }
  return names;
}

}  // namespace output
}  // namespace cyclespitter
