// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "cycles/cost_overrides.h"

#include <cstdint>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>

#include "cycles/instruction_shape.h"

using json = nlohmann::json;

namespace cyclespitter {
namespace cycles {

bool CostOverrides::ParseFile(const std::string& file_path,
                              std::string* error) {
  // Read file
  std::ifstream file(file_path);
  if (!file.is_open()) {
    *error = "Failed to open cost table: " + file_path;
    return false;
  }

  std::string json_content((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
  file.close();

  return ParseJson(json_content, error);
}

bool CostOverrides::ParseJson(const std::string& json_content,
                              std::string* error) {
  try {
    json j = json::parse(json_content);

    if (!j.is_object() || !j.contains("overrides")) {
      *error = "Cost table missing 'overrides' object";
      return false;
    }
    if (!j["overrides"].is_object()) {
      *error = "'overrides' must be an object";
      return false;
    }

    std::map<std::string, int> parsed;
    for (auto& [key, value] : j["overrides"].items()) {
      if (!value.is_number_integer()) {
        *error = "Cost for '" + key + "' must be an integer";
        return false;
      }
      int64_t cycles = value.get<int64_t>();
      if (cycles < 0 || cycles > 0x7fffffff) {
        *error = "Cost for '" + key + "' out of range: " +
                 std::to_string(cycles);
        return false;
      }
      std::string canonical = CanonicalInstruction(key);
      if (canonical.empty()) {
        *error = "Empty key in cost table";
        return false;
      }
      parsed[canonical] = static_cast<int>(cycles);
    }

    for (const auto& [key, cycles] : parsed) {
      entries_[key] = cycles;
    }
    return true;

  } catch (const json::exception& e) {
    *error = std::string("JSON parse error: ") + e.what();
    return false;
  }
}

void CostOverrides::Set(const std::string& key, int cycles) {
  entries_[CanonicalInstruction(key)] = cycles;
}

std::optional<int> CostOverrides::Find(const std::string& instruction,
                                       const std::string& shape_key) const {
  auto literal = entries_.find(CanonicalInstruction(instruction));
  if (literal != entries_.end()) {
    return literal->second;
  }
  auto shape = entries_.find(shape_key);
  if (shape != entries_.end()) {
    return shape->second;
  }
  return std::nullopt;
}

}  // namespace cycles
}  // namespace cyclespitter
