// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef CYCLESPITTER_CYCLES_COST_OVERRIDES_H_
#define CYCLESPITTER_CYCLES_COST_OVERRIDES_H_

#include <map>
#include <optional>
#include <string>

namespace cyclespitter {
namespace cycles {

// External cycle cost table loaded from JSON:
//
//   { "overrides": { "mulu.w dn,dn": 70, "divu #7,d0": 140 } }
//
// A key is either a normalized shape or a literal instruction. Keys are
// compared in canonical form (lower case, single spaces, none around
// commas). A literal instruction match wins over a shape match.
class CostOverrides {
 public:
  CostOverrides() = default;

  // Parse overrides from JSON file
  // Returns true on success, false on error
  bool ParseFile(const std::string& file_path, std::string* error);

  // Parse overrides from JSON string
  bool ParseJson(const std::string& json_content, std::string* error);

  // Add or replace one entry
  void Set(const std::string& key, int cycles);

  // Cost for an instruction: literal text first, then its shape key
  std::optional<int> Find(const std::string& instruction,
                          const std::string& shape_key) const;

  bool empty() const { return entries_.empty(); }
  size_t size() const { return entries_.size(); }

 private:
  std::map<std::string, int> entries_;
};

}  // namespace cycles
}  // namespace cyclespitter

#endif  // CYCLESPITTER_CYCLES_COST_OVERRIDES_H_
