// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "utils/logging.hpp"

namespace hopgraph::storage {

/// Two-way mapping between names (edge types, property keys) and their ids.
/// Ids are handed out densely in registration order.
class NameIdMapper final {
 public:
  uint64_t NameToId(std::string_view name) {
    if (auto found = name_to_id_.find(name); found != name_to_id_.end()) {
      return found->second;
    }
    const auto id = static_cast<uint64_t>(id_to_name_.size());
    id_to_name_.emplace_back(name);
    name_to_id_.emplace(std::string(name), id);
    return id;
  }

  /// Looks a name up without registering it.
  std::optional<uint64_t> FindId(std::string_view name) const {
    if (auto found = name_to_id_.find(name); found != name_to_id_.end()) {
      return found->second;
    }
    return std::nullopt;
  }

  const std::string &IdToName(uint64_t id) const {
    HG_ASSERT(id < id_to_name_.size(), "Trying to get a name for an invalid id {}", id);
    return id_to_name_[id];
  }

 private:
  std::map<std::string, uint64_t, std::less<>> name_to_id_;
  std::vector<std::string> id_to_name_;
};

}  // namespace hopgraph::storage
