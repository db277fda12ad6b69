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

#include <map>
#include <vector>

#include "storage/id_types.hpp"
#include "storage/property_value.hpp"

namespace hopgraph::storage {

/// Properties of a single vertex or edge, ordered by property id.
class PropertyStore final {
 public:
  /// Returns Null for properties that are not set.
  PropertyValue GetProperty(PropertyId property) const {
    if (auto found = properties_.find(property); found != properties_.end()) return found->second;
    return PropertyValue();
  }

  bool HasProperty(PropertyId property) const { return properties_.contains(property); }

  /// Setting a Null value removes the property. Returns the old value.
  PropertyValue SetProperty(PropertyId property, const PropertyValue &value) {
    auto old_value = GetProperty(property);
    if (value.IsNull()) {
      properties_.erase(property);
    } else {
      properties_.insert_or_assign(property, value);
    }
    return old_value;
  }

  std::vector<PropertyId> Keys() const {
    std::vector<PropertyId> keys;
    keys.reserve(properties_.size());
    for (const auto &[key, _] : properties_) keys.push_back(key);
    return keys;
  }

 private:
  std::map<PropertyId, PropertyValue> properties_;
};

}  // namespace hopgraph::storage
