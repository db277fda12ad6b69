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

#include <vector>

#include "storage/id_types.hpp"
#include "storage/property_value.hpp"
#include "storage/result.hpp"

namespace hopgraph::storage {

struct Edge;
class Graph;
class VertexAccessor;

class EdgeAccessor final {
 private:
  friend class Graph;

 public:
  EdgeAccessor(Edge *edge, Graph *graph) : edge_(edge), graph_(graph) {}

  VertexAccessor FromVertex() const;

  VertexAccessor ToVertex() const;

  EdgeTypeId EdgeType() const;

  bool IsDeleted() const;

  Result<PropertyValue> GetProperty(PropertyId property) const;

  Result<bool> HasProperty(PropertyId property) const;

  /// Keys of all set properties, in ascending property id order.
  Result<std::vector<PropertyId>> PropertyKeys() const;

  /// Set a property value and return the old value.
  Result<PropertyValue> SetProperty(PropertyId property, const PropertyValue &value);

  storage::Gid Gid() const noexcept;

  bool operator==(const EdgeAccessor &other) const noexcept { return edge_ == other.edge_; }
  bool operator!=(const EdgeAccessor &other) const noexcept { return !(*this == other); }

 private:
  Edge *edge_;
  Graph *graph_;
};

}  // namespace hopgraph::storage

namespace std {
template <>
struct hash<hopgraph::storage::EdgeAccessor> {
  size_t operator()(const hopgraph::storage::EdgeAccessor &e) const { return e.Gid().AsUint(); }
};
}  // namespace std
