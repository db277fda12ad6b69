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

#include <optional>
#include <utility>
#include <vector>

#include "storage/edge_direction.hpp"
#include "storage/id_types.hpp"
#include "storage/incident_edges.hpp"
#include "storage/property_value.hpp"
#include "storage/result.hpp"

namespace hopgraph::storage {

struct Vertex;
class Graph;

class VertexAccessor final {
 private:
  friend class Graph;
  friend class EdgeAccessor;

 public:
  VertexAccessor(Vertex *vertex, Graph *graph) : vertex_(vertex), graph_(graph) {}

  bool IsDeleted() const;

  Result<PropertyValue> GetProperty(PropertyId property) const;

  Result<bool> HasProperty(PropertyId property) const;

  /// Keys of all set properties, in ascending property id order.
  Result<std::vector<PropertyId>> PropertyKeys() const;

  /// Set a property value and return the old value.
  Result<PropertyValue> SetProperty(PropertyId property, const PropertyValue &value);

  /// Lazily iterate the incident relationships. No store access happens
  /// until the returned cursor is pulled.
  IncidentEdges Edges(EdgeDirection direction, std::optional<std::vector<EdgeTypeId>> edge_types) const {
    return IncidentEdges(vertex_, graph_, direction, std::move(edge_types));
  }

  Result<size_t> InDegree() const;

  Result<size_t> OutDegree() const;

  storage::Gid Gid() const noexcept;

  bool operator==(const VertexAccessor &other) const noexcept { return vertex_ == other.vertex_; }
  bool operator!=(const VertexAccessor &other) const noexcept { return !(*this == other); }

 private:
  Vertex *vertex_;
  Graph *graph_;
};

}  // namespace hopgraph::storage

namespace std {
template <>
struct hash<hopgraph::storage::VertexAccessor> {
  size_t operator()(const hopgraph::storage::VertexAccessor &v) const { return v.Gid().AsUint(); }
};
}  // namespace std
