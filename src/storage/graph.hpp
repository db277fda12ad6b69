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

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "storage/edge.hpp"
#include "storage/edge_accessor.hpp"
#include "storage/id_types.hpp"
#include "storage/name_id_mapper.hpp"
#include "storage/result.hpp"
#include "storage/vertex.hpp"
#include "storage/vertex_accessor.hpp"

namespace hopgraph::storage {

/// Single-threaded in-memory property graph.
///
/// Deleted objects stay owned by the graph until it is destroyed, so
/// accessors held by callers never dangle; they report DELETED_OBJECT instead.
/// After Close every access reports STORAGE_CLOSED.
class Graph final {
 public:
  Graph() = default;
  Graph(const Graph &) = delete;
  Graph(Graph &&) = delete;
  Graph &operator=(const Graph &) = delete;
  Graph &operator=(Graph &&) = delete;
  ~Graph() = default;

  VertexAccessor CreateVertex();

  Result<EdgeAccessor> CreateEdge(VertexAccessor *from, VertexAccessor *to, EdgeTypeId edge_type);

  /// @return true if the edge was deleted, false if it was already deleted.
  Result<bool> DeleteEdge(EdgeAccessor *edge);

  /// Deletes the vertex together with all of its edges.
  Result<bool> DetachDeleteVertex(VertexAccessor *vertex);

  std::optional<VertexAccessor> FindVertex(Gid gid);

  EdgeTypeId NameToEdgeType(std::string_view name) { return EdgeTypeId::FromUint(edge_types_.NameToId(name)); }

  std::optional<EdgeTypeId> FindEdgeType(std::string_view name) const {
    if (auto id = edge_types_.FindId(name)) return EdgeTypeId::FromUint(*id);
    return std::nullopt;
  }

  const std::string &EdgeTypeToName(EdgeTypeId edge_type) const { return edge_types_.IdToName(edge_type.AsUint()); }

  PropertyId NameToProperty(std::string_view name) { return PropertyId::FromUint(properties_.NameToId(name)); }

  std::optional<PropertyId> FindProperty(std::string_view name) const {
    if (auto id = properties_.FindId(name)) return PropertyId::FromUint(*id);
    return std::nullopt;
  }

  const std::string &PropertyToName(PropertyId property) const { return properties_.IdToName(property.AsUint()); }

  void Close();

  bool IsOpen() const { return open_; }

  /// The error an access to an object of this graph has to report, if any.
  std::optional<Error> AccessError(bool object_deleted) const {
    if (!open_) return Error::STORAGE_CLOSED;
    if (object_deleted) return Error::DELETED_OBJECT;
    return std::nullopt;
  }

 private:
  void DetachFromVertices(Edge *edge);

  std::unordered_map<Gid, std::unique_ptr<Vertex>> vertices_;
  std::unordered_map<Gid, std::unique_ptr<Edge>> edges_;
  uint64_t next_vertex_id_{0};
  uint64_t next_edge_id_{0};
  NameIdMapper edge_types_;
  NameIdMapper properties_;
  bool open_{true};
};

}  // namespace hopgraph::storage
