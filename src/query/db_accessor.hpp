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
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "query/edge_accessor.hpp"
#include "query/exceptions.hpp"
#include "query/typed_value.hpp"
#include "query/vertex_accessor.hpp"
#include "storage/edge_direction.hpp"
#include "storage/graph.hpp"
#include "storage/incident_edges.hpp"
#include "storage/result.hpp"

namespace hopgraph::query {

/// Unwraps a storage result, turning a storage error into StorageErrorException.
template <class TValue>
TValue ValueOrThrow(storage::Result<TValue> &&result) {
  if (result.HasError()) throw StorageErrorException(result.GetError());
  return std::move(result.GetValue());
}

/// Lazy cursor over the relationships of one node. The store is first
/// touched by the first call to Next.
class IncidentEdges final {
 public:
  explicit IncidentEdges(storage::IncidentEdges impl) : impl_(std::move(impl)) {}

  /// @throw StorageErrorException when the store fails while pulling.
  std::optional<EdgeAccessor> Next() {
    auto maybe_edge = ValueOrThrow(impl_.Next());
    if (!maybe_edge) return std::nullopt;
    return EdgeAccessor(*maybe_edge);
  }

 private:
  storage::IncidentEdges impl_;
};

class DbAccessor;

/// Property operations on nodes or relationships addressed by property name.
/// Every call goes to the store, nothing is cached. A name the store has never
/// seen behaves like a property that is not set.
template <class TAccessor>
class EntityOperations final {
 public:
  explicit EntityOperations(const DbAccessor *dba) : dba_(dba) {}

  bool HasProperty(const TAccessor &entity, std::string_view key) const;

  /// Returns Null for properties that are not set.
  TypedValue GetProperty(const TAccessor &entity, std::string_view key) const;

  /// Names of all properties set on the entity, in key order of the store.
  std::vector<std::string> PropertyKeys(const TAccessor &entity) const;

 private:
  const DbAccessor *dba_;
};

class DbAccessor final {
  storage::Graph *graph_;

 public:
  explicit DbAccessor(storage::Graph *graph) : graph_(graph) {}

  VertexAccessor InsertVertex() { return VertexAccessor(graph_->CreateVertex()); }

  storage::Result<EdgeAccessor> InsertEdge(VertexAccessor *from, VertexAccessor *to,
                                           const storage::EdgeTypeId &edge_type) {
    auto maybe_edge = graph_->CreateEdge(&from->impl_, &to->impl_, edge_type);
    if (maybe_edge.HasError()) return maybe_edge.GetError();
    return EdgeAccessor(*maybe_edge);
  }

  std::optional<VertexAccessor> FindVertex(storage::Gid gid) {
    auto maybe_vertex = graph_->FindVertex(gid);
    if (maybe_vertex) return VertexAccessor(*maybe_vertex);
    return std::nullopt;
  }

  storage::PropertyId NameToProperty(const std::string_view name) { return graph_->NameToProperty(name); }

  std::optional<storage::PropertyId> FindProperty(const std::string_view name) const {
    return graph_->FindProperty(name);
  }

  const std::string &PropertyToName(storage::PropertyId prop) const { return graph_->PropertyToName(prop); }

  storage::EdgeTypeId NameToEdgeType(const std::string_view name) { return graph_->NameToEdgeType(name); }

  std::optional<storage::EdgeTypeId> FindEdgeType(const std::string_view name) const {
    return graph_->FindEdgeType(name);
  }

  const std::string &EdgeTypeToName(storage::EdgeTypeId type) const { return graph_->EdgeTypeToName(type); }

  /// Relationships of `vertex` in `direction` whose type is one of
  /// `edge_type_names`. An empty list accepts every type, while names unknown
  /// to the store match nothing.
  IncidentEdges EdgesFor(const VertexAccessor &vertex, storage::EdgeDirection direction,
                         const std::vector<std::string> &edge_type_names) const;

  EntityOperations<VertexAccessor> NodeOps() const { return EntityOperations<VertexAccessor>(this); }

  EntityOperations<EdgeAccessor> RelationshipOps() const { return EntityOperations<EdgeAccessor>(this); }
};

template <class TAccessor>
bool EntityOperations<TAccessor>::HasProperty(const TAccessor &entity, std::string_view key) const {
  auto maybe_property = dba_->FindProperty(key);
  if (!maybe_property) {
    // Still surface a closed store or a deleted entity.
    ValueOrThrow(entity.PropertyKeys());
    return false;
  }
  return ValueOrThrow(entity.HasProperty(*maybe_property));
}

template <class TAccessor>
TypedValue EntityOperations<TAccessor>::GetProperty(const TAccessor &entity, std::string_view key) const {
  auto maybe_property = dba_->FindProperty(key);
  if (!maybe_property) {
    ValueOrThrow(entity.PropertyKeys());
    return TypedValue();
  }
  return TypedValue(ValueOrThrow(entity.GetProperty(*maybe_property)));
}

template <class TAccessor>
std::vector<std::string> EntityOperations<TAccessor>::PropertyKeys(const TAccessor &entity) const {
  auto property_ids = ValueOrThrow(entity.PropertyKeys());
  std::vector<std::string> keys;
  keys.reserve(property_ids.size());
  for (const auto &property : property_ids) keys.emplace_back(dba_->PropertyToName(property));
  return keys;
}

}  // namespace hopgraph::query
