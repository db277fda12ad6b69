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
#include <optional>
#include <utility>
#include <vector>

#include "storage/edge_accessor.hpp"
#include "storage/edge_direction.hpp"
#include "storage/id_types.hpp"
#include "storage/result.hpp"

namespace hopgraph::storage {

struct Vertex;
class Graph;

/// Pull cursor over the relationships incident to one vertex.
///
/// Filtering by direction and edge type happens here, inside the store.
/// Nothing is read before the first call to Next and every call reads at most
/// up to the next matching relationship. Relationships come in adjacency
/// (insertion) order; for EdgeDirection::BOTH outgoing relationships come
/// first and a self-loop is reported once.
class IncidentEdges final {
 public:
  /// @param edge_types Types to keep, std::nullopt keeps every type.
  IncidentEdges(Vertex *vertex, Graph *graph, EdgeDirection direction,
                std::optional<std::vector<EdgeTypeId>> edge_types)
      : vertex_(vertex),
        graph_(graph),
        direction_(direction),
        edge_types_(std::move(edge_types)),
        in_phase_(direction == EdgeDirection::IN) {}

  /// Returns the next matching relationship or std::nullopt when exhausted.
  /// Fails when the store was closed or the vertex deleted in the meantime.
  Result<std::optional<EdgeAccessor>> Next();

 private:
  bool MatchesType(EdgeTypeId edge_type) const;

  Vertex *vertex_;
  Graph *graph_;
  EdgeDirection direction_;
  std::optional<std::vector<EdgeTypeId>> edge_types_;
  bool in_phase_;
  uint64_t position_{0};
};

}  // namespace hopgraph::storage
