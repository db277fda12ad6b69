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

#include "storage/incident_edges.hpp"

#include <algorithm>

#include "storage/graph.hpp"
#include "storage/vertex.hpp"

namespace hopgraph::storage {

bool IncidentEdges::MatchesType(EdgeTypeId edge_type) const {
  if (!edge_types_) return true;
  return std::find(edge_types_->begin(), edge_types_->end(), edge_type) != edge_types_->end();
}

Result<std::optional<EdgeAccessor>> IncidentEdges::Next() {
  if (auto error = graph_->AccessError(vertex_->deleted)) return *error;

  while (true) {
    const auto &adjacency = in_phase_ ? vertex_->in_edges : vertex_->out_edges;
    while (position_ < adjacency.size()) {
      const auto &[edge_type, other_vertex, edge] = adjacency[position_++];
      if (!MatchesType(edge_type)) continue;
      // A self-loop was already reported from out_edges.
      if (in_phase_ && direction_ == EdgeDirection::BOTH && other_vertex == vertex_) continue;
      return std::optional<EdgeAccessor>{EdgeAccessor(edge, graph_)};
    }
    if (in_phase_ || direction_ != EdgeDirection::BOTH) return std::optional<EdgeAccessor>{};
    in_phase_ = true;
    position_ = 0;
  }
}

}  // namespace hopgraph::storage
