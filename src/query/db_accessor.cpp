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


#include "query/db_accessor.hpp"

#include "utils/logging.hpp"

namespace hopgraph::query {

IncidentEdges DbAccessor::EdgesFor(const VertexAccessor &vertex, storage::EdgeDirection direction,
                                   const std::vector<std::string> &edge_type_names) const {
  if (edge_type_names.empty()) return IncidentEdges(vertex.Edges(direction, std::nullopt));

  std::vector<storage::EdgeTypeId> edge_types;
  edge_types.reserve(edge_type_names.size());
  for (const auto &name : edge_type_names) {
    if (auto maybe_type = graph_->FindEdgeType(name)) {
      edge_types.push_back(*maybe_type);
    } else {
      SPDLOG_TRACE("Relationship type {} is unknown to the store", name);
    }
  }
  // An empty list of known types matches nothing.
  return IncidentEdges(vertex.Edges(direction, std::move(edge_types)));
}

}  // namespace hopgraph::query
