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


#include "query/plan/filtered_expansion.hpp"

#include "query/plan/candidate_context.hpp"
#include "utils/logging.hpp"

namespace hopgraph::query::plan {

std::optional<EdgeAccessor> FilteredExpansion::Next() {
  if (!edges_) return std::nullopt;
  while (auto edge = edges_->Next()) {
    CandidateContext candidate(*edge, FarNode(*edge), *context_);
    if (predicate_->IsMatch(candidate)) return edge;
    if (context_->config.trace_rejected_candidates) {
      SPDLOG_TRACE("Relationship {} from node {} rejected by {}", edge->CypherId(), node_.CypherId(),
                   predicate_->ToString());
    }
  }
  return std::nullopt;
}

VertexAccessor FilteredExpansion::FarNode(const EdgeAccessor &edge) const {
  auto from = edge.From();
  if (from == node_) return edge.To();
  return from;
}

}  // namespace hopgraph::query::plan
