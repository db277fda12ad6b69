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


#include "query/plan/chain_traversal.hpp"

#include "utils/logging.hpp"

namespace hopgraph::query::plan {

bool ChainTraversal::Run(const VertexAccessor &start, const Visitor &visitor) {
  Path path(start);
  return Visit(&path, first_step_.get(), visitor);
}

bool ChainTraversal::Visit(Path *path, const ExpansionStep *step, const Visitor &visitor) {
  if (!step) return visitor(*path);

  if (step->ShouldInclude() && !Visit(path, step->next().get(), visitor)) return false;

  auto expansion = step->Expand(path->End(), *context_);
  while (auto edge = expansion.edges.Next()) {
    if (path->Contains(*edge)) continue;

    if (!hops_limit_.TryExpand()) {
      spdlog::debug("Traversal stopped after expanding {} relationships, the hops limit is {}",
                    hops_limit_.expanded(), *hops_limit_.limit());
      return false;
    }

    path->Expand(*edge, expansion.edges.FarNode(*edge));
    const bool keep_going = Visit(path, expansion.next.get(), visitor);
    path->Shrink();
    if (!keep_going) return false;
  }
  return true;
}

}  // namespace hopgraph::query::plan
