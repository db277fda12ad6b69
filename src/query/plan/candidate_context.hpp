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
#include <string_view>

#include "query/context.hpp"
#include "query/edge_accessor.hpp"
#include "query/predicates.hpp"
#include "query/typed_value.hpp"
#include "query/vertex_accessor.hpp"

namespace hopgraph::query::plan {

/// Bindings of a single expansion candidate: the relationship under
/// `kRelationshipBinding` and the node on its far end under `kNodeBinding`.
/// Created for one predicate evaluation and dropped right after it.
class CandidateContext final : public BindingContext {
 public:
  static constexpr std::string_view kRelationshipBinding{"r"};
  static constexpr std::string_view kNodeBinding{"n"};

  CandidateContext(const EdgeAccessor &relationship, const VertexAccessor &node, const ExecutionContext &context)
      : relationship_(relationship), node_(node), context_(&context) {}

  std::optional<TypedValue> Lookup(std::string_view name) const override;

  const ExecutionContext &execution_context() const override { return *context_; }

  const EdgeAccessor &relationship() const { return relationship_; }
  const VertexAccessor &node() const { return node_; }

 private:
  EdgeAccessor relationship_;
  VertexAccessor node_;
  const ExecutionContext *context_;
};

}  // namespace hopgraph::query::plan
