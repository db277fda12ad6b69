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
#include <functional>

#include "query/context.hpp"
#include "query/hops_limit.hpp"
#include "query/path.hpp"
#include "query/plan/expansion_step.hpp"
#include "query/vertex_accessor.hpp"

namespace hopgraph::query::plan {

/**
 * Depth-first driver of an expansion chain.
 *
 * Starting at a node, every accepted relationship is followed to its far node
 * where the continuation step is applied, until the chain ends. Each path that
 * reaches the end of the chain is passed to the visitor. A relationship is
 * used at most once within a path.
 */
class ChainTraversal final {
 public:
  /// Receives each matched path, returning false stops the traversal.
  using Visitor = std::function<bool(const Path &)>;

  ChainTraversal(ExpansionStepPtr first_step, const ExecutionContext &context)
      : first_step_(std::move(first_step)), context_(&context), hops_limit_(context.config.hops_limit) {}

  /// @return false when the visitor or the hops limit stopped the traversal.
  /// @throw StorageErrorException when the store fails while expanding.
  bool Run(const VertexAccessor &start, const Visitor &visitor);

  bool hops_limit_reached() const { return hops_limit_.IsReached(); }

  int64_t hops_expanded() const { return hops_limit_.expanded(); }

 private:
  bool Visit(Path *path, const ExpansionStep *step, const Visitor &visitor);

  ExpansionStepPtr first_step_;
  const ExecutionContext *context_;
  HopsLimit hops_limit_;
};

}  // namespace hopgraph::query::plan
