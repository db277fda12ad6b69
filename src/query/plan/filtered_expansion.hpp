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

#include <cstddef>
#include <iterator>
#include <optional>

#include "query/context.hpp"
#include "query/db_accessor.hpp"
#include "query/edge_accessor.hpp"
#include "query/predicates.hpp"
#include "query/vertex_accessor.hpp"

namespace hopgraph::query::plan {

/**
 * Relationships of one node that pass a predicate, produced on demand.
 *
 * Each pull fetches candidates from the store until one passes the predicate,
 * which is evaluated against a fresh CandidateContext per candidate. Nothing
 * is fetched before the first pull and at most one accepted candidate is held.
 * The sequence is single-pass; expanding again starts a new one.
 */
class FilteredExpansion final {
 public:
  /// Input iterator over the accepted relationships.
  class Iterator final {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = EdgeAccessor;
    using difference_type = std::ptrdiff_t;
    using pointer = const EdgeAccessor *;
    using reference = const EdgeAccessor &;

    Iterator() = default;

    explicit Iterator(FilteredExpansion *self) : self_(self), current_(self->Next()) {
      if (!current_) self_ = nullptr;
    }

    reference operator*() const { return *current_; }
    pointer operator->() const { return &*current_; }

    Iterator &operator++() {
      current_ = self_->Next();
      if (!current_) self_ = nullptr;
      return *this;
    }

    bool operator==(const Iterator &other) const { return self_ == other.self_ && !self_; }
    bool operator!=(const Iterator &other) const { return !(*this == other); }

   private:
    FilteredExpansion *self_{nullptr};
    std::optional<EdgeAccessor> current_;
  };

  FilteredExpansion(IncidentEdges edges, const VertexAccessor &node, PredicatePtr predicate,
                    const ExecutionContext &context)
      : edges_(std::move(edges)), node_(node), predicate_(std::move(predicate)), context_(&context) {}

  /// A sequence without any relationship.
  static FilteredExpansion Empty(const VertexAccessor &node, const ExecutionContext &context) {
    return FilteredExpansion(node, context);
  }

  /// Next accepted relationship, std::nullopt once the source is exhausted.
  /// @throw StorageErrorException when the store fails.
  std::optional<EdgeAccessor> Next();

  /// The end of `edge` opposite to the expanded node.
  VertexAccessor FarNode(const EdgeAccessor &edge) const;

  const VertexAccessor &node() const { return node_; }

  Iterator begin() { return Iterator(this); }
  Iterator end() { return Iterator(); }

 private:
  FilteredExpansion(const VertexAccessor &node, const ExecutionContext &context) : node_(node), context_(&context) {}

  std::optional<IncidentEdges> edges_;
  VertexAccessor node_;
  PredicatePtr predicate_;
  const ExecutionContext *context_;
};

}  // namespace hopgraph::query::plan
