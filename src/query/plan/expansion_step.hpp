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
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "query/context.hpp"
#include "query/plan/filtered_expansion.hpp"
#include "query/predicates.hpp"
#include "query/vertex_accessor.hpp"
#include "storage/edge_direction.hpp"

namespace hopgraph::query::plan {

class ExpansionStep;

/// Steps are immutable once built, so chains share their continuations freely.
using ExpansionStepPtr = std::shared_ptr<const ExpansionStep>;

/// Result of expanding a single node with a step.
struct Expansion {
  /// Accepted relationships, fetched on demand.
  FilteredExpansion edges;
  /// Step to apply on the far node of every accepted relationship,
  /// nullptr when the chain ends.
  ExpansionStepPtr next;
};

/**
 * One hop of a pattern chain.
 *
 * A step describes how to get from the current node over its relationships
 * to the next node: which relationship types and direction qualify, which
 * predicates the relationship (bound as `r`) and the far node (bound as `n`)
 * have to satisfy, and which step continues the chain.
 */
class ExpansionStep {
 public:
  /// @param edge_types Relationship type names, empty accepts every type.
  /// @param edge_predicate Applied to the candidate relationship, nullptr accepts all.
  /// @param node_predicate Applied to the candidate far node, nullptr accepts all.
  ExpansionStep(int64_t id, std::vector<std::string> edge_types, storage::EdgeDirection direction,
                ExpansionStepPtr next, PredicatePtr edge_predicate, PredicatePtr node_predicate);

  ExpansionStep(const ExpansionStep &) = delete;
  ExpansionStep &operator=(const ExpansionStep &) = delete;
  ExpansionStep(ExpansionStep &&) = delete;
  ExpansionStep &operator=(ExpansionStep &&) = delete;
  virtual ~ExpansionStep() = default;

  /// Lazily expands `node`. The store is not touched before the returned
  /// relationships are pulled.
  virtual Expansion Expand(const VertexAccessor &node, const ExecutionContext &context) const = 0;

  /// A new step of the same kind with `next`, `direction` and `node_predicate`
  /// replaced and every other field kept.
  virtual ExpansionStepPtr CreateCopy(ExpansionStepPtr next, storage::EdgeDirection direction,
                                      PredicatePtr node_predicate) const = 0;

  /// Number of hops until the end of the chain, std::nullopt when a hop of
  /// unbounded length follows.
  virtual std::optional<int64_t> Size() const = 0;

  /// Whether the chain may skip this hop, continuing with `next` from the
  /// current node without consuming a relationship.
  virtual bool ShouldInclude() const = 0;

  virtual bool Equals(const ExpansionStep &other) const;

  /// Renders the chain starting at this step, e.g. `(1)-[:KNOWS {true,true}]->()`.
  std::string ToString() const;

  int64_t id() const { return id_; }
  const std::vector<std::string> &edge_types() const { return edge_types_; }
  storage::EdgeDirection direction() const { return direction_; }
  const ExpansionStepPtr &next() const { return next_; }
  const PredicatePtr &edge_predicate() const { return edge_predicate_; }
  const PredicatePtr &node_predicate() const { return node_predicate_; }

 protected:
  /// Relationships of `node` matching types, direction and both predicates.
  FilteredExpansion ExpandEdges(const VertexAccessor &node, const ExecutionContext &context) const;

  /// The part between the dashes of the rendering.
  virtual std::string RelationshipInfo() const = 0;

  std::string PredicateInfo() const;

 private:
  int64_t id_;
  std::vector<std::string> edge_types_;
  storage::EdgeDirection direction_;
  ExpansionStepPtr next_;
  PredicatePtr edge_predicate_;
  PredicatePtr node_predicate_;
  // edge_predicate_ AND node_predicate_
  PredicatePtr combined_predicate_;
};

inline bool operator==(const ExpansionStep &a, const ExpansionStep &b) { return a.Equals(b); }
inline bool operator!=(const ExpansionStep &a, const ExpansionStep &b) { return !a.Equals(b); }

inline std::ostream &operator<<(std::ostream &os, const ExpansionStep &step) { return os << step.ToString(); }

/// Exactly one relationship.
class SingleStep final : public ExpansionStep {
 public:
  using ExpansionStep::ExpansionStep;

  Expansion Expand(const VertexAccessor &node, const ExecutionContext &context) const override;

  ExpansionStepPtr CreateCopy(ExpansionStepPtr next, storage::EdgeDirection direction,
                              PredicatePtr node_predicate) const override;

  std::optional<int64_t> Size() const override;

  bool ShouldInclude() const override { return false; }

 protected:
  std::string RelationshipInfo() const override;
};

/// Between `min_length` and `max_length` relationships, each of them matching
/// types, direction and predicates. Without `max_length` the hop is unbounded.
class VarLengthStep final : public ExpansionStep {
 public:
  VarLengthStep(int64_t id, std::vector<std::string> edge_types, storage::EdgeDirection direction,
                ExpansionStepPtr next, PredicatePtr edge_predicate, PredicatePtr node_predicate, int64_t min_length,
                std::optional<int64_t> max_length);

  /// Yields relationships for one more hop. The continuation is `next` when
  /// this is the last allowed hop, otherwise this step with both bounds
  /// lowered by one.
  Expansion Expand(const VertexAccessor &node, const ExecutionContext &context) const override;

  ExpansionStepPtr CreateCopy(ExpansionStepPtr next, storage::EdgeDirection direction,
                              PredicatePtr node_predicate) const override;

  std::optional<int64_t> Size() const override;

  bool ShouldInclude() const override { return min_length_ == 0; }

  bool Equals(const ExpansionStep &other) const override;

  int64_t min_length() const { return min_length_; }
  std::optional<int64_t> max_length() const { return max_length_; }

 protected:
  std::string RelationshipInfo() const override;

 private:
  int64_t min_length_;
  std::optional<int64_t> max_length_;
};

}  // namespace hopgraph::query::plan
