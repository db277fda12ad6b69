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


#include "query/plan/expansion_step.hpp"

#include <algorithm>
#include <typeinfo>

#include <fmt/format.h>

#include "query/db_accessor.hpp"
#include "query/exceptions.hpp"
#include "utils/logging.hpp"

namespace hopgraph::query::plan {

namespace {

PredicatePtr OrAcceptAll(PredicatePtr predicate) {
  if (predicate) return predicate;
  return std::make_shared<TruePredicate>();
}

bool SameSteps(const ExpansionStepPtr &a, const ExpansionStepPtr &b) {
  if (!a || !b) return !a && !b;
  return *a == *b;
}

}  // namespace

ExpansionStep::ExpansionStep(int64_t id, std::vector<std::string> edge_types, storage::EdgeDirection direction,
                             ExpansionStepPtr next, PredicatePtr edge_predicate, PredicatePtr node_predicate)
    : id_(id),
      edge_types_(std::move(edge_types)),
      direction_(direction),
      next_(std::move(next)),
      edge_predicate_(OrAcceptAll(std::move(edge_predicate))),
      node_predicate_(OrAcceptAll(std::move(node_predicate))),
      combined_predicate_(std::make_shared<AndPredicate>(edge_predicate_, node_predicate_)) {}

bool ExpansionStep::Equals(const ExpansionStep &other) const {
  if (typeid(*this) != typeid(other)) return false;
  return id_ == other.id_ && direction_ == other.direction_ && SameSteps(next_, other.next_) &&
         edge_types_ == other.edge_types_ && *edge_predicate_ == *other.edge_predicate_ &&
         *node_predicate_ == *other.node_predicate_;
}

std::string ExpansionStep::ToString() const {
  const auto *left = direction_ != storage::EdgeDirection::OUT ? "<" : "";
  const auto *right = direction_ != storage::EdgeDirection::IN ? ">" : "";
  auto rest = next_ ? next_->ToString() : std::string("()");
  return fmt::format("({}){}-{}-{}{}", id_, left, RelationshipInfo(), right, rest);
}

std::string ExpansionStep::PredicateInfo() const {
  return fmt::format("{{{},{}}}", edge_predicate_->ToString(), node_predicate_->ToString());
}

FilteredExpansion ExpansionStep::ExpandEdges(const VertexAccessor &node, const ExecutionContext &context) const {
  HG_ASSERT(context.db_accessor, "Expanding requires store access");
  auto edges = context.db_accessor->EdgesFor(node, direction_, edge_types_);
  return FilteredExpansion(std::move(edges), node, combined_predicate_, context);
}

Expansion SingleStep::Expand(const VertexAccessor &node, const ExecutionContext &context) const {
  return Expansion{ExpandEdges(node, context), next()};
}

ExpansionStepPtr SingleStep::CreateCopy(ExpansionStepPtr next, storage::EdgeDirection direction,
                                        PredicatePtr node_predicate) const {
  return std::make_shared<SingleStep>(id(), edge_types(), direction, std::move(next), edge_predicate(),
                                      std::move(node_predicate));
}

std::optional<int64_t> SingleStep::Size() const {
  if (!next()) return 1;
  auto rest = next()->Size();
  if (!rest) return std::nullopt;
  return *rest + 1;
}

std::string SingleStep::RelationshipInfo() const {
  if (edge_types().empty()) return "";
  return fmt::format("[:{} {}]", fmt::join(edge_types(), "|"), PredicateInfo());
}

VarLengthStep::VarLengthStep(int64_t id, std::vector<std::string> edge_types, storage::EdgeDirection direction,
                             ExpansionStepPtr next, PredicatePtr edge_predicate, PredicatePtr node_predicate,
                             int64_t min_length, std::optional<int64_t> max_length)
    : ExpansionStep(id, std::move(edge_types), direction, std::move(next), std::move(edge_predicate),
                    std::move(node_predicate)),
      min_length_(min_length),
      max_length_(max_length) {
  if (min_length_ < 0) throw SemanticException("Minimum length of a variable length hop can't be negative.");
  if (max_length_ && *max_length_ < min_length_) {
    throw SemanticException("Maximum length of a variable length hop can't be lower than its minimum length.");
  }
}

Expansion VarLengthStep::Expand(const VertexAccessor &node, const ExecutionContext &context) const {
  if (max_length_ && *max_length_ == 0) return Expansion{FilteredExpansion::Empty(node, context), next()};
  if (max_length_ && *max_length_ == 1) return Expansion{ExpandEdges(node, context), next()};

  auto remaining_max = max_length_ ? std::optional<int64_t>(*max_length_ - 1) : std::nullopt;
  auto continuation =
      std::make_shared<VarLengthStep>(id(), edge_types(), direction(), next(), edge_predicate(), node_predicate(),
                                      std::max<int64_t>(min_length_ - 1, 0), remaining_max);
  return Expansion{ExpandEdges(node, context), std::move(continuation)};
}

ExpansionStepPtr VarLengthStep::CreateCopy(ExpansionStepPtr next, storage::EdgeDirection direction,
                                           PredicatePtr node_predicate) const {
  return std::make_shared<VarLengthStep>(id(), edge_types(), direction, std::move(next), edge_predicate(),
                                         std::move(node_predicate), min_length_, max_length_);
}

std::optional<int64_t> VarLengthStep::Size() const {
  if (!max_length_) return std::nullopt;
  if (!next()) return *max_length_;
  auto rest = next()->Size();
  if (!rest) return std::nullopt;
  return *rest + *max_length_;
}

bool VarLengthStep::Equals(const ExpansionStep &other) const {
  if (!ExpansionStep::Equals(other)) return false;
  const auto &other_var = static_cast<const VarLengthStep &>(other);
  return min_length_ == other_var.min_length_ && max_length_ == other_var.max_length_;
}

std::string VarLengthStep::RelationshipInfo() const {
  auto types = edge_types().empty() ? std::string() : fmt::format(":{}", fmt::join(edge_types(), "|"));
  auto max = max_length_ ? std::to_string(*max_length_) : std::string();
  return fmt::format("[{}*{}..{} {}]", types, min_length_, max, PredicateInfo());
}

}  // namespace hopgraph::query::plan
