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


#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "hopgraph_test_common.hpp"
#include "query/exceptions.hpp"
#include "query/plan/filtered_expansion.hpp"
#include "query/predicates.hpp"
#include "storage/edge_direction.hpp"

using hopgraph::query::EdgeAccessor;
using hopgraph::query::PropertyComparison;
using hopgraph::query::TruePredicate;
using hopgraph::query::TypedValue;
using hopgraph::query::VertexAccessor;
using hopgraph::query::plan::FilteredExpansion;
using hopgraph::storage::EdgeDirection;
using hopgraph::storage::PropertyValue;
using hopgraph::test_common::CountingPredicate;

class FilteredExpansionTest : public hopgraph::test_common::GraphTest {
 protected:
  FilteredExpansionTest() : x(AddNode("X")), y(AddNode("Y")), z(AddNode("Z")), w(AddNode("W")) {
    knows = AddEdge(&x, &y, "KNOWS");
    likes = AddEdge(&x, &z, "LIKES");
    known_by = AddEdge(&w, &x, "KNOWS");
  }

  FilteredExpansion Expand(const VertexAccessor &node, EdgeDirection direction, std::vector<std::string> types,
                           hopgraph::query::PredicatePtr predicate) {
    return FilteredExpansion(dba.EdgesFor(node, direction, types), node, std::move(predicate), context);
  }

  std::vector<std::string> FarNames(FilteredExpansion *expansion) {
    std::vector<std::string> names;
    for (const auto &edge : *expansion) names.push_back(Name(expansion->FarNode(edge)));
    return names;
  }

  VertexAccessor x;
  VertexAccessor y;
  VertexAccessor z;
  VertexAccessor w;
  std::optional<EdgeAccessor> knows;
  std::optional<EdgeAccessor> likes;
  std::optional<EdgeAccessor> known_by;
};

TEST_F(FilteredExpansionTest, NothingEvaluatedBeforeFirstPull) {
  auto counting = std::make_shared<CountingPredicate>();
  auto expansion = Expand(x, EdgeDirection::BOTH, {}, counting);
  EXPECT_EQ(counting->evaluations(), 0);

  auto first = expansion.Next();
  ASSERT_TRUE(first);
  EXPECT_EQ(counting->evaluations(), 1);
  EXPECT_EQ(*first, *knows);
}

TEST_F(FilteredExpansionTest, PullsOneCandidateAtATime) {
  auto counting = std::make_shared<CountingPredicate>(false);
  auto expansion = Expand(x, EdgeDirection::BOTH, {}, counting);
  EXPECT_FALSE(expansion.Next());
  EXPECT_EQ(counting->evaluations(), 3);
  EXPECT_FALSE(expansion.Next());
  EXPECT_EQ(counting->evaluations(), 3);
}

TEST_F(FilteredExpansionTest, TypeAndDirection) {
  auto accept = std::make_shared<TruePredicate>();
  {
    auto expansion = Expand(x, EdgeDirection::OUT, {"KNOWS"}, accept);
    EXPECT_EQ(FarNames(&expansion), std::vector<std::string>{"Y"});
  }
  {
    auto expansion = Expand(x, EdgeDirection::OUT, {}, accept);
    EXPECT_EQ(FarNames(&expansion), (std::vector<std::string>{"Y", "Z"}));
  }
  {
    auto expansion = Expand(x, EdgeDirection::IN, {}, accept);
    EXPECT_EQ(FarNames(&expansion), std::vector<std::string>{"W"});
  }
  {
    auto expansion = Expand(x, EdgeDirection::BOTH, {"KNOWS"}, accept);
    EXPECT_EQ(FarNames(&expansion), (std::vector<std::string>{"Y", "W"}));
  }
  {
    auto expansion = Expand(x, EdgeDirection::BOTH, {"KNOWS", "LIKES"}, accept);
    EXPECT_EQ(FarNames(&expansion), (std::vector<std::string>{"Y", "Z", "W"}));
  }
  {
    auto expansion = Expand(x, EdgeDirection::BOTH, {"HATES"}, accept);
    EXPECT_TRUE(FarNames(&expansion).empty());
  }
}

TEST_F(FilteredExpansionTest, PredicateSeesFarNodeAndRelationship) {
  SetProperty(&*likes, "since", PropertyValue(2020));
  auto named_z = std::make_shared<PropertyComparison>("n", "name", PropertyComparison::Op::EQ, TypedValue("Z"));
  auto expansion = Expand(x, EdgeDirection::BOTH, {}, named_z);
  EXPECT_EQ(FarNames(&expansion), std::vector<std::string>{"Z"});

  auto recent = std::make_shared<PropertyComparison>("r", "since", PropertyComparison::Op::GE, TypedValue(2000));
  auto recent_expansion = Expand(x, EdgeDirection::OUT, {}, recent);
  auto edge = recent_expansion.Next();
  ASSERT_TRUE(edge);
  EXPECT_EQ(*edge, *likes);
  EXPECT_FALSE(recent_expansion.Next());
}

TEST_F(FilteredExpansionTest, FarNode) {
  auto expansion = Expand(x, EdgeDirection::BOTH, {}, std::make_shared<TruePredicate>());
  EXPECT_EQ(expansion.FarNode(*knows), y);
  EXPECT_EQ(expansion.FarNode(*known_by), w);

  auto loop = AddEdge(&x, &x, "SELF");
  EXPECT_EQ(expansion.FarNode(loop), x);
}

TEST_F(FilteredExpansionTest, SelfLoopYieldedOnce) {
  AddEdge(&z, &z, "SELF");
  auto expansion = Expand(z, EdgeDirection::BOTH, {"SELF"}, std::make_shared<TruePredicate>());
  EXPECT_EQ(FarNames(&expansion), std::vector<std::string>{"Z"});
}

TEST_F(FilteredExpansionTest, Empty) {
  auto expansion = FilteredExpansion::Empty(x, context);
  EXPECT_FALSE(expansion.Next());
  EXPECT_TRUE(expansion.begin() == expansion.end());
  EXPECT_EQ(expansion.node(), x);
}

TEST_F(FilteredExpansionTest, StoreErrorsSurfaceOnPull) {
  auto expansion = Expand(x, EdgeDirection::OUT, {}, std::make_shared<TruePredicate>());
  graph.Close();
  EXPECT_THROW(expansion.Next(), hopgraph::query::StorageErrorException);
}
