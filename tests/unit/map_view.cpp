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


#include <string>
#include <utility>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "hopgraph_test_common.hpp"
#include "query/exceptions.hpp"
#include "query/map_view.hpp"
#include "query/typed_value.hpp"
#include "storage/property_value.hpp"
#include "utils/exceptions.hpp"

using hopgraph::query::AsMapView;
using hopgraph::query::ClassifyMapLike;
using hopgraph::query::IsMapLike;
using hopgraph::query::MapView;
using hopgraph::query::StorageErrorException;
using hopgraph::query::TypedValue;
using hopgraph::storage::PropertyValue;
using hopgraph::utils::ShouldNotHappenException;

namespace {

// Views keep pointers into the classified value, so temporaries are rejected.
template <class TValue>
concept BindableAsMapView = requires(TValue &&value) { AsMapView(std::forward<TValue>(value)); };

static_assert(BindableAsMapView<const TypedValue &>);
static_assert(BindableAsMapView<TypedValue &>);
static_assert(!BindableAsMapView<TypedValue>);
static_assert(!BindableAsMapView<PropertyValue>);

std::vector<std::pair<std::string, int64_t>> IntItems(const MapView &view) {
  std::vector<std::pair<std::string, int64_t>> items;
  for (const auto &[key, value] : view.Items()) items.emplace_back(key, value.ValueInt());
  return items;
}

}  // namespace

class MapViewTest : public hopgraph::test_common::GraphTest {};

TEST_F(MapViewTest, Classification) {
  auto node = AddNode("Alice");
  auto other = AddNode("Bob");
  auto edge = AddEdge(&node, &other, "KNOWS");

  EXPECT_TRUE(IsMapLike(TypedValue(TypedValue::TMap{})));
  EXPECT_TRUE(IsMapLike(TypedValue(node)));
  EXPECT_TRUE(IsMapLike(TypedValue(edge)));
  EXPECT_TRUE(IsMapLike(PropertyValue(PropertyValue::TMap{})));

  EXPECT_FALSE(IsMapLike(TypedValue()));
  EXPECT_FALSE(IsMapLike(TypedValue(1)));
  EXPECT_FALSE(IsMapLike(TypedValue("map")));
  EXPECT_FALSE(IsMapLike(TypedValue(TypedValue::TVector{})));
  EXPECT_FALSE(IsMapLike(PropertyValue(1)));

  TypedValue number(1.5);
  EXPECT_FALSE(AsMapView(number));

  TypedValue node_value(node);
  auto classified = ClassifyMapLike(node_value);
  ASSERT_TRUE(classified);
  EXPECT_EQ(std::get<hopgraph::query::VertexAccessor>(*classified), node);
}

TEST_F(MapViewTest, LiteralMap) {
  TypedValue literal(TypedValue::TMap{{"a", TypedValue(1)}, {"b", TypedValue(2)}});
  auto binder = AsMapView(literal);
  ASSERT_TRUE(binder);
  auto view = (*binder)(context);

  auto a = view->Get("a");
  ASSERT_TRUE(a);
  EXPECT_EQ(a->ValueInt(), 1);
  EXPECT_TRUE(view->Contains("b"));
  EXPECT_FALSE(view->Contains("c"));
  EXPECT_FALSE(view->Get("c"));
  EXPECT_THAT(IntItems(*view), testing::ElementsAre(std::pair<std::string, int64_t>{"a", 1},
                                                    std::pair<std::string, int64_t>{"b", 2}));
}

TEST_F(MapViewTest, LiteralMapKeepsInsertionOrder) {
  TypedValue::TMap map;
  map.emplace("b", TypedValue(2));
  map.emplace("a", TypedValue(1));
  map.emplace("b", TypedValue(3));
  TypedValue literal(std::move(map));

  auto view = (*AsMapView(literal))(context);
  EXPECT_THAT(IntItems(*view), testing::ElementsAre(std::pair<std::string, int64_t>{"b", 2},
                                                    std::pair<std::string, int64_t>{"a", 1}));
  EXPECT_EQ(view->Get("a")->ValueInt(), 1);
  EXPECT_EQ(view->Get("b")->ValueInt(), 2);
}

TEST_F(MapViewTest, LiteralMapIgnoresStore) {
  TypedValue literal(TypedValue::TMap{{"a", TypedValue(1)}});
  hopgraph::query::ExecutionContext no_store;
  auto view = (*AsMapView(literal))(no_store);
  EXPECT_TRUE(view->Contains("a"));
}

TEST_F(MapViewTest, PropertyMap) {
  PropertyValue map(PropertyValue::TMap{{"x", PropertyValue(10)}, {"y", PropertyValue("why")}});
  auto view = (*AsMapView(map))(context);

  auto x = view->Get("x");
  ASSERT_TRUE(x);
  EXPECT_EQ(x->ValueInt(), 10);
  EXPECT_EQ(view->Get("y")->ValueString(), "why");
  EXPECT_FALSE(view->Contains("z"));
  EXPECT_EQ(view->Items().size(), 2U);
}

TEST_F(MapViewTest, NodeView) {
  TypedValue node(AddNode("Alice"));
  auto view = (*AsMapView(node))(context);

  auto name = view->Get("name");
  ASSERT_TRUE(name);
  EXPECT_EQ(name->ValueString(), "Alice");
  EXPECT_TRUE(view->Contains("name"));
  EXPECT_FALSE(view->Contains("age"));
  EXPECT_FALSE(view->Get("age"));

  EXPECT_THROW(view->Set("name", TypedValue("Bob")), ShouldNotHappenException);
  EXPECT_THROW(view->Remove("name"), ShouldNotHappenException);
  EXPECT_EQ(view->Get("name")->ValueString(), "Alice");
}

TEST_F(MapViewTest, NodeViewReadsThroughToStore) {
  auto node = AddNode("Alice");
  TypedValue node_value(node);
  auto view = (*AsMapView(node_value))(context);
  EXPECT_FALSE(view->Contains("age"));

  SetProperty(&node, "age", PropertyValue(30));
  SetProperty(&node, "name", PropertyValue("Alicia"));
  EXPECT_EQ(view->Get("age")->ValueInt(), 30);
  EXPECT_EQ(view->Get("name")->ValueString(), "Alicia");

  auto items = view->Items();
  ASSERT_EQ(items.size(), 2U);
  // store order is the order in which the property names were registered
  EXPECT_EQ(items[0].first, "name");
  EXPECT_EQ(items[1].first, "age");
}

TEST_F(MapViewTest, RelationshipView) {
  auto alice = AddNode("Alice");
  auto bob = AddNode("Bob");
  auto edge = AddEdge(&alice, &bob, "KNOWS");
  SetProperty(&edge, "since", PropertyValue(2020));

  TypedValue edge_value(edge);
  auto view = (*AsMapView(edge_value))(context);
  EXPECT_EQ(view->Get("since")->ValueInt(), 2020);
  EXPECT_FALSE(view->Contains("name"));
  EXPECT_EQ(IntItems(*view), (std::vector<std::pair<std::string, int64_t>>{{"since", 2020}}));
  EXPECT_THROW(view->Merge(*view), ShouldNotHappenException);
}

TEST_F(MapViewTest, MutationFailsOnEveryView) {
  TypedValue literal(TypedValue::TMap{{"a", TypedValue(1)}});
  auto view = (*AsMapView(literal))(context);
  EXPECT_THROW(view->Set("a", TypedValue(2)), ShouldNotHappenException);
  EXPECT_THROW(view->Remove("a"), ShouldNotHappenException);
  EXPECT_EQ(view->Get("a")->ValueInt(), 1);
}

TEST_F(MapViewTest, StoreErrorsPropagate) {
  TypedValue node(AddNode("Alice"));
  auto view = (*AsMapView(node))(context);
  graph.Close();

  try {
    view->Get("name");
    FAIL() << "Expected a storage error";
  } catch (const StorageErrorException &e) {
    EXPECT_EQ(e.error(), hopgraph::storage::Error::STORAGE_CLOSED);
  }
  EXPECT_THROW(view->Contains("unknown"), StorageErrorException);
}
