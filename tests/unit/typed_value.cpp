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


#include <map>
#include <sstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "hopgraph_test_common.hpp"
#include "query/exceptions.hpp"
#include "query/typed_value.hpp"
#include "storage/property_value.hpp"

using hopgraph::query::TypedValue;
using hopgraph::query::TypedValueException;
using hopgraph::storage::PropertyValue;

namespace {

void EXPECT_PROP_FALSE(const TypedValue &a) {
  ASSERT_EQ(a.type(), TypedValue::Type::Bool);
  ASSERT_FALSE(a.ValueBool());
}

void EXPECT_PROP_TRUE(const TypedValue &a) {
  ASSERT_EQ(a.type(), TypedValue::Type::Bool);
  ASSERT_TRUE(a.ValueBool());
}

void EXPECT_PROP_ISNULL(const TypedValue &a) { ASSERT_TRUE(a.IsNull()); }

std::string ToString(const TypedValue &value) {
  std::ostringstream stream;
  stream << value;
  return stream.str();
}

}  // namespace

TEST(TypedValue, CreationTypes) {
  EXPECT_TRUE(TypedValue().type() == TypedValue::Type::Null);

  EXPECT_TRUE(TypedValue(true).type() == TypedValue::Type::Bool);
  EXPECT_TRUE(TypedValue(false).type() == TypedValue::Type::Bool);

  EXPECT_TRUE(TypedValue(std::string("form string class")).type() == TypedValue::Type::String);
  EXPECT_TRUE(TypedValue("form c-string").type() == TypedValue::Type::String);

  EXPECT_TRUE(TypedValue(0).type() == TypedValue::Type::Int);
  EXPECT_TRUE(TypedValue(42).type() == TypedValue::Type::Int);

  EXPECT_TRUE(TypedValue(0.0).type() == TypedValue::Type::Double);
  EXPECT_TRUE(TypedValue(42.5).type() == TypedValue::Type::Double);

  EXPECT_TRUE(TypedValue(TypedValue::TVector{TypedValue(1)}).type() == TypedValue::Type::List);
  EXPECT_TRUE(TypedValue(TypedValue::TMap{{"a", TypedValue(1)}}).type() == TypedValue::Type::Map);
}

TEST(TypedValue, CreationValues) {
  EXPECT_EQ(TypedValue(true).ValueBool(), true);
  EXPECT_EQ(TypedValue(false).ValueBool(), false);

  EXPECT_EQ(TypedValue(std::string("bla")).ValueString(), "bla");
  EXPECT_EQ(TypedValue("bla2").ValueString(), "bla2");

  EXPECT_EQ(TypedValue(55).ValueInt(), 55);

  EXPECT_FLOAT_EQ(TypedValue(66.6).ValueDouble(), 66.6);
}

TEST(TypedValue, WrongTypeAccessThrows) {
  EXPECT_THROW(TypedValue(1).ValueString(), TypedValueException);
  EXPECT_THROW(TypedValue("one").ValueInt(), TypedValueException);
  EXPECT_THROW(TypedValue().ValueMap(), TypedValueException);
}

TEST(TypedValue, FromPropertyValue) {
  PropertyValue::TMap map{{"name", PropertyValue("Alice")},
                          {"tags", PropertyValue(PropertyValue::TList{PropertyValue(1), PropertyValue(2.5)})}};
  TypedValue value{PropertyValue(map)};
  ASSERT_TRUE(value.IsMap());
  EXPECT_EQ(value.ValueMap().at("name").ValueString(), "Alice");
  const auto &tags = value.ValueMap().at("tags").ValueList();
  ASSERT_EQ(tags.size(), 2U);
  EXPECT_EQ(tags[0].ValueInt(), 1);
  EXPECT_FLOAT_EQ(tags[1].ValueDouble(), 2.5);

  EXPECT_EQ(static_cast<PropertyValue>(value), PropertyValue(map));
}

TEST(TypedValue, Equals) {
  EXPECT_PROP_TRUE(TypedValue(true) == TypedValue(true));
  EXPECT_PROP_FALSE(TypedValue(true) == TypedValue(false));

  EXPECT_PROP_TRUE(TypedValue(1) == TypedValue(1));
  EXPECT_PROP_FALSE(TypedValue(1) == TypedValue(2));
  EXPECT_PROP_TRUE(TypedValue(2) == TypedValue(2.0));

  EXPECT_PROP_TRUE(TypedValue("x") == TypedValue("x"));
  EXPECT_PROP_FALSE(TypedValue("x") == TypedValue(1));

  EXPECT_PROP_ISNULL(TypedValue() == TypedValue(1));
  EXPECT_PROP_ISNULL(TypedValue() == TypedValue());

  TypedValue::TVector list_with_null{TypedValue(1), TypedValue()};
  EXPECT_PROP_TRUE(TypedValue(list_with_null) == TypedValue(list_with_null));
  EXPECT_PROP_FALSE(TypedValue(TypedValue::TVector{TypedValue(1)}) == TypedValue(TypedValue::TVector{}));

  TypedValue::TMap map_a{{"a", TypedValue(1)}, {"b", TypedValue("x")}};
  TypedValue::TMap map_b{{"a", TypedValue(1)}, {"b", TypedValue("y")}};
  EXPECT_PROP_TRUE(TypedValue(map_a) == TypedValue(map_a));
  EXPECT_PROP_FALSE(TypedValue(map_a) == TypedValue(map_b));
}

TEST(TypedValue, Less) {
  EXPECT_PROP_TRUE(TypedValue(1) < TypedValue(2));
  EXPECT_PROP_FALSE(TypedValue(2) < TypedValue(1.5));
  EXPECT_PROP_TRUE(TypedValue("a") < TypedValue("b"));
  EXPECT_PROP_ISNULL(TypedValue() < TypedValue(1));

  EXPECT_THROW(TypedValue("a") < TypedValue(1), TypedValueException);
  EXPECT_THROW(TypedValue(true) < TypedValue(false), TypedValueException);
}

TEST(TypedValue, DerivedComparisons) {
  EXPECT_PROP_TRUE(TypedValue(2) <= TypedValue(2));
  EXPECT_PROP_FALSE(TypedValue(3) <= TypedValue(2));
  EXPECT_PROP_TRUE(TypedValue(3) > TypedValue(2));
  EXPECT_PROP_TRUE(TypedValue(2) >= TypedValue(2.0));
  EXPECT_PROP_TRUE(TypedValue(1) != TypedValue(2));
  EXPECT_PROP_ISNULL(TypedValue(1) >= TypedValue());
}

TEST(TypedValue, BoolEqual) {
  TypedValue::BoolEqual bool_equal;
  EXPECT_TRUE(bool_equal(TypedValue(), TypedValue()));
  EXPECT_FALSE(bool_equal(TypedValue(), TypedValue(1)));
  EXPECT_TRUE(bool_equal(TypedValue(1), TypedValue(1.0)));
  EXPECT_FALSE(bool_equal(TypedValue("a"), TypedValue("b")));
}

TEST(TypedValue, Output) {
  EXPECT_EQ(ToString(TypedValue()), "null");
  EXPECT_EQ(ToString(TypedValue(true)), "true");
  EXPECT_EQ(ToString(TypedValue(TypedValue::TVector{TypedValue(1), TypedValue("x")})), "[1, x]");
  EXPECT_EQ(ToString(TypedValue(TypedValue::TMap{{"a", TypedValue(1)}, {"b", TypedValue(2)}})), "{a: 1, b: 2}");
  EXPECT_EQ(ToString(TypedValue(TypedValue::TMap{{"b", TypedValue(2)}, {"a", TypedValue(1)}})), "{b: 2, a: 1}");
}

class TypedValueGraphTest : public hopgraph::test_common::GraphTest {};

TEST_F(TypedValueGraphTest, EntityValues) {
  auto vertex = AddNode("Alice");
  auto edge = AddEdge(&vertex, &vertex, "SELF");

  TypedValue vertex_value(vertex);
  TypedValue edge_value(edge);
  ASSERT_TRUE(vertex_value.IsVertex());
  ASSERT_TRUE(edge_value.IsEdge());
  EXPECT_EQ(vertex_value.ValueVertex(), vertex);
  EXPECT_EQ(edge_value.ValueEdge(), edge);
  EXPECT_PROP_TRUE(vertex_value == TypedValue(vertex));
  EXPECT_PROP_FALSE(vertex_value == edge_value);
  EXPECT_FALSE(vertex_value.IsPropertyValue());

  TypedValue copy = edge_value;
  EXPECT_EQ(copy.ValueEdge(), edge);
  TypedValue moved = std::move(copy);
  EXPECT_EQ(moved.ValueEdge(), edge);
}
