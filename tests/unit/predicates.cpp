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
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "hopgraph_test_common.hpp"
#include "query/exceptions.hpp"
#include "query/predicates.hpp"
#include "query/typed_value.hpp"

using hopgraph::query::AndPredicate;
using hopgraph::query::BindingContext;
using hopgraph::query::ExecutionContext;
using hopgraph::query::HasPropertyPredicate;
using hopgraph::query::NotPredicate;
using hopgraph::query::OrPredicate;
using hopgraph::query::ParameterLookup;
using hopgraph::query::PredicatePtr;
using hopgraph::query::PropertyComparison;
using hopgraph::query::TruePredicate;
using hopgraph::query::TypedValue;
using hopgraph::test_common::CountingPredicate;
using Op = PropertyComparison::Op;

namespace {

class MapBindings final : public BindingContext {
 public:
  explicit MapBindings(const ExecutionContext &context) : context_(&context) {}

  void Bind(std::string name, TypedValue value) { bindings_.insert_or_assign(std::move(name), std::move(value)); }

  std::optional<TypedValue> Lookup(std::string_view name) const override {
    auto found = bindings_.find(name);
    if (found == bindings_.end()) return std::nullopt;
    return found->second;
  }

  const ExecutionContext &execution_context() const override { return *context_; }

 private:
  std::map<std::string, TypedValue, std::less<>> bindings_;
  const ExecutionContext *context_;
};

PredicatePtr Compare(std::string binding, std::string key, Op op, PropertyComparison::Operand operand) {
  return std::make_shared<PropertyComparison>(std::move(binding), std::move(key), op, std::move(operand));
}

}  // namespace

class PredicatesTest : public hopgraph::test_common::GraphTest {
 protected:
  PredicatesTest() : bindings(context) {
    auto alice = AddNode("Alice");
    SetProperty(&alice, "age", hopgraph::storage::PropertyValue(30));
    bindings.Bind("n", TypedValue(alice));
    bindings.Bind("m", TypedValue(TypedValue::TMap{{"age", TypedValue(25)}}));
    bindings.Bind("nothing", TypedValue());
    bindings.Bind("number", TypedValue(7));
  }

  MapBindings bindings;
};

TEST_F(PredicatesTest, Combinators) {
  auto yes = std::make_shared<TruePredicate>();
  auto no = std::make_shared<NotPredicate>(yes);

  EXPECT_TRUE(yes->IsMatch(bindings));
  EXPECT_FALSE(no->IsMatch(bindings));
  EXPECT_FALSE(AndPredicate(yes, no).IsMatch(bindings));
  EXPECT_TRUE(AndPredicate(yes, yes).IsMatch(bindings));
  EXPECT_TRUE(OrPredicate(no, yes).IsMatch(bindings));
  EXPECT_FALSE(OrPredicate(no, no).IsMatch(bindings));
}

TEST_F(PredicatesTest, AndShortCircuits) {
  auto counting = std::make_shared<CountingPredicate>();
  auto no = std::make_shared<NotPredicate>(std::make_shared<TruePredicate>());
  EXPECT_FALSE(AndPredicate(no, counting).IsMatch(bindings));
  EXPECT_EQ(counting->evaluations(), 0);
  EXPECT_TRUE(AndPredicate(counting, counting).IsMatch(bindings));
  EXPECT_EQ(counting->evaluations(), 2);
}

TEST_F(PredicatesTest, PropertyComparisonOnNodeAndLiteralMap) {
  EXPECT_TRUE(Compare("n", "age", Op::EQ, TypedValue(30))->IsMatch(bindings));
  EXPECT_TRUE(Compare("n", "age", Op::GT, TypedValue(29.5))->IsMatch(bindings));
  EXPECT_FALSE(Compare("n", "age", Op::LT, TypedValue(30))->IsMatch(bindings));
  EXPECT_TRUE(Compare("n", "name", Op::NEQ, TypedValue("Bob"))->IsMatch(bindings));

  EXPECT_TRUE(Compare("m", "age", Op::LE, TypedValue(25))->IsMatch(bindings));
  EXPECT_FALSE(Compare("m", "age", Op::GE, TypedValue(26))->IsMatch(bindings));
}

TEST_F(PredicatesTest, NullNeverMatches) {
  // missing property
  EXPECT_FALSE(Compare("n", "height", Op::EQ, TypedValue(1))->IsMatch(bindings));
  EXPECT_FALSE(Compare("n", "height", Op::NEQ, TypedValue(1))->IsMatch(bindings));
  // null binding
  EXPECT_FALSE(Compare("nothing", "age", Op::EQ, TypedValue(1))->IsMatch(bindings));
  EXPECT_FALSE(HasPropertyPredicate("nothing", "age").IsMatch(bindings));
}

TEST_F(PredicatesTest, Parameters) {
  context.evaluation_context.parameters.Add("min_age", TypedValue(18));
  EXPECT_TRUE(Compare("n", "age", Op::GE, ParameterLookup{"min_age"})->IsMatch(bindings));
  EXPECT_THROW(Compare("n", "age", Op::GE, ParameterLookup{"max_age"})->IsMatch(bindings),
               hopgraph::query::UnprovidedParameterError);
}

TEST_F(PredicatesTest, HasProperty) {
  EXPECT_TRUE(HasPropertyPredicate("n", "name").IsMatch(bindings));
  EXPECT_FALSE(HasPropertyPredicate("n", "height").IsMatch(bindings));
  EXPECT_TRUE(HasPropertyPredicate("m", "age").IsMatch(bindings));
}

TEST_F(PredicatesTest, Errors) {
  EXPECT_THROW(HasPropertyPredicate("unbound", "name").IsMatch(bindings), hopgraph::query::UnboundVariableError);
  EXPECT_THROW(Compare("number", "age", Op::EQ, TypedValue(1))->IsMatch(bindings),
               hopgraph::query::QueryRuntimeException);
  EXPECT_THROW(Compare("n", "name", Op::LT, TypedValue(1))->IsMatch(bindings), hopgraph::query::TypedValueException);
}

TEST_F(PredicatesTest, StructuralEquality) {
  auto age_30 = Compare("n", "age", Op::EQ, TypedValue(30));
  EXPECT_EQ(*age_30, *Compare("n", "age", Op::EQ, TypedValue(30)));
  EXPECT_NE(*age_30, *Compare("n", "age", Op::EQ, TypedValue(31)));
  EXPECT_NE(*age_30, *Compare("n", "age", Op::EQ, TypedValue(30.0)));
  EXPECT_NE(*age_30, *Compare("r", "age", Op::EQ, TypedValue(30)));
  EXPECT_NE(*age_30, *Compare("n", "age", Op::NEQ, TypedValue(30)));
  EXPECT_NE(*age_30, *Compare("n", "age", Op::EQ, ParameterLookup{"age"}));

  auto yes = std::make_shared<TruePredicate>();
  EXPECT_EQ(AndPredicate(yes, age_30), AndPredicate(std::make_shared<TruePredicate>(), age_30));
  EXPECT_NE(AndPredicate(yes, age_30), OrPredicate(yes, age_30));
  EXPECT_NE(AndPredicate(yes, age_30), AndPredicate(age_30, yes));
  EXPECT_EQ(HasPropertyPredicate("n", "a"), HasPropertyPredicate("n", "a"));
  EXPECT_NE(HasPropertyPredicate("n", "a"), HasPropertyPredicate("n", "b"));
}

TEST_F(PredicatesTest, Rendering) {
  EXPECT_EQ(Compare("n", "name", Op::EQ, TypedValue("Alice"))->ToString(), "n.name = 'Alice'");
  EXPECT_EQ(Compare("r", "weight", Op::GE, ParameterLookup{"w"})->ToString(), "r.weight >= $w");
  auto yes = std::make_shared<TruePredicate>();
  EXPECT_EQ(AndPredicate(yes, std::make_shared<NotPredicate>(yes)).ToString(), "(true AND NOT true)");
  EXPECT_EQ(OrPredicate(yes, std::make_shared<HasPropertyPredicate>("n", "age")).ToString(),
            "(true OR exists(n.age))");
}
