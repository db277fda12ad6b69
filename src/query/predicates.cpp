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


#include "query/predicates.hpp"

#include <ostream>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include "query/exceptions.hpp"
#include "query/map_view.hpp"
#include "utils/logging.hpp"

namespace hopgraph::query {

namespace {

std::string_view OpToString(PropertyComparison::Op op) {
  switch (op) {
    case PropertyComparison::Op::EQ:
      return "=";
    case PropertyComparison::Op::NEQ:
      return "<>";
    case PropertyComparison::Op::LT:
      return "<";
    case PropertyComparison::Op::LE:
      return "<=";
    case PropertyComparison::Op::GT:
      return ">";
    case PropertyComparison::Op::GE:
      return ">=";
  }
  LOG_FATAL("Unknown comparison operator");
}

TypedValue Compare(PropertyComparison::Op op, const TypedValue &lhs, const TypedValue &rhs) {
  switch (op) {
    case PropertyComparison::Op::EQ:
      return lhs == rhs;
    case PropertyComparison::Op::NEQ:
      return lhs != rhs;
    case PropertyComparison::Op::LT:
      return lhs < rhs;
    case PropertyComparison::Op::LE:
      return lhs <= rhs;
    case PropertyComparison::Op::GT:
      return lhs > rhs;
    case PropertyComparison::Op::GE:
      return lhs >= rhs;
  }
  LOG_FATAL("Unknown comparison operator");
}

std::string RenderOperand(const PropertyComparison::Operand &operand) {
  if (const auto *parameter = std::get_if<ParameterLookup>(&operand)) return "$" + parameter->name;
  const auto &literal = std::get<TypedValue>(operand);
  if (literal.IsString()) return fmt::format("'{}'", literal.ValueString());
  return fmt::format("{}", fmt::streamed(literal));
}

bool OperandsEqual(const PropertyComparison::Operand &a, const PropertyComparison::Operand &b) {
  if (a.index() != b.index()) return false;
  if (const auto *parameter = std::get_if<ParameterLookup>(&a)) return *parameter == std::get<ParameterLookup>(b);
  const auto &literal_a = std::get<TypedValue>(a);
  const auto &literal_b = std::get<TypedValue>(b);
  return literal_a.type() == literal_b.type() && TypedValue::BoolEqual{}(literal_a, literal_b);
}

}  // namespace

std::ostream &operator<<(std::ostream &os, const Predicate &predicate) { return os << predicate.ToString(); }

bool AndPredicate::IsMatch(const BindingContext &context) const {
  return left_->IsMatch(context) && right_->IsMatch(context);
}

bool AndPredicate::Equals(const Predicate &other) const {
  const auto *other_and = dynamic_cast<const AndPredicate *>(&other);
  return other_and && *left_ == *other_and->left_ && *right_ == *other_and->right_;
}

std::string AndPredicate::ToString() const { return fmt::format("({} AND {})", left_->ToString(), right_->ToString()); }

bool OrPredicate::IsMatch(const BindingContext &context) const {
  return left_->IsMatch(context) || right_->IsMatch(context);
}

bool OrPredicate::Equals(const Predicate &other) const {
  const auto *other_or = dynamic_cast<const OrPredicate *>(&other);
  return other_or && *left_ == *other_or->left_ && *right_ == *other_or->right_;
}

std::string OrPredicate::ToString() const { return fmt::format("({} OR {})", left_->ToString(), right_->ToString()); }

bool NotPredicate::Equals(const Predicate &other) const {
  const auto *other_not = dynamic_cast<const NotPredicate *>(&other);
  return other_not && *inner_ == *other_not->inner_;
}

std::string NotPredicate::ToString() const { return fmt::format("NOT {}", inner_->ToString()); }

TypedValue LookupProperty(const BindingContext &context, std::string_view binding, std::string_view key) {
  auto bound = context.Lookup(binding);
  if (!bound) throw UnboundVariableError(std::string(binding));
  if (bound->IsNull()) return TypedValue();

  auto binder = AsMapView(*bound);
  if (!binder) {
    throw QueryRuntimeException("Only nodes, relationships and maps have properties to be looked up, {} is a {}.",
                                binding, fmt::streamed(bound->type()));
  }
  auto view = (*binder)(context.execution_context());
  auto value = view->Get(key);
  if (!value) return TypedValue();
  return std::move(*value);
}

bool HasPropertyPredicate::IsMatch(const BindingContext &context) const {
  auto bound = context.Lookup(binding_);
  if (!bound) throw UnboundVariableError(binding_);
  if (bound->IsNull()) return false;

  auto binder = AsMapView(*bound);
  if (!binder) {
    throw QueryRuntimeException("Only nodes, relationships and maps have properties to be looked up, {} is a {}.",
                                binding_, fmt::streamed(bound->type()));
  }
  return (*binder)(context.execution_context())->Contains(key_);
}

bool HasPropertyPredicate::Equals(const Predicate &other) const {
  const auto *other_has = dynamic_cast<const HasPropertyPredicate *>(&other);
  return other_has && binding_ == other_has->binding_ && key_ == other_has->key_;
}

std::string HasPropertyPredicate::ToString() const { return fmt::format("exists({}.{})", binding_, key_); }

bool PropertyComparison::IsMatch(const BindingContext &context) const {
  auto property = LookupProperty(context, binding_, key_);
  const auto *parameter = std::get_if<ParameterLookup>(&operand_);
  const auto &operand =
      parameter ? context.execution_context().evaluation_context.parameters.AtName(parameter->name)
                : std::get<TypedValue>(operand_);
  auto result = Compare(op_, property, operand);
  if (result.IsNull()) return false;
  return result.ValueBool();
}

bool PropertyComparison::Equals(const Predicate &other) const {
  const auto *other_cmp = dynamic_cast<const PropertyComparison *>(&other);
  return other_cmp && binding_ == other_cmp->binding_ && key_ == other_cmp->key_ && op_ == other_cmp->op_ &&
         OperandsEqual(operand_, other_cmp->operand_);
}

std::string PropertyComparison::ToString() const {
  return fmt::format("{}.{} {} {}", binding_, key_, OpToString(op_), RenderOperand(operand_));
}

}  // namespace hopgraph::query
