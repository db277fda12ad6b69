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
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "query/context.hpp"
#include "query/typed_value.hpp"

namespace hopgraph::query {

/// Named values a predicate is evaluated against.
class BindingContext {
 public:
  virtual ~BindingContext() = default;

  /// @return std::nullopt when nothing is bound under `name`.
  virtual std::optional<TypedValue> Lookup(std::string_view name) const = 0;

  virtual const ExecutionContext &execution_context() const = 0;
};

class Predicate {
 public:
  virtual ~Predicate() = default;

  virtual bool IsMatch(const BindingContext &context) const = 0;

  /// Structural equality, predicates of different kinds are never equal.
  virtual bool Equals(const Predicate &other) const = 0;

  virtual std::string ToString() const = 0;
};

using PredicatePtr = std::shared_ptr<const Predicate>;

inline bool operator==(const Predicate &a, const Predicate &b) { return a.Equals(b); }
inline bool operator!=(const Predicate &a, const Predicate &b) { return !a.Equals(b); }

std::ostream &operator<<(std::ostream &os, const Predicate &predicate);

class TruePredicate final : public Predicate {
 public:
  bool IsMatch(const BindingContext & /*context*/) const override { return true; }
  bool Equals(const Predicate &other) const override { return dynamic_cast<const TruePredicate *>(&other) != nullptr; }
  std::string ToString() const override { return "true"; }
};

class AndPredicate final : public Predicate {
 public:
  AndPredicate(PredicatePtr left, PredicatePtr right) : left_(std::move(left)), right_(std::move(right)) {}

  /// The right side is evaluated only when the left one matches.
  bool IsMatch(const BindingContext &context) const override;
  bool Equals(const Predicate &other) const override;
  std::string ToString() const override;

  const PredicatePtr &left() const { return left_; }
  const PredicatePtr &right() const { return right_; }

 private:
  PredicatePtr left_;
  PredicatePtr right_;
};

class OrPredicate final : public Predicate {
 public:
  OrPredicate(PredicatePtr left, PredicatePtr right) : left_(std::move(left)), right_(std::move(right)) {}

  bool IsMatch(const BindingContext &context) const override;
  bool Equals(const Predicate &other) const override;
  std::string ToString() const override;

 private:
  PredicatePtr left_;
  PredicatePtr right_;
};

class NotPredicate final : public Predicate {
 public:
  explicit NotPredicate(PredicatePtr inner) : inner_(std::move(inner)) {}

  bool IsMatch(const BindingContext &context) const override { return !inner_->IsMatch(context); }
  bool Equals(const Predicate &other) const override;
  std::string ToString() const override;

 private:
  PredicatePtr inner_;
};

/// Matches when the map-like value bound under `binding` has `key`.
class HasPropertyPredicate final : public Predicate {
 public:
  HasPropertyPredicate(std::string binding, std::string key) : binding_(std::move(binding)), key_(std::move(key)) {}

  bool IsMatch(const BindingContext &context) const override;
  bool Equals(const Predicate &other) const override;
  std::string ToString() const override;

 private:
  std::string binding_;
  std::string key_;
};

/// Reference to a query parameter, resolved at evaluation time.
struct ParameterLookup {
  std::string name;

  bool operator==(const ParameterLookup &other) const { return name == other.name; }
};

/// Compares `binding.key` with a literal or a parameter. A missing property
/// reads as null and a null comparison result does not match.
class PropertyComparison final : public Predicate {
 public:
  enum class Op : uint8_t { EQ, NEQ, LT, LE, GT, GE };

  using Operand = std::variant<TypedValue, ParameterLookup>;

  PropertyComparison(std::string binding, std::string key, Op op, Operand operand)
      : binding_(std::move(binding)), key_(std::move(key)), op_(op), operand_(std::move(operand)) {}

  bool IsMatch(const BindingContext &context) const override;
  bool Equals(const Predicate &other) const override;
  std::string ToString() const override;

 private:
  std::string binding_;
  std::string key_;
  Op op_;
  Operand operand_;
};

/// Reads `key` of the map-like value bound under `binding`. Null when either
/// the bound value is null or the key is missing.
/// @throw UnboundVariableError when `binding` is not bound.
/// @throw QueryRuntimeException when the bound value is not map-like.
TypedValue LookupProperty(const BindingContext &context, std::string_view binding, std::string_view key);

}  // namespace hopgraph::query
