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
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "query/edge_accessor.hpp"
#include "query/vertex_accessor.hpp"
#include "storage/property_value.hpp"
#include "utils/insertion_ordered_map.hpp"

namespace hopgraph::query {

/**
 * Stores a query runtime value and its type.
 *
 * Values can be of a number of predefined types that are enumerated in
 * TypedValue::Type. Each such type corresponds to exactly one C++ type.
 */
class TypedValue {
 public:
  /** Custom TypedValue equality function that returns a bool
   * (as opposed to returning TypedValue as the default equality does).
   * This implementation treats two nulls as being equal and null
   * not being equal to everything else.
   */
  struct BoolEqual {
    bool operator()(const TypedValue &left, const TypedValue &right) const;
  };

  /** A value type. Each type corresponds to exactly one C++ type */
  enum class Type : unsigned { Null, Bool, Int, Double, String, List, Map, Vertex, Edge };

  using TString = std::string;
  using TVector = std::vector<TypedValue>;
  using TMap = utils::InsertionOrderedMap<TString, TypedValue>;

  /** Construct a Null value. */
  TypedValue() : type_(Type::Null) {}

  TypedValue(const TypedValue &other);

  /** Construct with the value of other. After the move, other will be set to Null. */
  TypedValue(TypedValue &&other) noexcept;

  explicit TypedValue(bool value) : type_(Type::Bool) { bool_v = value; }

  explicit TypedValue(int value) : type_(Type::Int) { int_v = value; }

  explicit TypedValue(int64_t value) : type_(Type::Int) { int_v = value; }

  explicit TypedValue(double value) : type_(Type::Double) { double_v = value; }

  // copy constructors for non-primitive types
  explicit TypedValue(const std::string &value) : type_(Type::String) { new (&string_v) TString(value); }

  explicit TypedValue(const char *value) : type_(Type::String) { new (&string_v) TString(value); }

  explicit TypedValue(const std::string_view value) : type_(Type::String) { new (&string_v) TString(value); }

  explicit TypedValue(const TVector &value) : type_(Type::List) { new (&list_v) TVector(value); }

  explicit TypedValue(const TMap &value) : type_(Type::Map) { new (&map_v) TMap(value); }

  explicit TypedValue(const VertexAccessor &vertex) : type_(Type::Vertex) { new (&vertex_v) VertexAccessor(vertex); }

  explicit TypedValue(const EdgeAccessor &edge) : type_(Type::Edge) { new (&edge_v) EdgeAccessor(edge); }

  explicit TypedValue(const storage::PropertyValue &value);

  // move constructors for non-primitive types
  explicit TypedValue(TString &&other) noexcept : type_(Type::String) { new (&string_v) TString(std::move(other)); }

  explicit TypedValue(TVector &&other) noexcept : type_(Type::List) { new (&list_v) TVector(std::move(other)); }

  explicit TypedValue(TMap &&other) noexcept : type_(Type::Map) { new (&map_v) TMap(std::move(other)); }

  // conversion function to storage::PropertyValue
  explicit operator storage::PropertyValue() const;

  TypedValue &operator=(const TypedValue &other);

  /** Move assign other. After the move, other will be set to Null. */
  TypedValue &operator=(TypedValue &&other) noexcept;

  ~TypedValue();

  Type type() const { return type_; }

#define DECLARE_VALUE_AND_TYPE_GETTERS(type_param, field)                  \
  /** Gets the value of type field. Throws if value is not field*/         \
  type_param &Value##field();                                              \
  /** Gets the value of type field. Throws if value is not field*/         \
  const type_param &Value##field() const;                                  \
  /** Checks if it's the value is of the given type */                     \
  bool Is##field() const;

  DECLARE_VALUE_AND_TYPE_GETTERS(bool, Bool)
  DECLARE_VALUE_AND_TYPE_GETTERS(int64_t, Int)
  DECLARE_VALUE_AND_TYPE_GETTERS(double, Double)
  DECLARE_VALUE_AND_TYPE_GETTERS(TString, String)
  DECLARE_VALUE_AND_TYPE_GETTERS(TVector, List)
  DECLARE_VALUE_AND_TYPE_GETTERS(TMap, Map)
  DECLARE_VALUE_AND_TYPE_GETTERS(VertexAccessor, Vertex)
  DECLARE_VALUE_AND_TYPE_GETTERS(EdgeAccessor, Edge)

#undef DECLARE_VALUE_AND_TYPE_GETTERS

  /**  Checks if value is a TypedValue::Null. */
  bool IsNull() const;

  /** Convenience function for checking if this TypedValue is either
   * an integer or double */
  bool IsNumeric() const;

  /** Convenience function for checking if this TypedValue can be converted into
   * storage::PropertyValue */
  bool IsPropertyValue() const;

 private:
  template <class TOther>
  void ConstructFrom(TOther &&other);

  void DestroyValue() noexcept;

  // storage for the value of the property
  union {
    bool bool_v;
    int64_t int_v;
    double double_v;
    TString string_v;
    TVector list_v;
    TMap map_v;
    VertexAccessor vertex_v;
    EdgeAccessor edge_v;
  };

  /**
   * The Type of property.
   */
  Type type_;
};

// comparison operators, they return Null when either operand is Null and
// throw TypedValueException when the operands are not comparable
TypedValue operator==(const TypedValue &a, const TypedValue &b);
TypedValue operator!=(const TypedValue &a, const TypedValue &b);
TypedValue operator<(const TypedValue &a, const TypedValue &b);
TypedValue operator<=(const TypedValue &a, const TypedValue &b);
TypedValue operator>(const TypedValue &a, const TypedValue &b);
TypedValue operator>=(const TypedValue &a, const TypedValue &b);

// logical operators
TypedValue operator!(const TypedValue &a);

/**
 * output operators for TypedValue::Type
 */
std::ostream &operator<<(std::ostream &os, const TypedValue::Type &type);

std::ostream &operator<<(std::ostream &os, const TypedValue &value);

}  // namespace hopgraph::query
