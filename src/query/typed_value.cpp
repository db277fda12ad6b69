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


#include "query/typed_value.hpp"

#include <algorithm>
#include <iterator>
#include <memory>
#include <ostream>

#include <fmt/ostream.h>

#include "query/exceptions.hpp"
#include "utils/logging.hpp"

namespace hopgraph::query {

TypedValue::TypedValue(const storage::PropertyValue &value) : type_(Type::Null) {
  switch (value.type()) {
    case storage::PropertyValue::Type::Null:
      return;
    case storage::PropertyValue::Type::Bool:
      *this = TypedValue(value.ValueBool());
      return;
    case storage::PropertyValue::Type::Int:
      *this = TypedValue(value.ValueInt());
      return;
    case storage::PropertyValue::Type::Double:
      *this = TypedValue(value.ValueDouble());
      return;
    case storage::PropertyValue::Type::String:
      *this = TypedValue(value.ValueString());
      return;
    case storage::PropertyValue::Type::List: {
      TVector list;
      list.reserve(value.ValueList().size());
      for (const auto &item : value.ValueList()) list.emplace_back(item);
      *this = TypedValue(std::move(list));
      return;
    }
    case storage::PropertyValue::Type::Map: {
      TMap map;
      for (const auto &[key, item] : value.ValueMap()) map.emplace(key, TypedValue(item));
      *this = TypedValue(std::move(map));
      return;
    }
  }
  LOG_FATAL("Unknown storage::PropertyValue::Type");
}

// Takes over the type and value of `other`, copying from an lvalue and moving
// from an rvalue. The current value must already be destroyed.
template <class TOther>
void TypedValue::ConstructFrom(TOther &&other) {
  type_ = other.type_;
  switch (other.type_) {
    case Type::Null:
      return;
    case Type::Bool:
      bool_v = other.bool_v;
      return;
    case Type::Int:
      int_v = other.int_v;
      return;
    case Type::Double:
      double_v = other.double_v;
      return;
    case Type::String:
      new (&string_v) TString(std::forward<TOther>(other).string_v);
      return;
    case Type::List:
      new (&list_v) TVector(std::forward<TOther>(other).list_v);
      return;
    case Type::Map:
      new (&map_v) TMap(std::forward<TOther>(other).map_v);
      return;
    case Type::Vertex:
      new (&vertex_v) VertexAccessor(std::forward<TOther>(other).vertex_v);
      return;
    case Type::Edge:
      new (&edge_v) EdgeAccessor(std::forward<TOther>(other).edge_v);
      return;
  }
  LOG_FATAL("Unknown TypedValue::Type");
}

TypedValue::TypedValue(const TypedValue &other) : type_(Type::Null) { ConstructFrom(other); }

TypedValue::TypedValue(TypedValue &&other) noexcept : type_(Type::Null) {
  ConstructFrom(std::move(other));
  other.DestroyValue();
}

TypedValue &TypedValue::operator=(const TypedValue &other) {
  if (this != &other) *this = TypedValue(other);
  return *this;
}

TypedValue &TypedValue::operator=(TypedValue &&other) noexcept {
  if (this == &other) return *this;
  DestroyValue();
  ConstructFrom(std::move(other));
  other.DestroyValue();
  return *this;
}

TypedValue::~TypedValue() { DestroyValue(); }

void TypedValue::DestroyValue() noexcept {
  // Only the members constructed with placement new need their destructor.
  switch (type_) {
    case Type::String:
      std::destroy_at(&string_v);
      break;
    case Type::List:
      std::destroy_at(&list_v);
      break;
    case Type::Map:
      std::destroy_at(&map_v);
      break;
    case Type::Vertex:
      std::destroy_at(&vertex_v);
      break;
    case Type::Edge:
      std::destroy_at(&edge_v);
      break;
    default:
      break;
  }
  type_ = Type::Null;
}

TypedValue::operator storage::PropertyValue() const {
  switch (type_) {
    case Type::Null:
      return {};
    case Type::Bool:
      return storage::PropertyValue(bool_v);
    case Type::Int:
      return storage::PropertyValue(int_v);
    case Type::Double:
      return storage::PropertyValue(double_v);
    case Type::String:
      return storage::PropertyValue(string_v);
    case Type::List: {
      storage::PropertyValue::TList list;
      list.reserve(list_v.size());
      std::transform(list_v.begin(), list_v.end(), std::back_inserter(list),
                     [](const TypedValue &item) { return storage::PropertyValue(item); });
      return storage::PropertyValue(std::move(list));
    }
    case Type::Map: {
      storage::PropertyValue::TMap map;
      for (const auto &[key, item] : map_v) map.emplace(key, storage::PropertyValue(item));
      return storage::PropertyValue(std::move(map));
    }
    case Type::Vertex:
    case Type::Edge:
      break;
  }
  throw TypedValueException("A {} can't be stored as a property value", fmt::streamed(type_));
}

#define DEFINE_VALUE_AND_TYPE_GETTERS(type_param, type_enum, field)                                                  \
  type_param &TypedValue::Value##type_enum() {                                                                       \
    if (type_ != Type::type_enum) [[unlikely]]                                                                       \
      throw TypedValueException("TypedValue is of type '{}', not '{}'", fmt::streamed(type_),                        \
                                fmt::streamed(Type::type_enum));                                                     \
    return field;                                                                                                    \
  }                                                                                                                  \
  const type_param &TypedValue::Value##type_enum() const {                                                           \
    if (type_ != Type::type_enum) [[unlikely]]                                                                       \
      throw TypedValueException("TypedValue is of type '{}', not '{}'", fmt::streamed(type_),                        \
                                fmt::streamed(Type::type_enum));                                                     \
    return field;                                                                                                    \
  }                                                                                                                  \
  bool TypedValue::Is##type_enum() const { return type_ == Type::type_enum; }

DEFINE_VALUE_AND_TYPE_GETTERS(bool, Bool, bool_v)
DEFINE_VALUE_AND_TYPE_GETTERS(int64_t, Int, int_v)
DEFINE_VALUE_AND_TYPE_GETTERS(double, Double, double_v)
DEFINE_VALUE_AND_TYPE_GETTERS(TypedValue::TString, String, string_v)
DEFINE_VALUE_AND_TYPE_GETTERS(TypedValue::TVector, List, list_v)
DEFINE_VALUE_AND_TYPE_GETTERS(TypedValue::TMap, Map, map_v)
DEFINE_VALUE_AND_TYPE_GETTERS(VertexAccessor, Vertex, vertex_v)
DEFINE_VALUE_AND_TYPE_GETTERS(EdgeAccessor, Edge, edge_v)

#undef DEFINE_VALUE_AND_TYPE_GETTERS

bool TypedValue::IsNull() const { return type_ == Type::Null; }

bool TypedValue::IsNumeric() const { return IsInt() || IsDouble(); }

bool TypedValue::IsPropertyValue() const {
  switch (type_) {
    case Type::Null:
    case Type::Bool:
    case Type::Int:
    case Type::Double:
    case Type::String:
      return true;
    case Type::List:
      return std::all_of(list_v.begin(), list_v.end(), [](const auto &elem) { return elem.IsPropertyValue(); });
    case Type::Map:
      return std::all_of(map_v.begin(), map_v.end(), [](const auto &elem) { return elem.second.IsPropertyValue(); });
    case Type::Vertex:
    case Type::Edge:
      return false;
  }
  return false;
}

std::ostream &operator<<(std::ostream &os, const TypedValue::Type &type) {
  switch (type) {
    case TypedValue::Type::Null:
      return os << "null";
    case TypedValue::Type::Bool:
      return os << "bool";
    case TypedValue::Type::Int:
      return os << "int";
    case TypedValue::Type::Double:
      return os << "double";
    case TypedValue::Type::String:
      return os << "string";
    case TypedValue::Type::List:
      return os << "list";
    case TypedValue::Type::Map:
      return os << "map";
    case TypedValue::Type::Vertex:
      return os << "vertex";
    case TypedValue::Type::Edge:
      return os << "edge";
  }
  LOG_FATAL("Unsupported TypedValue::Type");
}

std::ostream &operator<<(std::ostream &os, const TypedValue &value) {
  switch (value.type()) {
    case TypedValue::Type::Null:
      return os << "null";
    case TypedValue::Type::Bool:
      return os << (value.ValueBool() ? "true" : "false");
    case TypedValue::Type::Int:
      return os << value.ValueInt();
    case TypedValue::Type::Double:
      return os << value.ValueDouble();
    case TypedValue::Type::String:
      return os << value.ValueString();
    case TypedValue::Type::List: {
      os << "[";
      bool first = true;
      for (const auto &item : value.ValueList()) {
        if (!first) os << ", ";
        os << item;
        first = false;
      }
      return os << "]";
    }
    case TypedValue::Type::Map: {
      os << "{";
      bool first = true;
      for (const auto &[key, item] : value.ValueMap()) {
        if (!first) os << ", ";
        os << key << ": " << item;
        first = false;
      }
      return os << "}";
    }
    case TypedValue::Type::Vertex:
      return os << "(" << value.ValueVertex().CypherId() << ")";
    case TypedValue::Type::Edge:
      return os << "[" << value.ValueEdge().CypherId() << "]";
  }
  LOG_FATAL("Unsupported TypedValue::Type");
}

namespace {

double ToDouble(const TypedValue &value) {
  switch (value.type()) {
    case TypedValue::Type::Int:
      return static_cast<double>(value.ValueInt());
    case TypedValue::Type::Double:
      return value.ValueDouble();
    default:
      throw TypedValueException("Unsupported TypedValue::Type conversion to double");
  }
}

}  // namespace

TypedValue operator<(const TypedValue &a, const TypedValue &b) {
  auto orderable = [](const TypedValue &value) { return value.IsNull() || value.IsNumeric() || value.IsString(); };
  // Strings order only among strings, numbers among numbers.
  const bool comparable = orderable(a) && orderable(b) && (a.IsString() == b.IsString() || a.IsNull() || b.IsNull());
  if (!comparable) {
    throw TypedValueException("Can't order a {} against a {}", fmt::streamed(a.type()), fmt::streamed(b.type()));
  }

  if (a.IsNull() || b.IsNull()) return TypedValue();
  if (a.IsString()) return TypedValue(a.ValueString() < b.ValueString());
  if (a.IsInt() && b.IsInt()) return TypedValue(a.ValueInt() < b.ValueInt());
  return TypedValue(ToDouble(a) < ToDouble(b));
}

TypedValue operator==(const TypedValue &a, const TypedValue &b) {
  if (a.IsNull() || b.IsNull()) return TypedValue();

  // Values of different types are never equal, except for mixed numbers.
  if (a.type() != b.type() && !(a.IsNumeric() && b.IsNumeric())) return TypedValue(false);

  switch (a.type()) {
    case TypedValue::Type::Bool:
      return TypedValue(a.ValueBool() == b.ValueBool());
    case TypedValue::Type::Int:
      if (b.IsDouble()) return TypedValue(ToDouble(a) == ToDouble(b));
      return TypedValue(a.ValueInt() == b.ValueInt());
    case TypedValue::Type::Double:
      return TypedValue(ToDouble(a) == ToDouble(b));
    case TypedValue::Type::String:
      return TypedValue(a.ValueString() == b.ValueString());
    case TypedValue::Type::Vertex:
      return TypedValue(a.ValueVertex() == b.ValueVertex());
    case TypedValue::Type::Edge:
      return TypedValue(a.ValueEdge() == b.ValueEdge());
    case TypedValue::Type::List: {
      const auto &list_a = a.ValueList();
      const auto &list_b = b.ValueList();
      if (list_a.size() != list_b.size()) return TypedValue(false);
      // Element-wise BoolEqual, a list comparison is never Null.
      return TypedValue(std::equal(list_a.begin(), list_a.end(), list_b.begin(), TypedValue::BoolEqual{}));
    }
    case TypedValue::Type::Map: {
      const auto &map_a = a.ValueMap();
      const auto &map_b = b.ValueMap();
      if (map_a.size() != map_b.size()) return TypedValue(false);
      return TypedValue(std::all_of(map_a.begin(), map_a.end(), [&map_b](const auto &entry) {
        auto found = map_b.find(entry.first);
        if (found == map_b.end()) return false;
        auto equal = entry.second == found->second;
        return equal.IsBool() && equal.ValueBool();
      }));
    }
    case TypedValue::Type::Null:
      break;
  }
  LOG_FATAL("Unhandled comparison for types");
}

TypedValue operator!=(const TypedValue &a, const TypedValue &b) { return !(a == b); }

TypedValue operator<=(const TypedValue &a, const TypedValue &b) {
  if (a.IsNull() || b.IsNull()) return TypedValue();
  return TypedValue((a < b).ValueBool() || (a == b).ValueBool());
}

TypedValue operator>(const TypedValue &a, const TypedValue &b) { return b < a; }

TypedValue operator>=(const TypedValue &a, const TypedValue &b) { return b <= a; }

TypedValue operator!(const TypedValue &a) {
  if (a.IsNull()) return TypedValue();
  if (a.IsBool()) return TypedValue(!a.ValueBool());
  throw TypedValueException("Invalid logical not operand type (!{})", fmt::streamed(a.type()));
}

bool TypedValue::BoolEqual::operator()(const TypedValue &lhs, const TypedValue &rhs) const {
  if (lhs.IsNull() && rhs.IsNull()) return true;
  TypedValue equality_result = lhs == rhs;
  switch (equality_result.type()) {
    case TypedValue::Type::Bool:
      return equality_result.ValueBool();
    case TypedValue::Type::Null:
      return false;
    default:
      LOG_FATAL(
          "Equality between two TypedValues resulted in something other "
          "than Null or bool");
  }
}

}  // namespace hopgraph::query
