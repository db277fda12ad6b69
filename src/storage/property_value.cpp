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

#include "storage/property_value.hpp"

#include <memory>
#include <ostream>

#include <fmt/ostream.h>

namespace hopgraph::storage {

PropertyValue::PropertyValue(const PropertyValue &other) : type_(other.type_) {
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
      new (&string_v) std::string(other.string_v);
      return;
    case Type::List:
      new (&list_v) TList(other.list_v);
      return;
    case Type::Map:
      new (&map_v) TMap(other.map_v);
      return;
  }
}

PropertyValue::PropertyValue(PropertyValue &&other) noexcept : type_(other.type_) {
  switch (other.type_) {
    case Type::Null:
      break;
    case Type::Bool:
      bool_v = other.bool_v;
      break;
    case Type::Int:
      int_v = other.int_v;
      break;
    case Type::Double:
      double_v = other.double_v;
      break;
    case Type::String:
      new (&string_v) std::string(std::move(other.string_v));
      break;
    case Type::List:
      new (&list_v) TList(std::move(other.list_v));
      break;
    case Type::Map:
      new (&map_v) TMap(std::move(other.map_v));
      break;
  }
  // reset the type of other
  other.DestroyValue();
  other.type_ = Type::Null;
}

PropertyValue &PropertyValue::operator=(const PropertyValue &other) {
  if (this == &other) return *this;
  PropertyValue tmp(other);
  return *this = std::move(tmp);
}

PropertyValue &PropertyValue::operator=(PropertyValue &&other) noexcept {
  if (this == &other) return *this;
  DestroyValue();
  new (this) PropertyValue(std::move(other));
  return *this;
}

void PropertyValue::DestroyValue() noexcept {
  switch (type_) {
    // destructor for primitive types does nothing
    case Type::Null:
    case Type::Bool:
    case Type::Int:
    case Type::Double:
      return;

    // destructor for non primitive types since we used placement new
    case Type::String:
      std::destroy_at(&string_v);
      return;
    case Type::List:
      std::destroy_at(&list_v);
      return;
    case Type::Map:
      std::destroy_at(&map_v);
      return;
  }
}

#define DEFINE_VALUE_GETTER(type_param, type_enum, field)                                               \
  type_param PropertyValue::Value##type_enum() const {                                                  \
    if (type_ != Type::type_enum) [[unlikely]] {                                                        \
      throw PropertyValueException("The value isn't a " #type_enum "; it is a {}.", fmt::streamed(type_)); \
    }                                                                                                   \
    return field;                                                                                       \
  }

DEFINE_VALUE_GETTER(bool, Bool, bool_v)
DEFINE_VALUE_GETTER(int64_t, Int, int_v)
DEFINE_VALUE_GETTER(double, Double, double_v)
DEFINE_VALUE_GETTER(const std::string &, String, string_v)
DEFINE_VALUE_GETTER(const PropertyValue::TList &, List, list_v)
DEFINE_VALUE_GETTER(const PropertyValue::TMap &, Map, map_v)

#undef DEFINE_VALUE_GETTER

std::ostream &operator<<(std::ostream &os, const PropertyValue::Type type) {
  switch (type) {
    case PropertyValue::Type::Null:
      return os << "null";
    case PropertyValue::Type::Bool:
      return os << "bool";
    case PropertyValue::Type::Int:
      return os << "int";
    case PropertyValue::Type::Double:
      return os << "double";
    case PropertyValue::Type::String:
      return os << "string";
    case PropertyValue::Type::List:
      return os << "list";
    case PropertyValue::Type::Map:
      return os << "map";
  }
  return os;
}

std::ostream &operator<<(std::ostream &os, const PropertyValue &value) {
  switch (value.type()) {
    case PropertyValue::Type::Null:
      return os << "null";
    case PropertyValue::Type::Bool:
      return os << (value.ValueBool() ? "true" : "false");
    case PropertyValue::Type::Int:
      return os << value.ValueInt();
    case PropertyValue::Type::Double:
      return os << value.ValueDouble();
    case PropertyValue::Type::String:
      return os << value.ValueString();
    case PropertyValue::Type::List: {
      os << "[";
      bool first = true;
      for (const auto &item : value.ValueList()) {
        if (!first) os << ", ";
        os << item;
        first = false;
      }
      return os << "]";
    }
    case PropertyValue::Type::Map: {
      os << "{";
      bool first = true;
      for (const auto &[key, item] : value.ValueMap()) {
        if (!first) os << ", ";
        os << key << ": " << item;
        first = false;
      }
      return os << "}";
    }
  }
  return os;
}

bool operator==(const PropertyValue &first, const PropertyValue &second) {
  if (first.type() != second.type()) {
    // Int and Double compare by value, everything else differs by type
    if (first.IsInt() && second.IsDouble()) return static_cast<double>(first.ValueInt()) == second.ValueDouble();
    if (first.IsDouble() && second.IsInt()) return first.ValueDouble() == static_cast<double>(second.ValueInt());
    return false;
  }
  switch (first.type()) {
    case PropertyValue::Type::Null:
      return true;
    case PropertyValue::Type::Bool:
      return first.ValueBool() == second.ValueBool();
    case PropertyValue::Type::Int:
      return first.ValueInt() == second.ValueInt();
    case PropertyValue::Type::Double:
      return first.ValueDouble() == second.ValueDouble();
    case PropertyValue::Type::String:
      return first.ValueString() == second.ValueString();
    case PropertyValue::Type::List:
      return first.ValueList() == second.ValueList();
    case PropertyValue::Type::Map:
      return first.ValueMap() == second.ValueMap();
  }
  return false;
}

}  // namespace hopgraph::storage
