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
#include <map>
#include <string>
#include <vector>

#include "utils/exceptions.hpp"

namespace hopgraph::storage {

/// An exception raised by the PropertyValue. Typically when trying to perform
/// operations (such as addition) on PropertyValues of incompatible Types.
class PropertyValueException : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(PropertyValueException)
};

/// Encapsulation of a value and its type in a class that has no compile-time
/// info about the type.
///
/// Values can be of a number of predefined types that are enumerated in
/// PropertyValue::Type. Each such type corresponds to exactly one C++ type.
class PropertyValue {
 public:
  /// A value type, each type corresponds to exactly one C++ type.
  enum class Type : uint8_t { Null, Bool, Int, Double, String, List, Map };

  using TList = std::vector<PropertyValue>;
  using TMap = std::map<std::string, PropertyValue, std::less<>>;

  /// Make a Null value
  PropertyValue() : type_(Type::Null) {}

  // constructors for primitive types
  explicit PropertyValue(const bool value) : bool_v(value), type_(Type::Bool) {}
  explicit PropertyValue(const int value) : int_v(value), type_(Type::Int) {}
  explicit PropertyValue(const int64_t value) : int_v(value), type_(Type::Int) {}
  explicit PropertyValue(const double value) : double_v(value), type_(Type::Double) {}

  // copy constructors for non-primitive types
  explicit PropertyValue(const std::string &value) : type_(Type::String) { new (&string_v) std::string(value); }
  explicit PropertyValue(const char *value) : type_(Type::String) { new (&string_v) std::string(value); }
  explicit PropertyValue(const TList &value) : type_(Type::List) { new (&list_v) TList(value); }
  explicit PropertyValue(const TMap &value) : type_(Type::Map) { new (&map_v) TMap(value); }

  // move constructors for non-primitive types
  explicit PropertyValue(std::string &&value) noexcept : type_(Type::String) {
    new (&string_v) std::string(std::move(value));
  }
  explicit PropertyValue(TList &&value) noexcept : type_(Type::List) { new (&list_v) TList(std::move(value)); }
  explicit PropertyValue(TMap &&value) noexcept : type_(Type::Map) { new (&map_v) TMap(std::move(value)); }

  PropertyValue(const PropertyValue &other);
  PropertyValue(PropertyValue &&other) noexcept;
  PropertyValue &operator=(const PropertyValue &other);
  PropertyValue &operator=(PropertyValue &&other) noexcept;
  ~PropertyValue() { DestroyValue(); }

  Type type() const { return type_; }

  bool IsNull() const { return type_ == Type::Null; }
  bool IsBool() const { return type_ == Type::Bool; }
  bool IsInt() const { return type_ == Type::Int; }
  bool IsDouble() const { return type_ == Type::Double; }
  bool IsString() const { return type_ == Type::String; }
  bool IsList() const { return type_ == Type::List; }
  bool IsMap() const { return type_ == Type::Map; }

  bool ValueBool() const;
  int64_t ValueInt() const;
  double ValueDouble() const;
  const std::string &ValueString() const;
  const TList &ValueList() const;
  const TMap &ValueMap() const;

 private:
  void DestroyValue() noexcept;

  union {
    bool bool_v;
    int64_t int_v;
    double double_v;
    std::string string_v;
    TList list_v;
    TMap map_v;
  };

  Type type_;
};

std::ostream &operator<<(std::ostream &os, PropertyValue::Type type);
std::ostream &operator<<(std::ostream &os, const PropertyValue &value);

bool operator==(const PropertyValue &first, const PropertyValue &second);
inline bool operator!=(const PropertyValue &first, const PropertyValue &second) { return !(first == second); }

}  // namespace hopgraph::storage
