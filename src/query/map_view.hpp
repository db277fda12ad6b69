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

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "query/context.hpp"
#include "query/db_accessor.hpp"
#include "query/typed_value.hpp"
#include "storage/property_value.hpp"

namespace hopgraph::query {

/**
 * Read-only key/value projection over a map-like value.
 *
 * Views over nodes and relationships do not copy the properties. Every call
 * goes to the store, so a view always reflects the current state of the entity.
 * Views are projections and not collections, which makes all mutations a
 * programming error: they throw utils::ShouldNotHappenException.
 */
class MapView {
 public:
  MapView() = default;
  MapView(const MapView &) = delete;
  MapView &operator=(const MapView &) = delete;
  MapView(MapView &&) = delete;
  MapView &operator=(MapView &&) = delete;
  virtual ~MapView() = default;

  /// @return std::nullopt when the key is missing.
  virtual std::optional<TypedValue> Get(std::string_view key) const = 0;

  virtual bool Contains(std::string_view key) const = 0;

  /// All (key, value) pairs. Entities enumerate in the order the store
  /// reports their property keys, literal maps in key order.
  virtual std::vector<std::pair<std::string, TypedValue>> Items() const = 0;

  [[noreturn]] void Set(std::string_view key, const TypedValue &value);
  [[noreturn]] void Remove(std::string_view key);
  [[noreturn]] void Merge(const MapView &other);
};

/// A map given as a literal of the query, returned as is.
class LiteralMapView final : public MapView {
 public:
  explicit LiteralMapView(const TypedValue::TMap *map) : map_(map) {}

  std::optional<TypedValue> Get(std::string_view key) const override;
  bool Contains(std::string_view key) const override;
  std::vector<std::pair<std::string, TypedValue>> Items() const override;

 private:
  const TypedValue::TMap *map_;
};

/// A map of the storage library. Values are converted on access.
class PropertyMapView final : public MapView {
 public:
  explicit PropertyMapView(const storage::PropertyValue::TMap *map) : map_(map) {}

  std::optional<TypedValue> Get(std::string_view key) const override;
  bool Contains(std::string_view key) const override;
  std::vector<std::pair<std::string, TypedValue>> Items() const override;

 private:
  const storage::PropertyValue::TMap *map_;
};

/// Properties of a node or a relationship, read through the store.
template <class TAccessor>
class EntityMapView final : public MapView {
 public:
  EntityMapView(TAccessor entity, EntityOperations<TAccessor> operations)
      : entity_(std::move(entity)), operations_(operations) {}

  std::optional<TypedValue> Get(std::string_view key) const override {
    if (!operations_.HasProperty(entity_, key)) return std::nullopt;
    return operations_.GetProperty(entity_, key);
  }

  bool Contains(std::string_view key) const override { return operations_.HasProperty(entity_, key); }

  std::vector<std::pair<std::string, TypedValue>> Items() const override {
    std::vector<std::pair<std::string, TypedValue>> items;
    for (auto &key : operations_.PropertyKeys(entity_)) {
      auto value = operations_.GetProperty(entity_, key);
      items.emplace_back(std::move(key), std::move(value));
    }
    return items;
  }

 private:
  TAccessor entity_;
  EntityOperations<TAccessor> operations_;
};

/// The recognized map-like shapes. Map pointers refer into the classified value
/// which has to outlive the binding.
using MapLike =
    std::variant<const TypedValue::TMap *, const storage::PropertyValue::TMap *, VertexAccessor, EdgeAccessor>;

std::optional<MapLike> ClassifyMapLike(const TypedValue &value);
std::optional<MapLike> ClassifyMapLike(const storage::PropertyValue &value);
std::optional<MapLike> ClassifyMapLike(TypedValue &&) = delete;
std::optional<MapLike> ClassifyMapLike(storage::PropertyValue &&) = delete;

inline bool IsMapLike(const TypedValue &value) { return ClassifyMapLike(value).has_value(); }
inline bool IsMapLike(const storage::PropertyValue &value) { return ClassifyMapLike(value).has_value(); }

/// Binds a classified value to the store. Literal and storage maps ignore `dba`.
std::unique_ptr<MapView> BindMapView(const MapLike &map_like, const DbAccessor *dba);

using MapViewBinder = std::function<std::unique_ptr<MapView>(const ExecutionContext &)>;

/// Deferred view construction for values whose access needs the store, known
/// only at evaluation time. Returns std::nullopt for values that are not map-like.
std::optional<MapViewBinder> AsMapView(const TypedValue &value);
std::optional<MapViewBinder> AsMapView(const storage::PropertyValue &value);
std::optional<MapViewBinder> AsMapView(TypedValue &&) = delete;
std::optional<MapViewBinder> AsMapView(storage::PropertyValue &&) = delete;

}  // namespace hopgraph::query
