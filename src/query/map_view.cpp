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


#include "query/map_view.hpp"

#include <type_traits>

#include "utils/exceptions.hpp"
#include "utils/logging.hpp"

namespace hopgraph::query {

namespace {

[[noreturn]] void ThrowNotARealMap(std::string_view operation) {
  spdlog::critical("Tried to {} a map view, map views are read-only projections", operation);
  throw utils::ShouldNotHappenException("{} on a map view. This map is not a real map.", operation);
}

}  // namespace

void MapView::Set(std::string_view key, const TypedValue & /*value*/) {
  SPDLOG_TRACE("Rejecting write of key {}", key);
  ThrowNotARealMap("set");
}

void MapView::Remove(std::string_view key) {
  SPDLOG_TRACE("Rejecting removal of key {}", key);
  ThrowNotARealMap("remove");
}

void MapView::Merge(const MapView & /*other*/) { ThrowNotARealMap("merge"); }

std::optional<TypedValue> LiteralMapView::Get(std::string_view key) const {
  auto found = map_->find(key);
  if (found == map_->end()) return std::nullopt;
  return found->second;
}

bool LiteralMapView::Contains(std::string_view key) const { return map_->find(key) != map_->end(); }

std::vector<std::pair<std::string, TypedValue>> LiteralMapView::Items() const {
  return {map_->begin(), map_->end()};
}

std::optional<TypedValue> PropertyMapView::Get(std::string_view key) const {
  auto found = map_->find(key);
  if (found == map_->end()) return std::nullopt;
  return TypedValue(found->second);
}

bool PropertyMapView::Contains(std::string_view key) const { return map_->find(key) != map_->end(); }

std::vector<std::pair<std::string, TypedValue>> PropertyMapView::Items() const {
  std::vector<std::pair<std::string, TypedValue>> items;
  items.reserve(map_->size());
  for (const auto &[key, value] : *map_) items.emplace_back(key, TypedValue(value));
  return items;
}

std::optional<MapLike> ClassifyMapLike(const TypedValue &value) {
  switch (value.type()) {
    case TypedValue::Type::Map:
      return MapLike{&value.ValueMap()};
    case TypedValue::Type::Vertex:
      return MapLike{value.ValueVertex()};
    case TypedValue::Type::Edge:
      return MapLike{value.ValueEdge()};
    default:
      return std::nullopt;
  }
}

std::optional<MapLike> ClassifyMapLike(const storage::PropertyValue &value) {
  if (!value.IsMap()) return std::nullopt;
  return MapLike{&value.ValueMap()};
}

std::unique_ptr<MapView> BindMapView(const MapLike &map_like, const DbAccessor *dba) {
  return std::visit(
      [dba](const auto &shape) -> std::unique_ptr<MapView> {
        using TShape = std::decay_t<decltype(shape)>;
        if constexpr (std::is_same_v<TShape, const TypedValue::TMap *>) {
          return std::make_unique<LiteralMapView>(shape);
        } else if constexpr (std::is_same_v<TShape, const storage::PropertyValue::TMap *>) {
          return std::make_unique<PropertyMapView>(shape);
        } else if constexpr (std::is_same_v<TShape, VertexAccessor>) {
          HG_ASSERT(dba, "Binding a node map view requires store access");
          return std::make_unique<EntityMapView<VertexAccessor>>(shape, dba->NodeOps());
        } else {
          static_assert(std::is_same_v<TShape, EdgeAccessor>, "Unhandled map-like shape");
          HG_ASSERT(dba, "Binding a relationship map view requires store access");
          return std::make_unique<EntityMapView<EdgeAccessor>>(shape, dba->RelationshipOps());
        }
      },
      map_like);
}

namespace {

std::optional<MapViewBinder> MakeBinder(std::optional<MapLike> map_like) {
  if (!map_like) return std::nullopt;
  return MapViewBinder([map_like = std::move(*map_like)](const ExecutionContext &context) {
    return BindMapView(map_like, context.db_accessor);
  });
}

}  // namespace

std::optional<MapViewBinder> AsMapView(const TypedValue &value) { return MakeBinder(ClassifyMapLike(value)); }

std::optional<MapViewBinder> AsMapView(const storage::PropertyValue &value) {
  return MakeBinder(ClassifyMapLike(value));
}

}  // namespace hopgraph::query
