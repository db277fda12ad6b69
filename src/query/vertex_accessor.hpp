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

#include <optional>
#include <utility>
#include <vector>

#include "query/edge_accessor.hpp"
#include "storage/vertex_accessor.hpp"

namespace hopgraph::query {

class VertexAccessor final {
 public:
  storage::VertexAccessor impl_;

  explicit VertexAccessor(storage::VertexAccessor impl) : impl_(impl) {}

  bool IsDeleted() const { return impl_.IsDeleted(); }

  storage::Result<storage::PropertyValue> GetProperty(storage::PropertyId key) const { return impl_.GetProperty(key); }

  storage::Result<bool> HasProperty(storage::PropertyId key) const { return impl_.HasProperty(key); }

  storage::Result<std::vector<storage::PropertyId>> PropertyKeys() const { return impl_.PropertyKeys(); }

  storage::Result<storage::PropertyValue> SetProperty(storage::PropertyId key, const storage::PropertyValue &value) {
    return impl_.SetProperty(key, value);
  }

  storage::IncidentEdges Edges(storage::EdgeDirection direction,
                               std::optional<std::vector<storage::EdgeTypeId>> edge_types) const {
    return impl_.Edges(direction, std::move(edge_types));
  }

  storage::Result<size_t> InDegree() const { return impl_.InDegree(); }

  storage::Result<size_t> OutDegree() const { return impl_.OutDegree(); }

  int64_t CypherId() const { return impl_.Gid().AsInt(); }

  storage::Gid Gid() const noexcept { return impl_.Gid(); }

  bool operator==(const VertexAccessor &v) const noexcept { return impl_ == v.impl_; }

  bool operator!=(const VertexAccessor &v) const noexcept { return !(*this == v); }
};

}  // namespace hopgraph::query

namespace std {

template <>
struct hash<hopgraph::query::VertexAccessor> {
  size_t operator()(const hopgraph::query::VertexAccessor &v) const { return std::hash<decltype(v.impl_)>{}(v.impl_); }
};

}  // namespace std
