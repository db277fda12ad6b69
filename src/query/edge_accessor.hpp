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

#include <utility>
#include <vector>

#include "storage/edge_accessor.hpp"

namespace hopgraph::query {

class VertexAccessor;

class EdgeAccessor final {
 public:
  storage::EdgeAccessor impl_;

  explicit EdgeAccessor(storage::EdgeAccessor impl) : impl_(std::move(impl)) {}

  bool IsDeleted() const { return impl_.IsDeleted(); }

  storage::EdgeTypeId EdgeType() const { return impl_.EdgeType(); }

  storage::Result<storage::PropertyValue> GetProperty(storage::PropertyId key) const { return impl_.GetProperty(key); }

  storage::Result<bool> HasProperty(storage::PropertyId key) const { return impl_.HasProperty(key); }

  storage::Result<std::vector<storage::PropertyId>> PropertyKeys() const { return impl_.PropertyKeys(); }

  storage::Result<storage::PropertyValue> SetProperty(storage::PropertyId key, const storage::PropertyValue &value) {
    return impl_.SetProperty(key, value);
  }

  VertexAccessor To() const;

  VertexAccessor From() const;

  bool IsCycle() const;

  int64_t CypherId() const { return impl_.Gid().AsInt(); }

  storage::Gid Gid() const noexcept { return impl_.Gid(); }

  bool operator==(const EdgeAccessor &e) const noexcept { return impl_ == e.impl_; }

  bool operator!=(const EdgeAccessor &e) const noexcept { return !(*this == e); }
};

}  // namespace hopgraph::query

namespace std {

template <>
struct hash<hopgraph::query::EdgeAccessor> {
  size_t operator()(const hopgraph::query::EdgeAccessor &e) const { return std::hash<decltype(e.impl_)>{}(e.impl_); }
};

}  // namespace std
