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

#include "storage/vertex_accessor.hpp"

#include "storage/graph.hpp"
#include "storage/vertex.hpp"

namespace hopgraph::storage {

bool VertexAccessor::IsDeleted() const { return vertex_->deleted; }

Result<PropertyValue> VertexAccessor::GetProperty(PropertyId property) const {
  if (auto error = graph_->AccessError(vertex_->deleted)) return *error;
  return vertex_->properties.GetProperty(property);
}

Result<bool> VertexAccessor::HasProperty(PropertyId property) const {
  if (auto error = graph_->AccessError(vertex_->deleted)) return *error;
  return vertex_->properties.HasProperty(property);
}

Result<std::vector<PropertyId>> VertexAccessor::PropertyKeys() const {
  if (auto error = graph_->AccessError(vertex_->deleted)) return *error;
  return vertex_->properties.Keys();
}

Result<PropertyValue> VertexAccessor::SetProperty(PropertyId property, const PropertyValue &value) {
  if (auto error = graph_->AccessError(vertex_->deleted)) return *error;
  return vertex_->properties.SetProperty(property, value);
}

Result<size_t> VertexAccessor::InDegree() const {
  if (auto error = graph_->AccessError(vertex_->deleted)) return *error;
  return vertex_->in_edges.size();
}

Result<size_t> VertexAccessor::OutDegree() const {
  if (auto error = graph_->AccessError(vertex_->deleted)) return *error;
  return vertex_->out_edges.size();
}

storage::Gid VertexAccessor::Gid() const noexcept { return vertex_->gid; }

}  // namespace hopgraph::storage
