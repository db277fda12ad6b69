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

#include "storage/edge_accessor.hpp"

#include "storage/graph.hpp"
#include "storage/vertex_accessor.hpp"

namespace hopgraph::storage {

VertexAccessor EdgeAccessor::FromVertex() const { return VertexAccessor(edge_->from_vertex, graph_); }

VertexAccessor EdgeAccessor::ToVertex() const { return VertexAccessor(edge_->to_vertex, graph_); }

EdgeTypeId EdgeAccessor::EdgeType() const { return edge_->edge_type; }

bool EdgeAccessor::IsDeleted() const { return edge_->deleted; }

Result<PropertyValue> EdgeAccessor::GetProperty(PropertyId property) const {
  if (auto error = graph_->AccessError(edge_->deleted)) return *error;
  return edge_->properties.GetProperty(property);
}

Result<bool> EdgeAccessor::HasProperty(PropertyId property) const {
  if (auto error = graph_->AccessError(edge_->deleted)) return *error;
  return edge_->properties.HasProperty(property);
}

Result<std::vector<PropertyId>> EdgeAccessor::PropertyKeys() const {
  if (auto error = graph_->AccessError(edge_->deleted)) return *error;
  return edge_->properties.Keys();
}

Result<PropertyValue> EdgeAccessor::SetProperty(PropertyId property, const PropertyValue &value) {
  if (auto error = graph_->AccessError(edge_->deleted)) return *error;
  return edge_->properties.SetProperty(property, value);
}

storage::Gid EdgeAccessor::Gid() const noexcept { return edge_->gid; }

}  // namespace hopgraph::storage
