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

#include "storage/graph.hpp"

#include <algorithm>
#include <vector>

#include "utils/logging.hpp"

namespace hopgraph::storage {

VertexAccessor Graph::CreateVertex() {
  HG_ASSERT(open_, "Creating a vertex in a closed graph");
  const auto gid = Gid::FromUint(next_vertex_id_++);
  auto [it, inserted] = vertices_.emplace(gid, std::make_unique<Vertex>(gid));
  HG_ASSERT(inserted, "The vertex must be inserted here!");
  return VertexAccessor(it->second.get(), this);
}

Result<EdgeAccessor> Graph::CreateEdge(VertexAccessor *from, VertexAccessor *to, EdgeTypeId edge_type) {
  if (!open_) return Error::STORAGE_CLOSED;
  if (from->vertex_->deleted || to->vertex_->deleted) return Error::DELETED_OBJECT;

  const auto gid = Gid::FromUint(next_edge_id_++);
  auto [it, inserted] = edges_.emplace(gid, std::make_unique<Edge>(gid, edge_type, from->vertex_, to->vertex_));
  HG_ASSERT(inserted, "The edge must be inserted here!");
  auto *edge = it->second.get();

  from->vertex_->out_edges.emplace_back(edge_type, to->vertex_, edge);
  to->vertex_->in_edges.emplace_back(edge_type, from->vertex_, edge);
  return EdgeAccessor(edge, this);
}

Result<bool> Graph::DeleteEdge(EdgeAccessor *edge) {
  if (!open_) return Error::STORAGE_CLOSED;
  if (edge->edge_->deleted) return false;
  DetachFromVertices(edge->edge_);
  edge->edge_->deleted = true;
  return true;
}

Result<bool> Graph::DetachDeleteVertex(VertexAccessor *vertex) {
  if (!open_) return Error::STORAGE_CLOSED;
  auto *target = vertex->vertex_;
  if (target->deleted) return false;

  std::vector<Edge *> incident;
  incident.reserve(target->in_edges.size() + target->out_edges.size());
  for (const auto &entry : target->out_edges) incident.push_back(std::get<Edge *>(entry));
  for (const auto &entry : target->in_edges) {
    auto *edge = std::get<Edge *>(entry);
    // self-loops are in both lists
    if (edge->from_vertex != target) incident.push_back(edge);
  }
  for (auto *edge : incident) {
    DetachFromVertices(edge);
    edge->deleted = true;
  }
  target->deleted = true;
  return true;
}

std::optional<VertexAccessor> Graph::FindVertex(Gid gid) {
  auto found = vertices_.find(gid);
  if (found == vertices_.end() || found->second->deleted) return std::nullopt;
  return VertexAccessor(found->second.get(), this);
}

void Graph::Close() {
  if (!open_) return;
  open_ = false;
  spdlog::debug("Graph with {} vertices and {} edges closed", vertices_.size(), edges_.size());
}

void Graph::DetachFromVertices(Edge *edge) {
  auto erase_edge = [edge](auto &adjacency) {
    std::erase_if(adjacency, [edge](const auto &entry) { return std::get<Edge *>(entry) == edge; });
  };
  erase_edge(edge->from_vertex->out_edges);
  erase_edge(edge->to_vertex->in_edges);
}

}  // namespace hopgraph::storage
