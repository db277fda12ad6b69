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

#include <algorithm>
#include <ostream>
#include <utility>
#include <vector>

#include "query/edge_accessor.hpp"
#include "query/vertex_accessor.hpp"
#include "utils/logging.hpp"

namespace hopgraph::query {

/**
 *  A data structure that holds a graph path. A path consists of at least one
 * vertex, followed by zero or more edge + vertex extensions (thus having one
 * vertex more then edges).
 */
class Path {
 public:
  /** Create the path starting with the given vertex. */
  explicit Path(const VertexAccessor &vertex) { Expand(vertex); }

  /**
   * Create the path starting with the given vertex and containing all other
   * elements.
   */
  template <typename... TOthers>
  explicit Path(const VertexAccessor &vertex, TOthers &&...others) {
    Expand(vertex);
    Expand(std::forward<TOthers>(others)...);
  }

  /** Expands the path with the given vertex. */
  void Expand(VertexAccessor vertex) {
    DHG_ASSERT(vertices_.size() == edges_.size(), "Illegal path construction order");
    DHG_ASSERT(edges_.empty() || edges_.back().To() == vertex || edges_.back().From() == vertex,
               "Illegal path construction order");
    vertices_.emplace_back(std::move(vertex));
  }

  /** Expands the path with the given edge. */
  void Expand(EdgeAccessor edge) {
    DHG_ASSERT(vertices_.size() - 1 == edges_.size(), "Illegal path construction order");
    DHG_ASSERT(vertices_.back() == edge.From() || vertices_.back() == edge.To(), "Illegal path construction order");
    edges_.emplace_back(std::move(edge));
  }

  /** Expands the path with the given elements. */
  template <typename TFirst, typename... TOthers>
  void Expand(TFirst &&first, TOthers &&...others) {
    Expand(std::forward<TFirst>(first));
    Expand(std::forward<TOthers>(others)...);
  }

  /** Removes the last vertex together with the edge leading to it. */
  void Shrink() {
    DHG_ASSERT(vertices_.size() > 1, "Shrinking a path would remove its first vertex.");
    vertices_.pop_back();
    edges_.pop_back();
  }

  bool Contains(const EdgeAccessor &edge) const { return std::find(edges_.begin(), edges_.end(), edge) != edges_.end(); }

  /** Returns the number of expansions (edges) in this path. */
  auto size() const { return edges_.size(); }

  const auto &vertices() const { return vertices_; }
  const auto &edges() const { return edges_; }

  const VertexAccessor &Start() const { return vertices_.front(); }
  const VertexAccessor &End() const { return vertices_.back(); }

  bool operator==(const Path &other) const { return vertices_ == other.vertices_ && edges_ == other.edges_; }

 private:
  // Contains all the vertices in the path.
  std::vector<VertexAccessor> vertices_;
  // Contains all the edges in the path (one less then there are vertices).
  std::vector<EdgeAccessor> edges_;
};

/// Prints the path as `(v0)-[e0]->(v1)<-[e1]-(v2)` using Cypher ids.
inline std::ostream &operator<<(std::ostream &os, const Path &path) {
  const auto &vertices = path.vertices();
  const auto &edges = path.edges();
  os << "(" << vertices[0].CypherId() << ")";
  for (size_t i = 0; i < edges.size(); ++i) {
    const bool forward = edges[i].From() == vertices[i];
    os << (forward ? "-[" : "<-[") << edges[i].CypherId() << (forward ? "]->" : "]-");
    os << "(" << vertices[i + 1].CypherId() << ")";
  }
  return os;
}

}  // namespace hopgraph::query
