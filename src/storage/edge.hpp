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


#include "storage/id_types.hpp"
#include "storage/property_store.hpp"

namespace hopgraph::storage {

struct Vertex;

struct Edge {
  Edge(storage::Gid gid, EdgeTypeId edge_type, Vertex *from_vertex, Vertex *to_vertex)
      : gid(gid), edge_type(edge_type), from_vertex(from_vertex), to_vertex(to_vertex) {}

  storage::Gid gid;
  EdgeTypeId edge_type;
  Vertex *from_vertex;
  Vertex *to_vertex;

  PropertyStore properties;

  bool deleted{false};
};

}  // namespace hopgraph::storage
