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


#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "gflags/gflags.h"

#include "flags/log_level.hpp"
#include "flags/traversal.hpp"
#include "query/context.hpp"
#include "query/db_accessor.hpp"
#include "query/exceptions.hpp"
#include "query/plan/chain_traversal.hpp"
#include "query/plan/expansion_step.hpp"
#include "query/predicates.hpp"
#include "storage/graph.hpp"
#include "utils/logging.hpp"

DEFINE_string(friend_of, "Alice", "Name of the person whose friends' likes are listed.");
DEFINE_int64(min_rating, 3, "Lowest rating of a LIKES relationship that is reported.");

namespace {

using hopgraph::query::TypedValue;

hopgraph::query::VertexAccessor AddNode(hopgraph::query::DbAccessor *dba, const std::string &name) {
  auto vertex = dba->InsertVertex();
  hopgraph::query::ValueOrThrow(
      vertex.SetProperty(dba->NameToProperty("name"), hopgraph::storage::PropertyValue(name)));
  return vertex;
}

void Connect(hopgraph::query::DbAccessor *dba, hopgraph::query::VertexAccessor *from,
             hopgraph::query::VertexAccessor *to, const std::string &type, std::optional<int64_t> rating = {}) {
  auto edge = hopgraph::query::ValueOrThrow(dba->InsertEdge(from, to, dba->NameToEdgeType(type)));
  if (rating) {
    hopgraph::query::ValueOrThrow(
        edge.SetProperty(dba->NameToProperty("rating"), hopgraph::storage::PropertyValue(*rating)));
  }
}

}  // namespace

int main(int argc, char **argv) {
  google::SetUsageMessage("Lists what the friends of a person like");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  hopgraph::flags::InitializeLogger();

  hopgraph::storage::Graph graph;
  hopgraph::query::DbAccessor dba(&graph);

  auto alice = AddNode(&dba, "Alice");
  auto bob = AddNode(&dba, "Bob");
  auto carol = AddNode(&dba, "Carol");
  auto dave = AddNode(&dba, "Dave");
  auto chess = AddNode(&dba, "Chess");
  auto jazz = AddNode(&dba, "Jazz");
  Connect(&dba, &alice, &bob, "KNOWS");
  Connect(&dba, &alice, &carol, "KNOWS");
  Connect(&dba, &dave, &alice, "KNOWS");
  Connect(&dba, &bob, &chess, "LIKES", 5);
  Connect(&dba, &carol, &chess, "LIKES", 2);
  Connect(&dba, &carol, &jazz, "LIKES", 4);

  using hopgraph::query::PropertyComparison;
  auto likes = std::make_shared<hopgraph::query::plan::SingleStep>(
      2, std::vector<std::string>{"LIKES"}, hopgraph::storage::EdgeDirection::OUT, nullptr,
      std::make_shared<PropertyComparison>("r", "rating", PropertyComparison::Op::GE,
                                           hopgraph::query::ParameterLookup{"min_rating"}),
      nullptr);
  auto knows = std::make_shared<hopgraph::query::plan::SingleStep>(
      1, std::vector<std::string>{"KNOWS"}, hopgraph::storage::EdgeDirection::BOTH, likes, nullptr, nullptr);
  spdlog::info("Matching {}", knows->ToString());

  hopgraph::query::ExecutionContext context;
  context.db_accessor = &dba;
  context.evaluation_context.parameters.Add("min_rating", TypedValue(static_cast<int64_t>(FLAGS_min_rating)));
  context.config = hopgraph::flags::TraversalConfigFromFlags();

  std::optional<hopgraph::query::VertexAccessor> start;
  for (auto *person : {&alice, &bob, &carol, &dave}) {
    auto name = dba.NodeOps().GetProperty(*person, "name");
    if (name.IsString() && name.ValueString() == FLAGS_friend_of) start = *person;
  }
  if (!start) {
    std::cerr << "Unknown person " << FLAGS_friend_of << std::endl;
    return EXIT_FAILURE;
  }

  try {
    hopgraph::query::plan::ChainTraversal traversal(knows, context);
    traversal.Run(*start, [&dba](const hopgraph::query::Path &path) {
      const auto names = dba.NodeOps();
      std::cout << path << "  " << names.GetProperty(path.vertices()[1], "name") << " likes "
                << names.GetProperty(path.End(), "name") << std::endl;
      return true;
    });
    if (traversal.hops_limit_reached()) std::cout << "Hops limit reached, the result is incomplete." << std::endl;
  } catch (const hopgraph::query::QueryException &e) {
    spdlog::error("{}: {}", e.name(), e.what());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
