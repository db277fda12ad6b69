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


#include <gflags/gflags.h>
#include <gtest/gtest.h>

#include "flags/log_level.hpp"
#include "flags/traversal.hpp"

TEST(Flags, LogLevel) {
  EXPECT_TRUE(hopgraph::flags::ValidLogLevel("TRACE"));
  EXPECT_TRUE(hopgraph::flags::ValidLogLevel("WARNING"));
  EXPECT_FALSE(hopgraph::flags::ValidLogLevel(""));
  EXPECT_FALSE(hopgraph::flags::ValidLogLevel("VERBOSE"));

  EXPECT_EQ(hopgraph::flags::LogLevelToEnum("DEBUG"), spdlog::level::debug);
  EXPECT_FALSE(hopgraph::flags::LogLevelToEnum("debugging"));
}

TEST(Flags, TraversalConfig) {
  gflags::FlagSaver saver;

  auto config = hopgraph::flags::TraversalConfigFromFlags();
  EXPECT_FALSE(config.hops_limit);
  EXPECT_FALSE(config.trace_rejected_candidates);

  FLAGS_traversal_hops_limit = 0;
  FLAGS_trace_rejected_candidates = true;
  config = hopgraph::flags::TraversalConfigFromFlags();
  ASSERT_TRUE(config.hops_limit);
  EXPECT_EQ(*config.hops_limit, 0);
  EXPECT_TRUE(config.trace_rejected_candidates);
}

TEST(Flags, HopsLimitValidation) {
  gflags::FlagSaver saver;
  EXPECT_TRUE(gflags::SetCommandLineOption("traversal_hops_limit", "10").size());
  EXPECT_EQ(FLAGS_traversal_hops_limit, 10);
  EXPECT_TRUE(gflags::SetCommandLineOption("traversal_hops_limit", "-2").empty());
  EXPECT_EQ(FLAGS_traversal_hops_limit, 10);
}
