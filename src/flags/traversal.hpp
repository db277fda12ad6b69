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

#include "gflags/gflags.h"

#include "query/config.hpp"

DECLARE_int64(traversal_hops_limit);
DECLARE_bool(trace_rejected_candidates);

namespace hopgraph::flags {

/// Traversal settings given on the command line.
query::TraversalConfig TraversalConfigFromFlags();

}  // namespace hopgraph::flags
