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


#include "flags/traversal.hpp"

#include <cstdint>
#include <limits>

#include "utils/flag_validation.hpp"

// NOLINTNEXTLINE (cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_int64(traversal_hops_limit, -1,
                       "Maximum number of relationships a single traversal may expand. -1 means no limit.",
                       FLAG_IN_RANGE(-1, std::numeric_limits<int64_t>::max()));

// NOLINTNEXTLINE (cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_bool(trace_rejected_candidates, false,
            "Log every relationship rejected by a hop predicate. Requires --log_level=TRACE.");

namespace hopgraph::flags {

query::TraversalConfig TraversalConfigFromFlags() {
  query::TraversalConfig config;
  if (FLAGS_traversal_hops_limit >= 0) config.hops_limit = FLAGS_traversal_hops_limit;
  config.trace_rejected_candidates = FLAGS_trace_rejected_candidates;
  return config;
}

}  // namespace hopgraph::flags
