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

#include <cstdint>
#include <string_view>

namespace hopgraph::storage {

/// Which of a vertex's relationships an expansion uses, relative to that vertex.
enum class EdgeDirection : uint8_t { OUT, IN, BOTH };

constexpr std::string_view EdgeDirectionToString(const EdgeDirection direction) {
  switch (direction) {
    case EdgeDirection::OUT:
      return "OUT";
    case EdgeDirection::IN:
      return "IN";
    case EdgeDirection::BOTH:
      return "BOTH";
  }
  return "UNKNOWN";
}

}  // namespace hopgraph::storage
