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
#include <optional>

namespace hopgraph::query {

/// Budget of relationships a single traversal may expand.
class HopsLimit final {
 public:
  explicit HopsLimit(std::optional<int64_t> limit) : limit_(limit) {}

  /// Accounts for one more expanded relationship. Returns false, without
  /// counting it, once the budget is used up.
  bool TryExpand() {
    if (limit_ && expanded_ >= *limit_) {
      reached_ = true;
      return false;
    }
    ++expanded_;
    return true;
  }

  bool IsReached() const { return reached_; }
  int64_t expanded() const { return expanded_; }
  std::optional<int64_t> limit() const { return limit_; }

 private:
  std::optional<int64_t> limit_;
  int64_t expanded_{0};
  bool reached_{false};
};

}  // namespace hopgraph::query
