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


#include "utils/logging.hpp"

void hopgraph::logging::AssertFailed(const std::source_location &location, const char *expression,
                                     const std::string &message) {
  if (message.empty()) {
    spdlog::critical("Assertion '{}' failed in {}:{} ({})", expression, location.file_name(), location.line(),
                     location.function_name());
  } else {
    spdlog::critical("Assertion '{}' failed in {}:{} ({}): {}", expression, location.file_name(), location.line(),
                     location.function_name(), message);
  }
  spdlog::default_logger()->flush();
  std::terminate();
}
