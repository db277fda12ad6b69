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

#include "utils/result.hpp"

namespace hopgraph::storage {

enum class Error : uint8_t {
  DELETED_OBJECT,
  STORAGE_CLOSED,
};

constexpr std::string_view ErrorToString(const Error error) {
  switch (error) {
    case Error::DELETED_OBJECT:
      return "DELETED_OBJECT";
    case Error::STORAGE_CLOSED:
      return "STORAGE_CLOSED";
  }
  return "UNKNOWN";
}

template <class TValue>
using Result = utils::BasicResult<Error, TValue>;

}  // namespace hopgraph::storage
