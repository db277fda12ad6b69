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
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "utils/result.hpp"

namespace hopgraph::utils {

/// Why a string does not name an enum value.
enum class ValidationError : uint8_t { EmptyValue, InvalidValue };

// `mappings` is a range of (std::string_view name, enum value) pairs.

template <class TMappings>
std::string GetAllowedEnumValuesString(const TMappings &mappings) {
  std::vector<std::string_view> names;
  for (const auto &mapping : mappings) names.push_back(mapping.first);
  return fmt::format("{}", fmt::join(names, ", "));
}

template <class TMappings>
auto FindEnumMapping(std::string_view name, const TMappings &mappings) {
  return std::ranges::find_if(mappings, [name](const auto &mapping) { return mapping.first == name; });
}

template <class TMappings>
BasicResult<ValidationError> IsValidEnumValueString(std::string_view name, const TMappings &mappings) {
  if (name.empty()) return ValidationError::EmptyValue;
  if (FindEnumMapping(name, mappings) == std::ranges::end(mappings)) return ValidationError::InvalidValue;
  return {};
}

template <class TEnum, class TMappings>
std::optional<TEnum> StringToEnum(std::string_view name, const TMappings &mappings) {
  auto found = FindEnumMapping(name, mappings);
  if (found == std::ranges::end(mappings)) return std::nullopt;
  return found->second;
}

}  // namespace hopgraph::utils
