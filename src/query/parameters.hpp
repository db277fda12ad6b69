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

#include <map>
#include <string>
#include <string_view>
#include <utility>

#include "query/exceptions.hpp"
#include "query/typed_value.hpp"

/**
 * Encapsulates user provided parameters and provides ways of obtaining
 * them by name.
 */
namespace hopgraph::query {

struct Parameters {
 public:
  /**
   * Adds a value under the given parameter name, replacing a previous one.
   *
   * @param name Parameter name without the leading `$`.
   * @param value
   */
  void Add(std::string name, TypedValue value) { storage_.insert_or_assign(std::move(name), std::move(value)); }

  /**
   *  Returns the value provided for the given parameter name.
   *
   *  @throw UnprovidedParameterError when no value was provided.
   */
  const TypedValue &AtName(std::string_view name) const {
    auto found = storage_.find(name);
    if (found == storage_.end()) throw UnprovidedParameterError("Parameter ${} not provided.", name);
    return found->second;
  }

  bool Contains(std::string_view name) const { return storage_.find(name) != storage_.end(); }

  /** Returns the number of parameters in this container */
  auto size() const { return storage_.size(); }

  auto begin() const { return storage_.begin(); }
  auto end() const { return storage_.end(); }

 private:
  std::map<std::string, TypedValue, std::less<>> storage_;
};

}  // namespace hopgraph::query
