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

#include <utility>
#include <variant>

#include "utils/logging.hpp"

namespace hopgraph::utils {

/// Either a value or an error. Reading the side that is not held is a
/// programming error and terminates.
template <class TError, class TValue = void>
class [[nodiscard]] BasicResult final {
 public:
  using ErrorType = TError;
  using ValueType = TValue;

  BasicResult(const TValue &value) : state_(std::in_place_index<0>, value) {}
  BasicResult(TValue &&value) noexcept : state_(std::in_place_index<0>, std::move(value)) {}
  BasicResult(const TError &error) : state_(std::in_place_index<1>, error) {}
  BasicResult(TError &&error) noexcept : state_(std::in_place_index<1>, std::move(error)) {}

  bool HasValue() const { return state_.index() == 0; }
  bool HasError() const { return state_.index() == 1; }

  TValue &GetValue() & { return Value(); }
  TValue &&GetValue() && { return std::move(Value()); }
  const TValue &GetValue() const & { return Value(); }

  TValue &operator*() & { return Value(); }
  TValue &&operator*() && { return std::move(Value()); }
  const TValue &operator*() const & { return Value(); }

  TValue *operator->() { return &Value(); }
  const TValue *operator->() const { return &Value(); }

  const TError &GetError() const & {
    HG_ASSERT(HasError(), "Reading the error of a successful result");
    return std::get<1>(state_);
  }

 private:
  TValue &Value() {
    HG_ASSERT(HasValue(), "Reading the value of a failed result");
    return std::get<0>(state_);
  }

  const TValue &Value() const {
    HG_ASSERT(HasValue(), "Reading the value of a failed result");
    return std::get<0>(state_);
  }

  std::variant<TValue, TError> state_;
};

/// Result of an operation without a value.
template <class TError>
class [[nodiscard]] BasicResult<TError, void> final {
 public:
  using ErrorType = TError;
  using ValueType = void;

  BasicResult() = default;
  BasicResult(const TError &error) : error_(error), failed_(true) {}
  BasicResult(TError &&error) noexcept : error_(std::move(error)), failed_(true) {}

  bool HasError() const { return failed_; }

  const TError &GetError() const & {
    HG_ASSERT(failed_, "Reading the error of a successful result");
    return error_;
  }

 private:
  TError error_{};
  bool failed_{false};
};

}  // namespace hopgraph::utils
