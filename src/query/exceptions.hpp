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

#include <string>

#include <fmt/core.h>
#include <fmt/format.h>

#include "storage/result.hpp"
#include "utils/exceptions.hpp"

namespace hopgraph::query {

/**
 * @brief Base class of all query related exceptions. All exceptions derived
 * from this one are errors of the pattern or its inputs, i. e. evaluating the
 * same pattern on unchanged data fails again.
 */
class QueryException : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(QueryException)
};

class SemanticException : public QueryException {
 public:
  using QueryException::QueryException;
  SemanticException() : QueryException("") {}
  SPECIALIZE_GET_EXCEPTION_NAME(SemanticException)
};

class UnboundVariableError : public SemanticException {
 public:
  explicit UnboundVariableError(const std::string &name) : SemanticException("Unbound variable: " + name + ".") {}
  SPECIALIZE_GET_EXCEPTION_NAME(UnboundVariableError)
};

class UnprovidedParameterError : public QueryException {
 public:
  using QueryException::QueryException;
  SPECIALIZE_GET_EXCEPTION_NAME(UnprovidedParameterError)
};

class QueryRuntimeException : public QueryException {
 public:
  using QueryException::QueryException;
  SPECIALIZE_GET_EXCEPTION_NAME(QueryRuntimeException)
};

/**
 * An exception raised by the TypedValue system. Typically when
 * trying to perform operations (such as addition) on TypedValues
 * of incompatible Types.
 */
class TypedValueException : public QueryException {
 public:
  using QueryException::QueryException;
  SPECIALIZE_GET_EXCEPTION_NAME(TypedValueException)
};

/// Raised when the underlying store fails while a pattern is evaluated.
/// The original storage error is kept so callers can react to it.
class StorageErrorException : public QueryRuntimeException {
 public:
  explicit StorageErrorException(storage::Error error)
      : QueryRuntimeException("Storage error: {}.", storage::ErrorToString(error)), error_(error) {}
  SPECIALIZE_GET_EXCEPTION_NAME(StorageErrorException)

  storage::Error error() const { return error_; }

 private:
  storage::Error error_;
};

}  // namespace hopgraph::query
