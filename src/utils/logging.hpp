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

// Trace records are compiled in only for debug builds.
#undef SPDLOG_ACTIVE_LEVEL
#ifndef NDEBUG
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#else
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#endif

#include <exception>
#include <source_location>
#include <string>

#include <fmt/format.h>
#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

#include <boost/preprocessor/comparison/equal.hpp>
#include <boost/preprocessor/control/if.hpp>
#include <boost/preprocessor/variadic/size.hpp>

namespace hopgraph::logging {

/// Writes a critical record describing the failed check and terminates.
[[noreturn]] void AssertFailed(const std::source_location &location, const char *expression,
                               const std::string &message);

}  // namespace hopgraph::logging

#define HG_ASSERT_MESSAGE(...) \
  BOOST_PP_IF(BOOST_PP_EQUAL(BOOST_PP_VARIADIC_SIZE(__VA_ARGS__), 0), std::string(), fmt::format(__VA_ARGS__))

/// Checks `expr` in every build. The optional trailing arguments are an fmt
/// format string and its arguments.
#define HG_ASSERT(expr, ...)                                                                                    \
  do {                                                                                                          \
    if (!(expr)) [[unlikely]] {                                                                                 \
      ::hopgraph::logging::AssertFailed(std::source_location::current(), #expr, HG_ASSERT_MESSAGE(__VA_ARGS__)); \
    }                                                                                                           \
  } while (false)

/// Like HG_ASSERT, compiled out of release builds.
#ifndef NDEBUG
#define DHG_ASSERT(expr, ...) HG_ASSERT(expr, __VA_ARGS__)
#else
#define DHG_ASSERT(...) \
  do {                  \
  } while (false)
#endif

#define LOG_FATAL(...)             \
  do {                             \
    spdlog::critical(__VA_ARGS__); \
    std::terminate();              \
  } while (false)
