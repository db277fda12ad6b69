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


#include "flags/log_level.hpp"

#include <array>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "gflags/gflags.h"
#include "spdlog/common.h"
#include "spdlog/sinks/daily_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

#include "utils/enum.hpp"
#include "utils/flag_validation.hpp"
#include "utils/logging.hpp"

namespace {

using namespace std::string_view_literals;

constexpr std::array kLogLevels{
    std::pair{"TRACE"sv, spdlog::level::trace}, std::pair{"DEBUG"sv, spdlog::level::debug},
    std::pair{"INFO"sv, spdlog::level::info},   std::pair{"WARNING"sv, spdlog::level::warn},
    std::pair{"ERROR"sv, spdlog::level::err},   std::pair{"CRITICAL"sv, spdlog::level::critical}};

// Daily log files kept on disk.
constexpr uint16_t kLogFilesKept = 14;

const std::string kLogLevelHelp =
    fmt::format("Minimum level of logged records, one of: {}", hopgraph::utils::GetAllowedEnumValuesString(kLogLevels));

}  // namespace

// NOLINTNEXTLINE (cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_bool(also_log_to_stderr, false, "Write log records to stderr as well when --log_file is given.");
// NOLINTNEXTLINE (cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(log_file, "", "Base path of the daily rotated log file. Empty logs to stderr only.");
// NOLINTNEXTLINE (cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_string(log_level, "WARNING", kLogLevelHelp.c_str(), { return hopgraph::flags::ValidLogLevel(value); });

namespace hopgraph::flags {

bool ValidLogLevel(std::string_view value) {
  const auto result = utils::IsValidEnumValueString(value, kLogLevels);
  if (!result.HasError()) return true;

  // Flags are validated before any logger exists.
  switch (result.GetError()) {
    case utils::ValidationError::EmptyValue:
      std::cout << "--log_level can't be empty." << std::endl;
      break;
    case utils::ValidationError::InvalidValue:
      std::cout << "Unknown --log_level '" << value << "', expected one of: "
                << utils::GetAllowedEnumValuesString(kLogLevels) << std::endl;
      break;
  }
  return false;
}

std::optional<spdlog::level::level_enum> LogLevelToEnum(std::string_view value) {
  return utils::StringToEnum<spdlog::level::level_enum>(value, kLogLevels);
}

void InitializeLogger() {
  const auto level = LogLevelToEnum(FLAGS_log_level);
  HG_ASSERT(level, "--log_level '{}' passed validation but names no level", FLAGS_log_level);

  // The stderr sink stays first so LogToStderr can find it.
  std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  sinks.front()->set_level(spdlog::level::off);
  if (!FLAGS_log_file.empty()) {
    sinks.emplace_back(
        std::make_shared<spdlog::sinks::daily_file_sink_mt>(FLAGS_log_file, 0, 0, false, kLogFilesKept));
  }

  auto logger = std::make_shared<spdlog::logger>("hopgraph", sinks.begin(), sinks.end());
  logger->set_level(*level);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));

  if (FLAGS_also_log_to_stderr || FLAGS_log_file.empty()) LogToStderr(*level);
}

void LogToStderr(spdlog::level::level_enum log_level) { spdlog::default_logger()->sinks().front()->set_level(log_level); }

}  // namespace hopgraph::flags
