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
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/sinks/stdout_color_sinks.h>

#include "utils/enum.hpp"
#include "utils/flag_validation.hpp"
#include "utils/logging.hpp"

using namespace std::string_view_literals;

DEFINE_bool(also_log_to_stderr, false, "Log messages go to stderr in addition to stdout.");

namespace {

inline constexpr std::array log_level_mappings{
    std::pair{"TRACE"sv, spdlog::level::trace}, std::pair{"DEBUG"sv, spdlog::level::debug},
    std::pair{"INFO"sv, spdlog::level::info},   std::pair{"WARNING"sv, spdlog::level::warn},
    std::pair{"ERROR"sv, spdlog::level::err},   std::pair{"CRITICAL"sv, spdlog::level::critical}};

const std::string log_level_help_string = fmt::format(
    "Minimum log level. Allowed values: {}", chronobolt::utils::GetAllowedEnumValuesString(log_level_mappings));

}  // namespace

DEFINE_VALIDATED_string(log_level, "WARNING", log_level_help_string.c_str(),
                        { return chronobolt::flags::ValidLogLevel(value); });

bool chronobolt::flags::ValidLogLevel(std::string_view value) {
  if (const auto error = chronobolt::utils::IsValidEnumValueString(value, log_level_mappings); error) {
    switch (*error) {
      case chronobolt::utils::ValidationError::EmptyValue: {
        std::cout << "Log level cannot be empty." << std::endl;
        break;
      }
      case chronobolt::utils::ValidationError::InvalidValue: {
        std::cout << "Invalid value for log level. Allowed values: "
                  << chronobolt::utils::GetAllowedEnumValuesString(log_level_mappings) << std::endl;
        break;
      }
    }
    return false;
  }

  return true;
}

std::optional<spdlog::level::level_enum> chronobolt::flags::LogLevelToEnum(std::string_view value) {
  return chronobolt::utils::StringToEnum<spdlog::level::level_enum>(value, log_level_mappings);
}

void chronobolt::flags::InitializeLogger() {
  const auto log_level = LogLevelToEnum(FLAGS_log_level);
  CB_ASSERT(log_level, "Invalid log level {}", FLAGS_log_level);

  std::vector<spdlog::sink_ptr> sinks;
  sinks.emplace_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (FLAGS_also_log_to_stderr) {
    sinks.emplace_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }

  auto logger = std::make_shared<spdlog::logger>("chronobolt_log", sinks.begin(), sinks.end());
  logger->set_level(*log_level);
  logger->flush_on(spdlog::level::trace);
  spdlog::set_default_logger(std::move(logger));
}
