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

#include <gflags/gflags.h>

#include <array>
#include <cstdint>
#include <iostream>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/ostream.h>

#include "communication/bolt/v1/decoder/decoder.hpp"
#include "communication/bolt/v1/encoder/encoder.hpp"
#include "communication/bolt/v1/random_value.hpp"
#include "communication/bolt/v1/value.hpp"
#include "flags/log_level.hpp"
#include "utils/enum.hpp"
#include "utils/exceptions.hpp"
#include "utils/flag_validation.hpp"
#include "utils/logging.hpp"
#include "utils/random_temporal.hpp"

using chronobolt::communication::bolt::Value;
using namespace std::string_view_literals;

namespace {

inline constexpr std::array kind_mappings{std::pair{"duration"sv, Value::Type::Duration},
                                          std::pair{"date"sv, Value::Type::Date},
                                          std::pair{"local_time"sv, Value::Type::LocalTime},
                                          std::pair{"offset_time"sv, Value::Type::OffsetTime},
                                          std::pair{"local_date_time"sv, Value::Type::LocalDateTime},
                                          std::pair{"offset_date_time"sv, Value::Type::OffsetDateTime},
                                          std::pair{"zoned_date_time"sv, Value::Type::ZonedDateTime}};

const std::string kind_help_string =
    fmt::format("Kind of the generated values. Allowed values: all, {}",
                chronobolt::utils::GetAllowedEnumValuesString(kind_mappings));

}  // namespace

DEFINE_VALIDATED_string(kind, "all", kind_help_string.c_str(), {
  if (value == "all" || chronobolt::utils::StringToEnum<Value::Type>(value, kind_mappings)) return true;
  std::cout << "Invalid value for --" << flagname << ". Allowed values: all, "
            << chronobolt::utils::GetAllowedEnumValuesString(kind_mappings) << std::endl;
  return false;
});
DEFINE_VALIDATED_uint64(count, 1000, "Number of values generated per kind.", FLAG_IN_RANGE(0, 1'000'000));
DEFINE_uint64(seed, 0, "Seed of the random engine, 0 picks a random seed.");
DEFINE_string(zone, "", "Zone of the generated zoned date times. Empty picks a random zone for every value.");
DEFINE_bool(as_list, false, "Send the values of a kind as a single list instead of one by one.");

namespace {

Value Generate(chronobolt::utils::RandomTemporalGenerator &generator, const Value::Type type) {
  if (type == Value::Type::ZonedDateTime && !FLAGS_zone.empty()) {
    return Value(generator.RandomZonedDateTime(FLAGS_zone));
  }
  return chronobolt::communication::bolt::RandomTemporalValue(generator, type);
}

// Returns the number of values that didn't come back unchanged.
uint64_t RoundTrip(const Value &value) {
  try {
    const auto wire_value = chronobolt::communication::bolt::Encode(value);
    SPDLOG_TRACE("Encoded {} as {}.", fmt::streamed(value), fmt::streamed(wire_value));
    const auto decoded = chronobolt::communication::bolt::Decode(wire_value);
    if (decoded == value) {
      return 0;
    }
    spdlog::error("Value {} was decoded as {}.", fmt::streamed(value), fmt::streamed(decoded));
  } catch (const chronobolt::utils::BasicException &e) {
    spdlog::error("Round trip of {} failed with {}: {}", fmt::streamed(value), e.name(), e.what());
  }
  return 1;
}

uint64_t RoundTripKind(chronobolt::utils::RandomTemporalGenerator &generator, const Value::Type type) {
  std::vector<Value> values;
  values.reserve(FLAGS_count);
  for (uint64_t i = 0; i < FLAGS_count; ++i) {
    values.push_back(Generate(generator, type));
  }

  uint64_t mismatches = 0;
  if (FLAGS_as_list) {
    mismatches = RoundTrip(Value(std::move(values)));
  } else {
    for (const auto &value : values) mismatches += RoundTrip(value);
  }
  spdlog::info("Round trip of {} {} values finished with {} mismatches.", FLAGS_count,
               chronobolt::communication::bolt::TypeName(type), mismatches);
  return mismatches;
}

}  // namespace

int main(int argc, char **argv) {
  gflags::SetUsageMessage("Encodes random temporal values to their wire form and decodes them back");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  chronobolt::flags::InitializeLogger();

  const uint64_t seed = FLAGS_seed != 0 ? FLAGS_seed : std::random_device{}();
  spdlog::info("Using seed {}.", seed);
  std::mt19937_64 engine(seed);
  chronobolt::utils::RandomTemporalGenerator generator(engine);

  std::vector<Value::Type> types;
  if (FLAGS_kind == "all") {
    for (const auto &[name, type] : kind_mappings) types.push_back(type);
  } else {
    const auto type = chronobolt::utils::StringToEnum<Value::Type>(FLAGS_kind, kind_mappings);
    CB_ASSERT(type, "Unknown kind {}", FLAGS_kind);
    types.push_back(*type);
  }

  uint64_t mismatches = 0;
  for (const auto type : types) {
    try {
      mismatches += RoundTripKind(generator, type);
    } catch (const chronobolt::utils::BasicException &e) {
      spdlog::error("Unable to generate {} values: {}", chronobolt::communication::bolt::TypeName(type), e.what());
      return 1;
    }
  }

  if (mismatches != 0) {
    spdlog::error("{} values didn't survive the round trip.", mismatches);
    return 1;
  }
  return 0;
}
