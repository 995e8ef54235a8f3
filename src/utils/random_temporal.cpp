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

#include "utils/random_temporal.hpp"

#include <limits>

namespace chronobolt::utils {
namespace {

constexpr int64_t kMaxRandomYear = 9998;
constexpr int64_t kMinZonedYear = 1900;
constexpr int64_t kMaxZonedYear = 2199;

}  // namespace

int64_t RandomTemporalGenerator::RandomInt(const int64_t from, const int64_t to) {
  return std::uniform_int_distribution<int64_t>{from, to}(engine_);
}

int64_t RandomTemporalGenerator::RandomSign() { return RandomInt(0, 1) == 0 ? -1 : 1; }

int32_t RandomTemporalGenerator::RandomOffset() {
  return static_cast<int32_t>(RandomSign() * RandomInt(0, kMaxOffsetSeconds - 1));
}

DateParameters RandomTemporalGenerator::RandomDateParameters(const int64_t min_year, const int64_t max_year) {
  return {.year = RandomInt(min_year, max_year), .month = RandomInt(1, 12), .day = RandomInt(1, 28)};
}

LocalTimeParameters RandomTemporalGenerator::RandomLocalTimeParameters() {
  return {.hour = RandomInt(0, 23),
          .minute = RandomInt(0, 59),
          .second = RandomInt(0, 59),
          .nanosecond = RandomInt(0, kMaxNanosecondOfSecond)};
}

Duration RandomTemporalGenerator::RandomDuration() {
  constexpr auto max = std::numeric_limits<int64_t>::max();
  return Duration({.months = RandomSign() * RandomInt(0, max),
                   .days = RandomSign() * RandomInt(0, max),
                   .seconds = RandomSign() * RandomInt(0, max),
                   .nanoseconds = RandomInt(0, kMaxNanosecondOfSecond)});
}

Date RandomTemporalGenerator::RandomDate() { return Date(RandomDateParameters(-kMaxRandomYear, kMaxRandomYear)); }

LocalTime RandomTemporalGenerator::RandomLocalTime() { return LocalTime(RandomLocalTimeParameters()); }

OffsetTime RandomTemporalGenerator::RandomOffsetTime() {
  const auto local_time = RandomLocalTime();
  return OffsetTime(local_time, RandomOffset());
}

LocalDateTime RandomTemporalGenerator::RandomLocalDateTime() {
  const auto date_parameters = RandomDateParameters(-kMaxRandomYear, kMaxRandomYear);
  return LocalDateTime(date_parameters, RandomLocalTimeParameters());
}

OffsetDateTime RandomTemporalGenerator::RandomOffsetDateTime() {
  const auto date_parameters = RandomDateParameters(kMinZonedYear, kMaxZonedYear);
  const LocalDateTime local_date_time(date_parameters, RandomLocalTimeParameters());
  return OffsetDateTime(local_date_time, RandomOffset());
}

ZonedDateTime RandomTemporalGenerator::RandomZonedDateTime() {
  const auto zone_index = RandomInt(0, static_cast<int64_t>(kRandomTimezoneNames.size()) - 1);
  return RandomZonedDateTime(kRandomTimezoneNames[zone_index]);
}

ZonedDateTime RandomTemporalGenerator::RandomZonedDateTime(const std::string_view timezone_name) {
  const auto date_parameters = RandomDateParameters(kMinZonedYear, kMaxZonedYear);
  const LocalDateTime local_date_time(date_parameters, RandomLocalTimeParameters());
  return ZonedDateTime(local_date_time, timezone_name);
}

}  // namespace chronobolt::utils
