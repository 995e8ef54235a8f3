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

#include <array>
#include <cstdint>
#include <random>
#include <string_view>

#include "utils/temporal.hpp"

namespace chronobolt::utils {

/// Named zones the generator picks from. They cover both hemispheres, zones
/// with and without daylight saving time and zones whose rules changed often.
inline constexpr std::array<std::string_view, 11> kRandomTimezoneNames{
    "Africa/Harare", "America/Aruba", "Africa/Nairobi",   "America/Dawson",   "Asia/Beirut", "Asia/Tashkent",
    "Canada/Eastern", "Europe/Malta", "Europe/Volgograd", "Indian/Kerguelen", "Etc/GMT+3"};

/**
 * Generates random temporal values.
 *
 * The generator doesn't own the random engine, so a test can seed it and
 * reproduce a failing run. Calls on one generator must not overlap.
 */
class RandomTemporalGenerator {
 public:
  explicit RandomTemporalGenerator(std::mt19937_64 &engine) : engine_(engine) {}

  // Every component gets an independent random sign.
  Duration RandomDuration();
  // Years in [-9998, 9998], days up to 28 so every month is valid.
  Date RandomDate();
  LocalTime RandomLocalTime();
  OffsetTime RandomOffsetTime();
  LocalDateTime RandomLocalDateTime();
  // Years in [1900, 2199] for the date time kinds with a zone.
  OffsetDateTime RandomOffsetDateTime();
  ZonedDateTime RandomZonedDateTime();
  /// @throw UnknownZoneException
  ZonedDateTime RandomZonedDateTime(std::string_view timezone_name);

  /// Uniform in [from, to].
  int64_t RandomInt(int64_t from, int64_t to);

 private:
  int64_t RandomSign();
  int32_t RandomOffset();
  DateParameters RandomDateParameters(int64_t min_year, int64_t max_year);
  LocalTimeParameters RandomLocalTimeParameters();

  std::mt19937_64 &engine_;
};

}  // namespace chronobolt::utils
