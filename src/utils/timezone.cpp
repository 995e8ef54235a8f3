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

#include "utils/timezone.hpp"

#include <fstream>
#include <sstream>
#include <string>
#include <utility>

#include <absl/time/civil_time.h>

#include "utils/logging.hpp"
#include "utils/temporal.hpp"

namespace chronobolt::utils {
namespace {

constexpr absl::CivilSecond kCivilEpoch{1970, 1, 1, 0, 0, 0};

bool IsIdentifierCharacter(const char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '+' ||
         c == '-';
}

}  // namespace

std::filesystem::path DefaultTimezoneCatalog() { return std::filesystem::path{CHRONOBOLT_ZONEINFO_DIR} / "tzdata.zi"; }

bool IsTimezoneIdentifier(const std::string_view name) {
  size_t segment_length = 0;
  for (const char c : name) {
    if (c == '/') {
      if (segment_length == 0) return false;
      segment_length = 0;
      continue;
    }
    if (!IsIdentifierCharacter(c)) return false;
    ++segment_length;
  }
  return segment_length > 0;
}

// Zones are `Z <name> ...` lines and links are `L <target> <name>` lines of the catalog.
TimezoneDatabase::TimezoneDatabase(const std::filesystem::path &catalog) {
  std::ifstream input(catalog);
  if (!input) {
    spdlog::warn("Timezone catalog {} is not available, named timezones can't be resolved.", catalog.string());
    return;
  }
  std::string line;
  while (std::getline(input, line)) {
    std::istringstream tokens(line);
    std::string kind;
    std::string name;
    tokens >> kind >> name;
    if (kind == "L") {
      std::string link;
      tokens >> link;
      name = std::move(link);
    }
    if ((kind != "Z" && kind != "L") || !IsTimezoneIdentifier(name)) continue;
    names_.insert(std::move(name));
  }
  spdlog::info("Timezone rule database initialized with {} zones from {}.", names_.size(), catalog.string());
}

const TimezoneDatabase &TimezoneDatabase::Instance() {
  static const TimezoneDatabase database(DefaultTimezoneCatalog());
  return database;
}

bool TimezoneDatabase::Contains(const std::string_view timezone_name) const {
  return names_.find(timezone_name) != names_.end();
}

absl::TimeZone TimezoneDatabase::Locate(const std::string_view timezone_name) const {
  // cctz caches every name it is asked for, so only listed zones reach it.
  if (!Contains(timezone_name)) {
    throw UnknownZoneException("Unknown timezone '{}'.", timezone_name);
  }

  absl::TimeZone zone;
  if (!absl::LoadTimeZone(std::string{timezone_name}, &zone)) {
    throw UnknownZoneException("Unknown timezone '{}'.", timezone_name);
  }
  SPDLOG_TRACE("Located timezone {}.", timezone_name);
  return zone;
}

Timezone::Timezone(const std::chrono::seconds offset) : offset_{offset} {
  if (offset.count() < -kMaxOffsetSeconds || offset.count() > kMaxOffsetSeconds) {
    throw temporal::RangeException("Invalid timezone offset {} seconds. The offset should be between {} and {} seconds.",
                                   offset.count(), -kMaxOffsetSeconds, kMaxOffsetSeconds);
  }
}

Timezone::Timezone(const std::string_view timezone_name)
    : offset_{NamedZone{std::string{timezone_name}, TimezoneDatabase::Instance().Locate(timezone_name)}} {}

bool Timezone::operator==(const Timezone &other) const {
  if (IsNamed() != other.IsNamed()) {
    return false;
  }
  if (IsNamed()) {
    return TimezoneName() == other.TimezoneName();
  }
  return std::get<std::chrono::seconds>(offset_) == std::get<std::chrono::seconds>(other.offset_);
}

int32_t Timezone::OffsetAt(const int64_t epoch_second) const {
  if (!IsNamed()) {
    return static_cast<int32_t>(std::get<std::chrono::seconds>(offset_).count());
  }
  return std::get<NamedZone>(offset_).zone.At(absl::FromUnixSeconds(epoch_second)).offset;
}

int32_t Timezone::OffsetAtLocal(const int64_t local_epoch_second) const {
  if (!IsNamed()) {
    return static_cast<int32_t>(std::get<std::chrono::seconds>(offset_).count());
  }
  const auto info = std::get<NamedZone>(offset_).zone.At(kCivilEpoch + local_epoch_second);
  // Repeated and skipped wall clock times both take the pre-transition rule.
  return static_cast<int32_t>(local_epoch_second - absl::ToUnixSeconds(info.pre));
}

int32_t ResolveOffset(const std::string_view timezone_name, const LocalDateTime &local_date_time) {
  return Timezone(timezone_name).OffsetAtLocal(local_date_time.EpochSecond());
}

Timezone ResolveFixed(const int32_t offset_seconds) { return Timezone(std::chrono::seconds{offset_seconds}); }

}  // namespace chronobolt::utils
