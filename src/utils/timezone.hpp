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

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <variant>

#include <absl/time/time.h>

#include "utils/exceptions.hpp"

namespace chronobolt::utils {

class LocalDateTime;

struct UnknownZoneException : public utils::BasicException {
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(UnknownZoneException)
};

inline constexpr int32_t kMaxOffsetSeconds = std::chrono::seconds{std::chrono::hours{18}}.count();

/// Zone and link catalog of the system tzdata, `tzdata.zi` in the zoneinfo directory.
std::filesystem::path DefaultTimezoneCatalog();

/// True if every `/` separated segment of the name is made of `[A-Za-z0-9_+-]` only.
bool IsTimezoneIdentifier(std::string_view name);

/**
 * Process-wide, read-only access to the timezone rule database.
 *
 * The database reads the zone and link names of a tzdata catalog once, when it is constructed,
 * and never changes afterwards. Only listed names are handed to cctz, which loads their rules on
 * first use; a loaded zone is immutable and may be shared between threads. A missing catalog
 * leaves the database empty and every named zone unknown.
 */
class TimezoneDatabase {
 public:
  static const TimezoneDatabase &Instance();

  explicit TimezoneDatabase(const std::filesystem::path &catalog);

  TimezoneDatabase(const TimezoneDatabase &) = delete;
  TimezoneDatabase &operator=(const TimezoneDatabase &) = delete;

  bool Contains(std::string_view timezone_name) const;
  size_t Size() const { return names_.size(); }

  /// @throw UnknownZoneException if the catalog doesn't list the name or cctz has no rules for it
  absl::TimeZone Locate(std::string_view timezone_name) const;

 private:
  std::set<std::string, std::less<>> names_;
};

/**
 * Either a fixed offset east of UTC without a name, or a named zone whose offset follows the
 * rules of the timezone database.
 */
class Timezone {
 private:
  struct NamedZone {
    std::string name;
    absl::TimeZone zone;
  };

  std::variant<std::chrono::seconds, NamedZone> offset_;

 public:
  /// @throw temporal::RangeException if the offset is outside of +-18 hours
  explicit Timezone(std::chrono::seconds offset);
  /// @throw UnknownZoneException
  explicit Timezone(std::string_view timezone_name);

  bool operator==(const Timezone &other) const;

  bool IsNamed() const { return std::holds_alternative<NamedZone>(offset_); }

  std::string_view TimezoneName() const {
    if (!IsNamed()) {
      return "";
    }
    return std::get<NamedZone>(offset_).name;
  }

  // Offset in effect at the given UTC instant.
  int32_t OffsetAt(int64_t epoch_second) const;

  // Offset of the first rule in effect at the given wall clock time. The seconds are counted as
  // if the wall clock were at UTC.
  int32_t OffsetAtLocal(int64_t local_epoch_second) const;
};

/// Offset in effect in the named zone at the given wall clock time.
/// @throw UnknownZoneException
int32_t ResolveOffset(std::string_view timezone_name, const LocalDateTime &local_date_time);

/// Descriptor for a fixed offset without a name.
/// @throw temporal::RangeException
Timezone ResolveFixed(int32_t offset_seconds);

}  // namespace chronobolt::utils
