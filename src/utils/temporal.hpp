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
#include <iostream>
#include <limits>
#include <string>
#include <string_view>

#include "utils/exceptions.hpp"
#include "utils/timezone.hpp"

namespace chronobolt::utils {

template <typename T>
concept Chrono = requires(T) {
  typename T::rep;
  typename T::period;
};

template <Chrono TFirst, Chrono TSecond>
constexpr auto GetAndSubtractDuration(TSecond &base_duration) {
  const auto duration = std::chrono::duration_cast<TFirst>(base_duration);
  base_duration -= duration;
  return duration.count();
}

template <typename TType>
bool Overflows(const TType &lhs, const TType &rhs) {
  if (lhs > 0 && rhs > 0 && lhs > (std::numeric_limits<TType>::max() - rhs)) [[unlikely]] {
    return true;
  }
  return false;
}

template <typename TType>
bool Underflows(const TType &lhs, const TType &rhs) {
  if (lhs < 0 && rhs < 0 && lhs < (std::numeric_limits<TType>::min() - rhs)) [[unlikely]] {
    return true;
  }
  return false;
}

namespace temporal {
struct RangeException : public utils::BasicException {
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(RangeException)
};
}  // namespace temporal

inline constexpr int64_t kMaxNanosecondOfSecond = 999'999'999;
inline constexpr int64_t kNanosecondsInDay = std::chrono::nanoseconds{std::chrono::days{1}}.count();
inline constexpr int64_t kSecondsInDay = std::chrono::seconds{std::chrono::days{1}}.count();
inline constexpr int64_t kMinYear = static_cast<int>(std::chrono::year::min());
inline constexpr int64_t kMaxYear = static_cast<int>(std::chrono::year::max());

// Renders an offset east of UTC as +HH:MM, or +HH:MM:SS when it has a seconds part.
std::string OffsetToString(int32_t offset_seconds);

struct DurationParameters {
  int64_t months{0};
  int64_t days{0};
  int64_t seconds{0};
  int64_t nanoseconds{0};

  bool operator==(const DurationParameters &) const = default;
};

/**
 * Amount of time split into components that are never normalized into each other.
 * The nanoseconds are the non-negative fraction of the second, counted in the direction of
 * the seconds component.
 */
class Duration {
 public:
  explicit Duration() : Duration{DurationParameters{}} {}
  explicit Duration(const DurationParameters &parameters);

  auto operator<=>(const Duration &) const = default;

  int64_t Months() const { return months_; }
  int64_t Days() const { return days_; }
  int64_t Seconds() const { return seconds_; }
  int32_t Nanoseconds() const { return nanoseconds_; }

  int64_t MillisecondsOfSecond() const;
  int64_t MicrosecondsOfSecond() const;
  int64_t NanosecondsOfSecond() const;

  std::string ToString() const;

  friend std::ostream &operator<<(std::ostream &os, const Duration &dur) { return os << dur.ToString(); }

 private:
  int64_t months_;
  int64_t days_;
  int64_t seconds_;
  int32_t nanoseconds_;
};

struct DateParameters {
  int64_t year{0};
  int64_t month{1};
  int64_t day{1};

  bool operator==(const DateParameters &) const = default;
};

// Proleptic Gregorian date without a time zone.
class Date {
 public:
  explicit Date() : Date{DateParameters{}} {}
  explicit Date(const DateParameters &date_parameters);

  static Date FromDaysSinceEpoch(int64_t days);

  auto operator<=>(const Date &) const = default;

  int32_t Year() const { return year_; }
  uint8_t Month() const { return month_; }
  uint8_t Day() const { return day_; }

  int64_t DaysSinceEpoch() const;
  std::string ToString() const;

  friend std::ostream &operator<<(std::ostream &os, const Date &date) { return os << date.ToString(); }

 private:
  int32_t year_;
  uint8_t month_;
  uint8_t day_;
};

struct LocalTimeParameters {
  int64_t hour{0};
  int64_t minute{0};
  int64_t second{0};
  int64_t nanosecond{0};

  bool operator==(const LocalTimeParameters &) const = default;
};

// Wall clock time of day. It carries no date and no zone.
class LocalTime {
 public:
  explicit LocalTime() : LocalTime{LocalTimeParameters{}} {}
  explicit LocalTime(const LocalTimeParameters &local_time_parameters);

  static LocalTime FromNanosecondOfDay(int64_t nanoseconds);

  auto operator<=>(const LocalTime &) const = default;

  uint8_t Hour() const { return hour_; }
  uint8_t Minute() const { return minute_; }
  uint8_t Second() const { return second_; }
  int32_t Nanosecond() const { return nanosecond_; }

  int64_t MillisecondsOfSecond() const;
  int64_t MicrosecondsOfSecond() const;
  int64_t NanosecondsOfSecond() const;

  // Epoch means the start of the day, i.e. midnight
  int64_t SecondOfDay() const;
  int64_t NanosecondOfDay() const;
  std::string ToString() const;

  friend std::ostream &operator<<(std::ostream &os, const LocalTime &lt) { return os << lt.ToString(); }

 private:
  uint8_t hour_;
  uint8_t minute_;
  uint8_t second_;
  int32_t nanosecond_;
};

class OffsetTime {
 public:
  explicit OffsetTime(const LocalTime &local_time, int32_t offset_seconds);

  bool operator==(const OffsetTime &) const = default;

  const LocalTime &GetLocalTime() const { return local_time_; }
  int32_t OffsetSeconds() const { return offset_seconds_; }
  std::string Offset() const { return OffsetToString(offset_seconds_); }

  std::string ToString() const;

  friend std::ostream &operator<<(std::ostream &os, const OffsetTime &ot) { return os << ot.ToString(); }

 private:
  LocalTime local_time_;
  int32_t offset_seconds_;
};

// Wall clock date and time. Ambiguous or skipped local instants are kept as they are.
class LocalDateTime {
 public:
  explicit LocalDateTime() = default;
  explicit LocalDateTime(const DateParameters &date_parameters, const LocalTimeParameters &local_time_parameters);
  explicit LocalDateTime(const Date &date, const LocalTime &local_time);

  // Seconds are counted as if the wall clock were at UTC.
  static LocalDateTime FromEpochSecond(int64_t epoch_second, int64_t nanosecond);

  auto operator<=>(const LocalDateTime &) const = default;

  const Date &GetDate() const { return date_; }
  const LocalTime &GetLocalTime() const { return local_time_; }

  int64_t EpochSecond() const;
  std::string ToString() const;

  friend std::ostream &operator<<(std::ostream &os, const LocalDateTime &ldt) { return os << ldt.ToString(); }

 private:
  Date date_;
  LocalTime local_time_;
};

class OffsetDateTime {
 public:
  explicit OffsetDateTime(const LocalDateTime &local_date_time, int32_t offset_seconds);

  // The epoch second is the UTC instant.
  static OffsetDateTime FromEpoch(int64_t epoch_second, int64_t nanosecond, int32_t offset_seconds);

  bool operator==(const OffsetDateTime &) const = default;

  const LocalDateTime &GetLocalDateTime() const { return local_date_time_; }
  int32_t OffsetSeconds() const { return offset_seconds_; }
  std::string Offset() const { return OffsetToString(offset_seconds_); }

  int64_t EpochSecond() const;
  std::string ToString() const;

  friend std::ostream &operator<<(std::ostream &os, const OffsetDateTime &odt) { return os << odt.ToString(); }

 private:
  LocalDateTime local_date_time_;
  int32_t offset_seconds_;
};

/**
 * Date and time in a named zone.
 *
 * The offset is never given by the caller. It is resolved from the zone rules at the wall clock
 * time: ambiguous times take the offset in effect before the transition, and times skipped by a
 * transition are moved forward by the length of the gap.
 */
class ZonedDateTime {
 public:
  explicit ZonedDateTime(const LocalDateTime &local_date_time, const Timezone &timezone);
  explicit ZonedDateTime(const LocalDateTime &local_date_time, std::string_view timezone_name);

  // The epoch second is the UTC instant.
  static ZonedDateTime FromEpoch(int64_t epoch_second, int64_t nanosecond, const Timezone &timezone);

  bool operator==(const ZonedDateTime &) const = default;

  const LocalDateTime &GetLocalDateTime() const { return local_date_time_; }
  const Timezone &GetTimezone() const { return timezone_; }
  std::string_view TimezoneName() const { return timezone_.TimezoneName(); }
  int32_t OffsetSeconds() const { return offset_seconds_; }
  std::string Offset() const { return OffsetToString(offset_seconds_); }

  int64_t EpochSecond() const;
  std::string ToString() const;

  friend std::ostream &operator<<(std::ostream &os, const ZonedDateTime &zdt) { return os << zdt.ToString(); }

 private:
  ZonedDateTime(const LocalDateTime &local_date_time, const Timezone &timezone, int32_t offset_seconds);

  LocalDateTime local_date_time_;
  Timezone timezone_;
  int32_t offset_seconds_;
};

}  // namespace chronobolt::utils
