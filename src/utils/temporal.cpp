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

#include "utils/temporal.hpp"

#include <chrono>
#include <cstdlib>
#include <string>

#include "utils/exceptions.hpp"

namespace chronobolt::utils {
namespace {

constexpr bool IsInBounds(const auto low, const auto high, const auto value) { return low <= value && value <= high; }

constexpr bool IsValidDay(const int64_t day, const int64_t month, const int64_t year) {
  return std::chrono::year_month_day(std::chrono::year{static_cast<int>(year)},
                                     std::chrono::month{static_cast<unsigned>(month)},
                                     std::chrono::day{static_cast<unsigned>(day)})
      .ok();
}

constexpr int64_t DaysSinceEpoch(const int64_t year, const int64_t month, const int64_t day) {
  namespace chrono = std::chrono;
  const auto ymd = chrono::year_month_day(chrono::year{static_cast<int>(year)},
                                          chrono::month{static_cast<unsigned>(month)},
                                          chrono::day{static_cast<unsigned>(day)});
  return chrono::sys_days(ymd).time_since_epoch().count();
}

constexpr int64_t kMinDaysSinceEpoch = DaysSinceEpoch(kMinYear, 1, 1);
constexpr int64_t kMaxDaysSinceEpoch = DaysSinceEpoch(kMaxYear, 12, 31);

void CheckOffset(const int32_t offset_seconds, const std::string_view type_name) {
  if (!IsInBounds(-kMaxOffsetSeconds, kMaxOffsetSeconds, offset_seconds)) {
    throw temporal::RangeException(
        "Creating {} with invalid offset parameter. The value should be an integer between {} and {} seconds.",
        type_name, -kMaxOffsetSeconds, kMaxOffsetSeconds);
  }
}

void CheckNanosecond(const int64_t nanosecond, const std::string_view type_name) {
  if (!IsInBounds(0, kMaxNanosecondOfSecond, nanosecond)) {
    throw temporal::RangeException(
        "Creating {} with invalid nanosecond parameter. The value should be an integer between 0 and {}.", type_name,
        kMaxNanosecondOfSecond);
  }
}

int64_t AddOffset(const int64_t epoch_second, const int32_t offset_seconds) {
  const int64_t offset = offset_seconds;
  if (Overflows(epoch_second, offset) || Underflows(epoch_second, offset)) {
    throw temporal::RangeException("Epoch second {} with offset {} is out of range.", epoch_second, offset);
  }
  return epoch_second + offset;
}

std::string FormatYear(const int32_t year) {
  if (year < 0) {
    return fmt::format("-{:0>4}", -static_cast<int64_t>(year));
  }
  if (year > 9999) {
    return fmt::format("+{}", year);
  }
  return fmt::format("{:0>4}", year);
}

}  // namespace

std::string OffsetToString(const int32_t offset_seconds) {
  const char sign = offset_seconds < 0 ? '-' : '+';
  auto remaining = std::chrono::seconds(std::abs(static_cast<int64_t>(offset_seconds)));
  const auto hours = GetAndSubtractDuration<std::chrono::hours>(remaining);
  const auto minutes = GetAndSubtractDuration<std::chrono::minutes>(remaining);
  if (remaining.count() != 0) {
    return fmt::format("{}{:0>2}:{:0>2}:{:0>2}", sign, hours, minutes, remaining.count());
  }
  return fmt::format("{}{:0>2}:{:0>2}", sign, hours, minutes);
}

Duration::Duration(const DurationParameters &parameters) {
  CheckNanosecond(parameters.nanoseconds, "a Duration");
  months_ = parameters.months;
  days_ = parameters.days;
  seconds_ = parameters.seconds;
  nanoseconds_ = static_cast<int32_t>(parameters.nanoseconds);
}

int64_t Duration::MillisecondsOfSecond() const { return nanoseconds_ / 1'000'000; }

int64_t Duration::MicrosecondsOfSecond() const { return nanoseconds_ / 1'000; }

int64_t Duration::NanosecondsOfSecond() const { return nanoseconds_; }

std::string Duration::ToString() const {
  // Format P[n]M[n]DT[n].[nnnnnnnnn]S, the components are not normalized.
  return fmt::format("P{}M{}DT{}.{:0>9}S", months_, days_, seconds_, nanoseconds_);
}

Date::Date(const DateParameters &date_parameters) {
  if (!IsInBounds(kMinYear, kMaxYear, date_parameters.year)) {
    throw temporal::RangeException(
        "Creating a Date with invalid year parameter. The value should be an integer between {} and {}.", kMinYear,
        kMaxYear);
  }

  if (!IsInBounds(1, 12, date_parameters.month)) {
    throw temporal::RangeException(
        "Creating a Date with invalid month parameter. The value should be an integer between 1 and 12.");
  }

  if (!IsInBounds(1, 31, date_parameters.day) ||
      !IsValidDay(date_parameters.day, date_parameters.month, date_parameters.year)) {
    throw temporal::RangeException(
        "Creating a Date with invalid day parameter. The value should be an integer between 1 and 31, depending on the "
        "month and year.");
  }

  year_ = static_cast<int32_t>(date_parameters.year);
  month_ = static_cast<uint8_t>(date_parameters.month);
  day_ = static_cast<uint8_t>(date_parameters.day);
}

Date Date::FromDaysSinceEpoch(const int64_t days) {
  if (!IsInBounds(kMinDaysSinceEpoch, kMaxDaysSinceEpoch, days)) {
    throw temporal::RangeException("Date {} days from the epoch is out of range. The value should be between {} and {}.",
                                   days, kMinDaysSinceEpoch, kMaxDaysSinceEpoch);
  }
  namespace chrono = std::chrono;
  const auto ymd = chrono::year_month_day(chrono::sys_days(chrono::days(days)));
  return Date({static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day())});
}

int64_t Date::DaysSinceEpoch() const { return utils::DaysSinceEpoch(year_, month_, day_); }

std::string Date::ToString() const {
  return fmt::format("{}-{:0>2}-{:0>2}", FormatYear(year_), static_cast<int>(month_), static_cast<int>(day_));
}

LocalTime::LocalTime(const LocalTimeParameters &local_time_parameters) {
  if (!IsInBounds(0, 23, local_time_parameters.hour)) {
    throw temporal::RangeException("Creating a LocalTime with invalid hour parameter.");
  }

  if (!IsInBounds(0, 59, local_time_parameters.minute)) {
    throw temporal::RangeException("Creating a LocalTime with invalid minute parameter.");
  }

  // Leap seconds are not representable
  if (!IsInBounds(0, 59, local_time_parameters.second)) {
    throw temporal::RangeException("Creating a LocalTime with invalid second parameter.");
  }

  CheckNanosecond(local_time_parameters.nanosecond, "a LocalTime");

  hour_ = static_cast<uint8_t>(local_time_parameters.hour);
  minute_ = static_cast<uint8_t>(local_time_parameters.minute);
  second_ = static_cast<uint8_t>(local_time_parameters.second);
  nanosecond_ = static_cast<int32_t>(local_time_parameters.nanosecond);
}

LocalTime LocalTime::FromNanosecondOfDay(const int64_t nanoseconds) {
  if (!IsInBounds(0, kNanosecondsInDay - 1, nanoseconds)) {
    throw temporal::RangeException("Invalid LocalTime of {} nanoseconds since midnight.", nanoseconds);
  }

  namespace chrono = std::chrono;
  auto chrono_nanoseconds = chrono::nanoseconds(nanoseconds);
  const auto hour = GetAndSubtractDuration<chrono::hours>(chrono_nanoseconds);
  const auto minute = GetAndSubtractDuration<chrono::minutes>(chrono_nanoseconds);
  const auto second = GetAndSubtractDuration<chrono::seconds>(chrono_nanoseconds);
  return LocalTime({hour, minute, second, chrono_nanoseconds.count()});
}

int64_t LocalTime::MillisecondsOfSecond() const { return nanosecond_ / 1'000'000; }

int64_t LocalTime::MicrosecondsOfSecond() const { return nanosecond_ / 1'000; }

int64_t LocalTime::NanosecondsOfSecond() const { return nanosecond_; }

int64_t LocalTime::SecondOfDay() const {
  namespace chrono = std::chrono;
  return (chrono::hours{hour_} + chrono::minutes{minute_} + chrono::seconds{second_}).count();
}

int64_t LocalTime::NanosecondOfDay() const {
  namespace chrono = std::chrono;
  return (chrono::seconds{SecondOfDay()} + chrono::nanoseconds{nanosecond_}).count();
}

std::string LocalTime::ToString() const {
  return fmt::format("{:0>2}:{:0>2}:{:0>2}.{:0>9}", static_cast<int>(hour_), static_cast<int>(minute_),
                     static_cast<int>(second_), nanosecond_);
}

OffsetTime::OffsetTime(const LocalTime &local_time, const int32_t offset_seconds)
    : local_time_(local_time), offset_seconds_(offset_seconds) {
  CheckOffset(offset_seconds, "an OffsetTime");
}

std::string OffsetTime::ToString() const { return local_time_.ToString() + Offset(); }

LocalDateTime::LocalDateTime(const DateParameters &date_parameters, const LocalTimeParameters &local_time_parameters)
    : date_(date_parameters), local_time_(local_time_parameters) {}

LocalDateTime::LocalDateTime(const Date &date, const LocalTime &local_time) : date_(date), local_time_(local_time) {}

LocalDateTime LocalDateTime::FromEpochSecond(const int64_t epoch_second, const int64_t nanosecond) {
  CheckNanosecond(nanosecond, "a LocalDateTime");

  auto days = epoch_second / kSecondsInDay;
  if (epoch_second % kSecondsInDay < 0) {
    --days;
  }
  // the date is checked first so the second of the day can't overflow
  const auto date = Date::FromDaysSinceEpoch(days);
  const auto second_of_day = epoch_second - days * kSecondsInDay;
  const auto nanosecond_of_day = std::chrono::nanoseconds{std::chrono::seconds{second_of_day}}.count() + nanosecond;
  return LocalDateTime(date, LocalTime::FromNanosecondOfDay(nanosecond_of_day));
}

int64_t LocalDateTime::EpochSecond() const { return date_.DaysSinceEpoch() * kSecondsInDay + local_time_.SecondOfDay(); }

std::string LocalDateTime::ToString() const { return date_.ToString() + 'T' + local_time_.ToString(); }

OffsetDateTime::OffsetDateTime(const LocalDateTime &local_date_time, const int32_t offset_seconds)
    : local_date_time_(local_date_time), offset_seconds_(offset_seconds) {
  CheckOffset(offset_seconds, "an OffsetDateTime");
}

OffsetDateTime OffsetDateTime::FromEpoch(const int64_t epoch_second, const int64_t nanosecond,
                                         const int32_t offset_seconds) {
  CheckOffset(offset_seconds, "an OffsetDateTime");
  return OffsetDateTime(LocalDateTime::FromEpochSecond(AddOffset(epoch_second, offset_seconds), nanosecond),
                        offset_seconds);
}

int64_t OffsetDateTime::EpochSecond() const { return local_date_time_.EpochSecond() - offset_seconds_; }

std::string OffsetDateTime::ToString() const { return local_date_time_.ToString() + Offset(); }

ZonedDateTime::ZonedDateTime(const LocalDateTime &local_date_time, const Timezone &timezone)
    : ZonedDateTime{FromEpoch(local_date_time.EpochSecond() - timezone.OffsetAtLocal(local_date_time.EpochSecond()),
                              local_date_time.GetLocalTime().Nanosecond(), timezone)} {}

ZonedDateTime::ZonedDateTime(const LocalDateTime &local_date_time, const std::string_view timezone_name)
    : ZonedDateTime{local_date_time, Timezone(timezone_name)} {}

ZonedDateTime::ZonedDateTime(const LocalDateTime &local_date_time, const Timezone &timezone,
                             const int32_t offset_seconds)
    : local_date_time_(local_date_time), timezone_(timezone), offset_seconds_(offset_seconds) {}

ZonedDateTime ZonedDateTime::FromEpoch(const int64_t epoch_second, const int64_t nanosecond,
                                       const Timezone &timezone) {
  if (!timezone.IsNamed()) {
    throw temporal::RangeException(
        "Creating a ZonedDateTime with a fixed offset timezone. Use an OffsetDateTime for fixed offsets.");
  }
  const auto offset_seconds = timezone.OffsetAt(epoch_second);
  return ZonedDateTime(LocalDateTime::FromEpochSecond(AddOffset(epoch_second, offset_seconds), nanosecond), timezone,
                       offset_seconds);
}

int64_t ZonedDateTime::EpochSecond() const { return local_date_time_.EpochSecond() - offset_seconds_; }

std::string ZonedDateTime::ToString() const {
  return fmt::format("{}{}[{}]", local_date_time_.ToString(), Offset(), TimezoneName());
}

}  // namespace chronobolt::utils
