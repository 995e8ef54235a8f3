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

#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "communication/bolt/v1/codes.hpp"
#include "communication/bolt/v1/decoder/decoder.hpp"
#include "communication/bolt/v1/exceptions.hpp"
#include "communication/bolt/v1/value.hpp"
#include "communication/bolt/v1/wire_value.hpp"
#include "utils/temporal.hpp"
#include "utils/timezone.hpp"

using chronobolt::communication::bolt::MalformedValueException;
using chronobolt::communication::bolt::Signature;
using chronobolt::communication::bolt::Structure;
using chronobolt::communication::bolt::UnsupportedTypeException;
using chronobolt::communication::bolt::Value;
using chronobolt::communication::bolt::WireValue;

namespace {

template <typename T>
constexpr uint8_t Cast(T marker) {
  return static_cast<uint8_t>(marker);
}

Value DecodeFields(const Signature signature, std::vector<WireValue> fields) {
  return chronobolt::communication::bolt::Decode(WireValue(Structure{Cast(signature), std::move(fields)}));
}

}  // namespace

TEST(BoltDecoder, Primitives) {
  EXPECT_TRUE(chronobolt::communication::bolt::Decode(WireValue()).IsNull());
  EXPECT_EQ(chronobolt::communication::bolt::Decode(WireValue(false)), Value(false));
  EXPECT_EQ(chronobolt::communication::bolt::Decode(WireValue(123)), Value(123));
  EXPECT_EQ(chronobolt::communication::bolt::Decode(WireValue(-0.5)), Value(-0.5));
  EXPECT_EQ(chronobolt::communication::bolt::Decode(WireValue("abc")), Value("abc"));
}

TEST(BoltDecoder, DateOld) {
  const auto dv = DecodeFields(Signature::Date, {WireValue(0)});
  ASSERT_EQ(dv.type(), Value::Type::Date);
  EXPECT_EQ(dv.ValueDate(), chronobolt::utils::Date({1970, 1, 1}));
}

TEST(BoltDecoder, DateRecent) {
  const auto dv = DecodeFields(Signature::Date, {WireValue(18828)});
  EXPECT_EQ(dv.ValueDate(), chronobolt::utils::Date({2021, 7, 20}));
}

TEST(BoltDecoder, Duration) {
  const auto dv =
      DecodeFields(Signature::Duration, {WireValue(16), WireValue(45), WireValue(120), WireValue(187'309'812)});
  ASSERT_EQ(dv.type(), Value::Type::Duration);
  const auto &duration = dv.ValueDuration();
  EXPECT_EQ(duration, chronobolt::utils::Duration({16, 45, 120, 187'309'812}));
  EXPECT_EQ(duration.MillisecondsOfSecond(), 187);
  EXPECT_EQ(duration.MicrosecondsOfSecond(), 187'309);
  EXPECT_EQ(duration.NanosecondsOfSecond(), 187'309'812);
}

TEST(BoltDecoder, LocalTime) {
  const auto dv = DecodeFields(Signature::LocalTime, {WireValue(int64_t{86'399'999'999'999})});
  EXPECT_EQ(dv.ValueLocalTime(), chronobolt::utils::LocalTime({23, 59, 59, 999'999'999}));
}

TEST(BoltDecoder, OffsetTime) {
  const auto dv = DecodeFields(Signature::Time, {WireValue(int64_t{45'296'789'012'587}), WireValue(-5400)});
  ASSERT_EQ(dv.type(), Value::Type::OffsetTime);
  const auto &offset_time = dv.ValueOffsetTime();
  EXPECT_EQ(offset_time.GetLocalTime(), chronobolt::utils::LocalTime({12, 34, 56, 789'012'587}));
  EXPECT_EQ(offset_time.OffsetSeconds(), -5400);
  EXPECT_EQ(offset_time.Offset(), "-01:30");
}

TEST(BoltDecoder, LocalDateTime) {
  const auto dv = DecodeFields(Signature::LocalDateTime, {WireValue(int64_t{-3'489'783'001}), WireValue(999'999'999)});
  EXPECT_EQ(dv.ValueLocalDateTime(), chronobolt::utils::LocalDateTime({1859, 5, 31}, {23, 49, 59, 999'999'999}));
}

TEST(BoltDecoder, OffsetDateTime) {
  const auto dv =
      DecodeFields(Signature::DateTime, {WireValue(203'517'296 + 5400), WireValue(789'012'587), WireValue(-5400)});
  ASSERT_EQ(dv.type(), Value::Type::OffsetDateTime);
  const auto &offset_date_time = dv.ValueOffsetDateTime();
  EXPECT_EQ(offset_date_time.GetLocalDateTime(),
            chronobolt::utils::LocalDateTime({1976, 6, 13}, {12, 34, 56, 789'012'587}));
  EXPECT_EQ(offset_date_time.Offset(), "-01:30");
}

TEST(BoltDecoder, ZonedDateTimeUsesZoneRules) {
  const auto dv = DecodeFields(Signature::DateTimeZoneId, {WireValue(int64_t{-334'113'001}), WireValue(999'999'999),
                                                          WireValue("Europe/London")});
  ASSERT_EQ(dv.type(), Value::Type::ZonedDateTime);
  const auto &zoned = dv.ValueZonedDateTime();
  // The wall clock is derived from the zone, not from UTC.
  EXPECT_EQ(zoned.GetLocalDateTime(), chronobolt::utils::LocalDateTime({1959, 5, 31}, {23, 49, 59, 999'999'999}));
  EXPECT_EQ(zoned.OffsetSeconds(), chronobolt::utils::ResolveOffset("Europe/London", zoned.GetLocalDateTime()));
  EXPECT_EQ(zoned.TimezoneName(), "Europe/London");
}

TEST(BoltDecoder, ZonedDateTimeAfterTransition) {
  // 2021-03-14T07:30:00Z is 03:30 daylight time in New York.
  const auto dv = DecodeFields(Signature::DateTimeZoneId,
                                  {WireValue(int64_t{1'615'707'000}), WireValue(0), WireValue("America/New_York")});
  EXPECT_EQ(dv.ValueZonedDateTime().GetLocalDateTime(),
            chronobolt::utils::LocalDateTime({2021, 3, 14}, {3, 30, 0, 0}));
  EXPECT_EQ(dv.ValueZonedDateTime().OffsetSeconds(), -14'400);
}

TEST(BoltDecoder, UnknownZone) {
  EXPECT_THROW(DecodeFields(Signature::DateTimeZoneId, {WireValue(0), WireValue(0), WireValue("Nowhere/Special")}),
               chronobolt::utils::UnknownZoneException);
  EXPECT_THROW(DecodeFields(Signature::DateTimeZoneId,
                            {WireValue(0), WireValue(0), WireValue("file:/usr/share/zoneinfo/Europe/London")}),
               chronobolt::utils::UnknownZoneException);
  EXPECT_THROW(
      DecodeFields(Signature::DateTimeZoneId, {WireValue(0), WireValue(0), WireValue("Fixed/UTC+05:00:00")}),
      chronobolt::utils::UnknownZoneException);
}

TEST(BoltDecoder, UnknownSignature) {
  EXPECT_THROW(chronobolt::communication::bolt::Decode(WireValue(Structure{0x58, {WireValue(1)}})),
               UnsupportedTypeException);
  EXPECT_THROW(chronobolt::communication::bolt::DecodeStructure(0x00, {}), UnsupportedTypeException);
}

TEST(BoltDecoder, WrongArity) {
  EXPECT_THROW(DecodeFields(Signature::Date, {}), MalformedValueException);
  EXPECT_THROW(DecodeFields(Signature::Date, {WireValue(1), WireValue(2)}), MalformedValueException);
  EXPECT_THROW(DecodeFields(Signature::Duration, {WireValue(1), WireValue(2), WireValue(3)}),
               MalformedValueException);
  EXPECT_THROW(DecodeFields(Signature::DateTimeZoneId, {WireValue(0), WireValue(0)}), MalformedValueException);
}

TEST(BoltDecoder, WrongFieldType) {
  EXPECT_THROW(DecodeFields(Signature::Date, {WireValue("2021-07-20")}), MalformedValueException);
  EXPECT_THROW(DecodeFields(Signature::LocalTime, {WireValue(1.0)}), MalformedValueException);
  EXPECT_THROW(DecodeFields(Signature::DateTimeZoneId, {WireValue(0), WireValue(0), WireValue(3600)}),
               MalformedValueException);
  EXPECT_THROW(DecodeFields(Signature::DateTime, {WireValue(0), WireValue(0), WireValue()}),
               MalformedValueException);
}

TEST(BoltDecoder, FieldOutOfRange) {
  EXPECT_THROW(DecodeFields(Signature::Duration, {WireValue(0), WireValue(0), WireValue(0), WireValue(1'000'000'000)}),
               MalformedValueException);
  EXPECT_THROW(DecodeFields(Signature::Duration, {WireValue(0), WireValue(0), WireValue(0), WireValue(-1)}),
               MalformedValueException);
  // hour 24
  EXPECT_THROW(DecodeFields(Signature::LocalTime, {WireValue(int64_t{86'400'000'000'000})}),
               MalformedValueException);
  EXPECT_THROW(DecodeFields(Signature::Time, {WireValue(0), WireValue(64'801)}), MalformedValueException);
  EXPECT_THROW(DecodeFields(Signature::Time, {WireValue(0), WireValue(int64_t{1} << 40)}), MalformedValueException);
  EXPECT_THROW(DecodeFields(Signature::LocalDateTime, {WireValue(0), WireValue(1'000'000'000)}),
               MalformedValueException);
  EXPECT_THROW(DecodeFields(Signature::Date, {WireValue(std::numeric_limits<int64_t>::max())}),
               MalformedValueException);
  EXPECT_THROW(DecodeFields(Signature::DateTimeZoneId,
                               {WireValue(int64_t{1'000'000'000'000'000}), WireValue(0), WireValue("Europe/London")}),
               MalformedValueException);
}

TEST(BoltDecoder, DecodingExceptionsShareABase) {
  EXPECT_THROW(DecodeFields(Signature::Date, {}), chronobolt::communication::bolt::DecodingException);
  EXPECT_THROW(chronobolt::communication::bolt::DecodeStructure(0x7f, {}),
               chronobolt::communication::bolt::DecodingException);
}

TEST(BoltDecoder, ExpectedType) {
  const Structure date{Cast(Signature::Date), {WireValue(9084)}};
  const auto dv = chronobolt::communication::bolt::Decode(date, Value::Type::Date);
  EXPECT_EQ(dv.ValueDate(), chronobolt::utils::Date({1994, 11, 15}));

  EXPECT_THROW(chronobolt::communication::bolt::Decode(date, Value::Type::LocalDateTime), MalformedValueException);
  EXPECT_THROW(chronobolt::communication::bolt::Decode(Structure{0x01, {}}, Value::Type::Date),
               UnsupportedTypeException);
}

TEST(BoltDecoder, Containers) {
  const WireValue list(WireValue::TList{WireValue(Structure{Cast(Signature::Date), {WireValue(2355)}}), WireValue(1),
                                        WireValue(WireValue::TList{})});
  const auto decoded = chronobolt::communication::bolt::Decode(list);
  ASSERT_EQ(decoded.type(), Value::Type::List);
  ASSERT_EQ(decoded.ValueList().size(), 3);
  EXPECT_EQ(decoded.ValueList()[0].ValueDate(), chronobolt::utils::Date({1976, 6, 13}));
  EXPECT_EQ(decoded.ValueList()[1], Value(1));
  EXPECT_EQ(decoded.ValueList()[2], Value(Value::TList{}));

  const WireValue map(WireValue::TMap{{"t", WireValue(Structure{Cast(Signature::LocalTime), {WireValue(0)}})}});
  const auto decoded_map = chronobolt::communication::bolt::Decode(map);
  EXPECT_EQ(decoded_map.ValueMap().at("t").ValueLocalTime(), chronobolt::utils::LocalTime({0, 0, 0, 0}));
}

TEST(BoltDecoder, ContainerAbortsOnFirstFailure) {
  const WireValue list(WireValue::TList{WireValue(Structure{Cast(Signature::Date), {WireValue(0)}}),
                                        WireValue(Structure{Cast(Signature::LocalTime), {WireValue(-1)}}),
                                        WireValue(Structure{0x58, {}})});
  EXPECT_THROW(chronobolt::communication::bolt::Decode(list), MalformedValueException);

  const Structure bad_zone{Cast(Signature::DateTimeZoneId), {WireValue(0), WireValue(0), WireValue("Bad/Zone")}};
  const WireValue map(WireValue::TMap{{"a", WireValue(bad_zone)}});
  EXPECT_THROW(chronobolt::communication::bolt::Decode(map), chronobolt::utils::UnknownZoneException);
}
