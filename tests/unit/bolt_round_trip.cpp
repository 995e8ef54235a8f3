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

#include <array>
#include <atomic>
#include <cstdint>
#include <limits>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "communication/bolt/v1/decoder/decoder.hpp"
#include "communication/bolt/v1/encoder/encoder.hpp"
#include "communication/bolt/v1/random_value.hpp"
#include "communication/bolt/v1/value.hpp"
#include "utils/random_temporal.hpp"
#include "utils/temporal.hpp"
#include "utils/timezone.hpp"

using chronobolt::communication::bolt::Value;

namespace {

inline constexpr std::array kTemporalTypes{Value::Type::Duration,      Value::Type::Date,
                                           Value::Type::LocalTime,     Value::Type::OffsetTime,
                                           Value::Type::LocalDateTime, Value::Type::OffsetDateTime,
                                           Value::Type::ZonedDateTime};

Value RoundTrip(const Value &value) {
  return chronobolt::communication::bolt::Decode(chronobolt::communication::bolt::Encode(value));
}

class BoltRoundTrip : public ::testing::TestWithParam<Value::Type> {
 protected:
  std::mt19937_64 engine_{20210720};
  chronobolt::utils::RandomTemporalGenerator generator_{engine_};
};

}  // namespace

TEST_P(BoltRoundTrip, SingleValues) {
  for (int i = 0; i < 500; ++i) {
    const auto value = chronobolt::communication::bolt::RandomTemporalValue(generator_, GetParam());
    ASSERT_EQ(value.type(), GetParam());
    ASSERT_EQ(RoundTrip(value), value);
  }
}

TEST_P(BoltRoundTrip, RandomSizedList) {
  for (int i = 0; i < 3; ++i) {
    const auto size = static_cast<size_t>(generator_.RandomInt(0, 1000));
    const auto list = chronobolt::communication::bolt::RandomTemporalList(generator_, GetParam(), size);
    const auto decoded = RoundTrip(list);
    ASSERT_EQ(decoded.ValueList().size(), size);
    ASSERT_EQ(decoded, list);
  }
}

TEST_P(BoltRoundTrip, LargestList) {
  const auto list = chronobolt::communication::bolt::RandomTemporalList(generator_, GetParam(), 1000);
  ASSERT_EQ(RoundTrip(list), list);
}

TEST_P(BoltRoundTrip, EmptyList) {
  const auto list = chronobolt::communication::bolt::RandomTemporalList(generator_, GetParam(), 0);
  const auto decoded = RoundTrip(list);
  ASSERT_TRUE(decoded.IsList());
  ASSERT_TRUE(decoded.ValueList().empty());
}

INSTANTIATE_TEST_SUITE_P(TemporalTypes, BoltRoundTrip, ::testing::ValuesIn(kTemporalTypes),
                         [](const auto &info) { return std::string(TypeName(info.param)); });

TEST(BoltRoundTripMixed, MapOfMixedValues) {
  std::mt19937_64 engine{42};
  chronobolt::utils::RandomTemporalGenerator generator{engine};
  Value::TMap map;
  for (const auto type : kTemporalTypes) {
    map.emplace(std::string(TypeName(type)), chronobolt::communication::bolt::RandomTemporalValue(generator, type));
  }
  map.emplace("null", Value());
  map.emplace("flag", Value(true));
  map.emplace("count", Value(7));
  map.emplace("ratio", Value(0.5));
  map.emplace("name", Value("Europe/London"));
  map.emplace("empty_list", Value(Value::TList{}));
  map.emplace("empty_map", Value(Value::TMap{}));
  map.emplace("nested", Value(Value::TList{Value(Value::TMap{{"date", Value(generator.RandomDate())}})}));

  const Value value(map);
  const auto decoded = RoundTrip(value);
  ASSERT_EQ(decoded, value);
  ASSERT_TRUE(decoded.ValueMap().at("empty_list").IsList());
  ASSERT_TRUE(decoded.ValueMap().at("empty_map").IsMap());
}

TEST(BoltRoundTripBoundaries, Values) {
  const std::vector<Value> values{
      Value(chronobolt::utils::Duration({0, 0, 0, 0})),
      Value(chronobolt::utils::Duration({std::numeric_limits<int64_t>::min(), std::numeric_limits<int64_t>::max(),
                                         std::numeric_limits<int64_t>::min(), 999'999'999})),
      Value(chronobolt::utils::Date({-32767, 1, 1})),
      Value(chronobolt::utils::Date({32767, 12, 31})),
      Value(chronobolt::utils::LocalTime({0, 0, 0, 0})),
      Value(chronobolt::utils::LocalTime({23, 59, 59, 999'999'999})),
      Value(chronobolt::utils::OffsetTime(chronobolt::utils::LocalTime({0, 0, 0, 0}), 64'800)),
      Value(chronobolt::utils::OffsetTime(chronobolt::utils::LocalTime({23, 59, 59, 999'999'999}), -64'800)),
      Value(chronobolt::utils::LocalDateTime({-32767, 1, 1}, {0, 0, 0, 0})),
      Value(chronobolt::utils::LocalDateTime({32767, 12, 31}, {23, 59, 59, 999'999'999})),
      Value(chronobolt::utils::OffsetDateTime(chronobolt::utils::LocalDateTime({1900, 1, 1}, {0, 0, 0, 0}), 64'800)),
      Value(chronobolt::utils::OffsetDateTime(chronobolt::utils::LocalDateTime({2199, 12, 31}, {23, 59, 59, 0}),
                                              -64'800)),
      Value(chronobolt::utils::ZonedDateTime(chronobolt::utils::LocalDateTime({1959, 5, 31}, {23, 49, 59, 999'999'999}),
                                             "Europe/London")),
      Value(chronobolt::utils::ZonedDateTime(chronobolt::utils::LocalDateTime({2021, 11, 7}, {1, 30, 0, 0}),
                                             "America/New_York")),
      Value(chronobolt::utils::ZonedDateTime(chronobolt::utils::LocalDateTime({2021, 3, 14}, {2, 30, 0, 0}),
                                             "America/New_York")),
  };

  for (const auto &value : values) {
    EXPECT_EQ(RoundTrip(value), value);
  }
}

TEST(BoltRoundTripZoned, OffsetIsRederived) {
  std::mt19937_64 engine{1959};
  chronobolt::utils::RandomTemporalGenerator generator{engine};
  for (int i = 0; i < 200; ++i) {
    const auto zoned = generator.RandomZonedDateTime();
    const auto encoded = chronobolt::communication::bolt::Encode(Value(zoned));
    const auto &fields = encoded.ValueStructure().fields;
    ASSERT_EQ(fields[0].ValueInt(), zoned.EpochSecond());
    ASSERT_EQ(fields[1].ValueInt(), zoned.GetLocalDateTime().GetLocalTime().Nanosecond());
    ASSERT_EQ(fields[2].ValueString(), zoned.TimezoneName());

    const auto decoded = chronobolt::communication::bolt::Decode(encoded).ValueZonedDateTime();
    ASSERT_EQ(decoded.OffsetSeconds(),
              chronobolt::utils::Timezone(zoned.TimezoneName()).OffsetAt(zoned.EpochSecond()));
    ASSERT_EQ(decoded, zoned);
  }
}

TEST(BoltRoundTripConcurrency, ParallelEncodeDecode) {
  constexpr int kThreadCount = 8;
  std::atomic<int> mismatches{0};
  std::vector<std::thread> threads;
  threads.reserve(kThreadCount);
  for (int i = 0; i < kThreadCount; ++i) {
    threads.emplace_back([i, &mismatches] {
      std::mt19937_64 engine(i);
      chronobolt::utils::RandomTemporalGenerator generator{engine};
      for (const auto type : kTemporalTypes) {
        const auto list = chronobolt::communication::bolt::RandomTemporalList(generator, type, 100);
        if (RoundTrip(list) != list) ++mismatches;
      }
    });
  }
  for (auto &thread : threads) thread.join();
  EXPECT_EQ(mismatches.load(), 0);
}
