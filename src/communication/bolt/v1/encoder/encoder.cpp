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

#include "communication/bolt/v1/encoder/encoder.hpp"

#include <string>
#include <utility>
#include <vector>

#include "communication/bolt/v1/exceptions.hpp"
#include "utils/logging.hpp"

namespace chronobolt::communication::bolt {
namespace {

template <typename... TFields>
Structure MakeStructure(const Signature signature, TFields &&...fields) {
  Structure structure{static_cast<uint8_t>(signature), {}};
  structure.fields.reserve(sizeof...(fields));
  (structure.fields.emplace_back(std::forward<TFields>(fields)), ...);
  DCB_ASSERT(structure.fields.size() == FieldCount(signature), "Wrong number of fields in a {} structure",
             SignatureName(signature));
  return structure;
}

}  // namespace

Structure EncodeStructure(const utils::Duration &duration) {
  return MakeStructure(Signature::Duration, duration.Months(), duration.Days(), duration.Seconds(),
                       int64_t{duration.Nanoseconds()});
}

Structure EncodeStructure(const utils::Date &date) { return MakeStructure(Signature::Date, date.DaysSinceEpoch()); }

Structure EncodeStructure(const utils::LocalTime &local_time) {
  return MakeStructure(Signature::LocalTime, local_time.NanosecondOfDay());
}

Structure EncodeStructure(const utils::OffsetTime &offset_time) {
  return MakeStructure(Signature::Time, offset_time.GetLocalTime().NanosecondOfDay(),
                       int64_t{offset_time.OffsetSeconds()});
}

Structure EncodeStructure(const utils::LocalDateTime &local_date_time) {
  return MakeStructure(Signature::LocalDateTime, local_date_time.EpochSecond(),
                       int64_t{local_date_time.GetLocalTime().Nanosecond()});
}

Structure EncodeStructure(const utils::OffsetDateTime &offset_date_time) {
  return MakeStructure(Signature::DateTime, offset_date_time.EpochSecond(),
                       int64_t{offset_date_time.GetLocalDateTime().GetLocalTime().Nanosecond()},
                       int64_t{offset_date_time.OffsetSeconds()});
}

Structure EncodeStructure(const utils::ZonedDateTime &zoned_date_time) {
  return MakeStructure(Signature::DateTimeZoneId, zoned_date_time.EpochSecond(),
                       int64_t{zoned_date_time.GetLocalDateTime().GetLocalTime().Nanosecond()},
                       std::string{zoned_date_time.TimezoneName()});
}

WireValue Encode(const Value &value) {
  switch (value.type()) {
    case Value::Type::Null:
      return WireValue();
    case Value::Type::Bool:
      return WireValue(value.ValueBool());
    case Value::Type::Int:
      return WireValue(value.ValueInt());
    case Value::Type::Double:
      return WireValue(value.ValueDouble());
    case Value::Type::String:
      return WireValue(value.ValueString());
    case Value::Type::List: {
      WireValue::TList list;
      list.reserve(value.ValueList().size());
      for (const auto &v : value.ValueList()) list.push_back(Encode(v));
      return WireValue(std::move(list));
    }
    case Value::Type::Map: {
      WireValue::TMap map;
      for (const auto &kv : value.ValueMap()) map.emplace(kv.first, Encode(kv.second));
      return WireValue(std::move(map));
    }
    case Value::Type::Duration:
      return WireValue(EncodeStructure(value.ValueDuration()));
    case Value::Type::Date:
      return WireValue(EncodeStructure(value.ValueDate()));
    case Value::Type::LocalTime:
      return WireValue(EncodeStructure(value.ValueLocalTime()));
    case Value::Type::OffsetTime:
      return WireValue(EncodeStructure(value.ValueOffsetTime()));
    case Value::Type::LocalDateTime:
      return WireValue(EncodeStructure(value.ValueLocalDateTime()));
    case Value::Type::OffsetDateTime:
      return WireValue(EncodeStructure(value.ValueOffsetDateTime()));
    case Value::Type::ZonedDateTime:
      return WireValue(EncodeStructure(value.ValueZonedDateTime()));
  }
  throw ValueException("Unsupported value type {}.", TypeName(value.type()));
}

}  // namespace chronobolt::communication::bolt
