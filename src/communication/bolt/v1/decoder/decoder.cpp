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

#include "communication/bolt/v1/decoder/decoder.hpp"

#include <string>
#include <utility>

#include "communication/bolt/v1/exceptions.hpp"
#include "utils/logging.hpp"
#include "utils/temporal.hpp"
#include "utils/timezone.hpp"

namespace chronobolt::communication::bolt {
namespace {

int64_t ReadInt(const std::vector<WireValue> &fields, const size_t index, const Signature signature) {
  const auto &field = fields[index];
  if (field.type() != WireValue::Type::Int) {
    spdlog::debug("Rejected {} structure, field {} is a {}.", SignatureName(signature), index,
                  TypeName(field.type()));
    throw MalformedValueException("Field {} of a {} structure should be an int, got {}.", index,
                                  SignatureName(signature), TypeName(field.type()));
  }
  return field.ValueInt();
}

const std::string &ReadString(const std::vector<WireValue> &fields, const size_t index, const Signature signature) {
  const auto &field = fields[index];
  if (field.type() != WireValue::Type::String) {
    spdlog::debug("Rejected {} structure, field {} is a {}.", SignatureName(signature), index,
                  TypeName(field.type()));
    throw MalformedValueException("Field {} of a {} structure should be a string, got {}.", index,
                                  SignatureName(signature), TypeName(field.type()));
  }
  return field.ValueString();
}

// The offset is checked before it's narrowed.
int32_t ReadOffset(const std::vector<WireValue> &fields, const size_t index, const Signature signature) {
  const auto offset = ReadInt(fields, index, signature);
  if (offset < -utils::kMaxOffsetSeconds || offset > utils::kMaxOffsetSeconds) {
    spdlog::debug("Rejected {} structure, offset {} is out of range.", SignatureName(signature), offset);
    throw MalformedValueException("Offset {} of a {} structure should be between {} and {} seconds.", offset,
                                  SignatureName(signature), -utils::kMaxOffsetSeconds, utils::kMaxOffsetSeconds);
  }
  return static_cast<int32_t>(offset);
}

Value ReadTemporal(const Signature signature, const std::vector<WireValue> &fields) {
  switch (signature) {
    case Signature::Duration:
      return Value(utils::Duration({.months = ReadInt(fields, 0, signature),
                                    .days = ReadInt(fields, 1, signature),
                                    .seconds = ReadInt(fields, 2, signature),
                                    .nanoseconds = ReadInt(fields, 3, signature)}));
    case Signature::Date:
      return Value(utils::Date::FromDaysSinceEpoch(ReadInt(fields, 0, signature)));
    case Signature::LocalTime:
      return Value(utils::LocalTime::FromNanosecondOfDay(ReadInt(fields, 0, signature)));
    case Signature::Time: {
      const auto local_time = utils::LocalTime::FromNanosecondOfDay(ReadInt(fields, 0, signature));
      return Value(utils::OffsetTime(local_time, ReadOffset(fields, 1, signature)));
    }
    case Signature::LocalDateTime:
      return Value(utils::LocalDateTime::FromEpochSecond(ReadInt(fields, 0, signature), ReadInt(fields, 1, signature)));
    case Signature::DateTime: {
      const auto epoch_second = ReadInt(fields, 0, signature);
      const auto nanosecond = ReadInt(fields, 1, signature);
      return Value(utils::OffsetDateTime::FromEpoch(epoch_second, nanosecond, ReadOffset(fields, 2, signature)));
    }
    case Signature::DateTimeZoneId: {
      const auto epoch_second = ReadInt(fields, 0, signature);
      const auto nanosecond = ReadInt(fields, 1, signature);
      // An unknown zone is reported as is, it is not a malformed value.
      const utils::Timezone timezone(ReadString(fields, 2, signature));
      return Value(utils::ZonedDateTime::FromEpoch(epoch_second, nanosecond, timezone));
    }
  }
  throw UnsupportedTypeException("Unsupported structure signature {}.", static_cast<int>(signature));
}

}  // namespace

Value::Type ToValueType(const Signature signature) {
  switch (signature) {
    case Signature::Duration:
      return Value::Type::Duration;
    case Signature::Date:
      return Value::Type::Date;
    case Signature::LocalTime:
      return Value::Type::LocalTime;
    case Signature::Time:
      return Value::Type::OffsetTime;
    case Signature::LocalDateTime:
      return Value::Type::LocalDateTime;
    case Signature::DateTime:
      return Value::Type::OffsetDateTime;
    case Signature::DateTimeZoneId:
      return Value::Type::ZonedDateTime;
  }
  throw UnsupportedTypeException("Unsupported structure signature {}.", static_cast<int>(signature));
}

Value DecodeStructure(const uint8_t signature, const std::vector<WireValue> &fields) {
  const auto maybe_signature = ToSignature(signature);
  if (!maybe_signature) {
    spdlog::debug("Rejected structure with unknown signature 0x{:02x}.", signature);
    throw UnsupportedTypeException("Unsupported structure signature 0x{:02x}.", signature);
  }

  if (fields.size() != FieldCount(*maybe_signature)) {
    spdlog::debug("Rejected {} structure with {} fields.", SignatureName(*maybe_signature), fields.size());
    throw MalformedValueException("A {} structure should have {} fields, got {}.", SignatureName(*maybe_signature),
                                  FieldCount(*maybe_signature), fields.size());
  }

  try {
    return ReadTemporal(*maybe_signature, fields);
  } catch (const utils::temporal::RangeException &e) {
    spdlog::debug("Rejected {} structure: {}", SignatureName(*maybe_signature), e.what());
    throw MalformedValueException("Invalid {} structure: {}", SignatureName(*maybe_signature), e.what());
  }
}

Value DecodeStructure(const Structure &structure) { return DecodeStructure(structure.signature, structure.fields); }

Value Decode(const Structure &structure, const Value::Type expected_type) {
  const auto signature = ToSignature(structure.signature);
  if (signature && ToValueType(*signature) != expected_type) {
    spdlog::debug("Rejected {} structure, expected a {}.", SignatureName(*signature), TypeName(expected_type));
    throw MalformedValueException("Expected a {} structure, got {}.", TypeName(expected_type),
                                  SignatureName(*signature));
  }
  return DecodeStructure(structure);
}

Value Decode(const WireValue &value) {
  switch (value.type()) {
    case WireValue::Type::Null:
      return {};
    case WireValue::Type::Bool:
      return Value(value.ValueBool());
    case WireValue::Type::Int:
      return Value(value.ValueInt());
    case WireValue::Type::Double:
      return Value(value.ValueDouble());
    case WireValue::Type::String:
      return Value(value.ValueString());
    case WireValue::Type::List: {
      Value::TList list;
      list.reserve(value.ValueList().size());
      for (const auto &v : value.ValueList()) list.push_back(Decode(v));
      return Value(std::move(list));
    }
    case WireValue::Type::Map: {
      Value::TMap map;
      for (const auto &kv : value.ValueMap()) map.emplace(kv.first, Decode(kv.second));
      return Value(std::move(map));
    }
    case WireValue::Type::Structure:
      return DecodeStructure(value.ValueStructure());
  }
  throw UnsupportedTypeException("Unsupported wire value type {}.", TypeName(value.type()));
}

}  // namespace chronobolt::communication::bolt
