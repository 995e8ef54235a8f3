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

#include "communication/bolt/v1/random_value.hpp"

#include <utility>

#include "communication/bolt/v1/exceptions.hpp"

namespace chronobolt::communication::bolt {

Value RandomTemporalValue(utils::RandomTemporalGenerator &generator, const Value::Type type) {
  switch (type) {
    case Value::Type::Duration:
      return Value(generator.RandomDuration());
    case Value::Type::Date:
      return Value(generator.RandomDate());
    case Value::Type::LocalTime:
      return Value(generator.RandomLocalTime());
    case Value::Type::OffsetTime:
      return Value(generator.RandomOffsetTime());
    case Value::Type::LocalDateTime:
      return Value(generator.RandomLocalDateTime());
    case Value::Type::OffsetDateTime:
      return Value(generator.RandomOffsetDateTime());
    case Value::Type::ZonedDateTime:
      return Value(generator.RandomZonedDateTime());
    case Value::Type::Null:
    case Value::Type::Bool:
    case Value::Type::Int:
    case Value::Type::Double:
    case Value::Type::String:
    case Value::Type::List:
    case Value::Type::Map:
      break;
  }
  throw ValueException("Can't generate a random {} value.", TypeName(type));
}

Value RandomTemporalList(utils::RandomTemporalGenerator &generator, const Value::Type type, const size_t size) {
  Value::TList list;
  list.reserve(size);
  for (size_t i = 0; i < size; ++i) list.push_back(RandomTemporalValue(generator, type));
  return Value(std::move(list));
}

}  // namespace chronobolt::communication::bolt
