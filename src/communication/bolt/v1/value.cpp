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

#include "communication/bolt/v1/value.hpp"

#include <iomanip>
#include <ostream>

#include "communication/bolt/v1/exceptions.hpp"
#include "utils/algorithm.hpp"

namespace chronobolt::communication::bolt {

#define DEF_GETTER_BY_VAL(type_param, type_enum, getter)                                              \
  type_param Value::getter() const {                                                                  \
    if (type() != Type::type_enum) {                                                                  \
      throw ValueException("Expected a {} value, got {}.", TypeName(Type::type_enum), TypeName(type())); \
    }                                                                                                 \
    return std::get<type_param>(value_);                                                              \
  }

DEF_GETTER_BY_VAL(bool, Bool, ValueBool)
DEF_GETTER_BY_VAL(int64_t, Int, ValueInt)
DEF_GETTER_BY_VAL(double, Double, ValueDouble)

#undef DEF_GETTER_BY_VAL

#define DEF_GETTER_BY_REF(type_param, type_enum, getter)                                              \
  const type_param &Value::getter() const {                                                           \
    if (type() != Type::type_enum) {                                                                  \
      throw ValueException("Expected a {} value, got {}.", TypeName(Type::type_enum), TypeName(type())); \
    }                                                                                                 \
    return std::get<type_param>(value_);                                                              \
  }

DEF_GETTER_BY_REF(std::string, String, ValueString)
DEF_GETTER_BY_REF(Value::TList, List, ValueList)
DEF_GETTER_BY_REF(Value::TMap, Map, ValueMap)
DEF_GETTER_BY_REF(utils::Duration, Duration, ValueDuration)
DEF_GETTER_BY_REF(utils::Date, Date, ValueDate)
DEF_GETTER_BY_REF(utils::LocalTime, LocalTime, ValueLocalTime)
DEF_GETTER_BY_REF(utils::OffsetTime, OffsetTime, ValueOffsetTime)
DEF_GETTER_BY_REF(utils::LocalDateTime, LocalDateTime, ValueLocalDateTime)
DEF_GETTER_BY_REF(utils::OffsetDateTime, OffsetDateTime, ValueOffsetDateTime)
DEF_GETTER_BY_REF(utils::ZonedDateTime, ZonedDateTime, ValueZonedDateTime)

#undef DEF_GETTER_BY_REF

bool Value::operator==(const Value &other) const { return value_ == other.value_; }

std::string_view TypeName(const Value::Type type) {
  switch (type) {
    case Value::Type::Null:
      return "null";
    case Value::Type::Bool:
      return "bool";
    case Value::Type::Int:
      return "int";
    case Value::Type::Double:
      return "double";
    case Value::Type::String:
      return "string";
    case Value::Type::List:
      return "list";
    case Value::Type::Map:
      return "map";
    case Value::Type::Duration:
      return "duration";
    case Value::Type::Date:
      return "date";
    case Value::Type::LocalTime:
      return "local_time";
    case Value::Type::OffsetTime:
      return "offset_time";
    case Value::Type::LocalDateTime:
      return "local_date_time";
    case Value::Type::OffsetDateTime:
      return "offset_date_time";
    case Value::Type::ZonedDateTime:
      return "zoned_date_time";
  }
  return "unknown";
}

std::ostream &operator<<(std::ostream &os, const Value::Type type) { return os << TypeName(type); }

std::ostream &operator<<(std::ostream &os, const Value &value) {
  switch (value.type()) {
    case Value::Type::Null:
      return os << "Null";
    case Value::Type::Bool:
      return os << (value.ValueBool() ? "true" : "false");
    case Value::Type::Int:
      return os << value.ValueInt();
    case Value::Type::Double:
      return os << value.ValueDouble();
    case Value::Type::String:
      return os << std::quoted(value.ValueString());
    case Value::Type::List:
      os << "[";
      utils::PrintIterable(os, value.ValueList());
      return os << "]";
    case Value::Type::Map:
      os << "{";
      utils::PrintIterable(os, value.ValueMap(), ", ",
                           [](auto &stream, const auto &pair) { stream << pair.first << ": " << pair.second; });
      return os << "}";
    case Value::Type::Duration:
      return os << value.ValueDuration();
    case Value::Type::Date:
      return os << value.ValueDate();
    case Value::Type::LocalTime:
      return os << value.ValueLocalTime();
    case Value::Type::OffsetTime:
      return os << value.ValueOffsetTime();
    case Value::Type::LocalDateTime:
      return os << value.ValueLocalDateTime();
    case Value::Type::OffsetDateTime:
      return os << value.ValueOffsetDateTime();
    case Value::Type::ZonedDateTime:
      return os << value.ValueZonedDateTime();
  }
  return os;
}

}  // namespace chronobolt::communication::bolt
