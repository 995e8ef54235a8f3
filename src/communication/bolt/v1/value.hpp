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

#include <cstdint>
#include <iosfwd>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "utils/temporal.hpp"

namespace chronobolt::communication::bolt {

/**
 * Value is used to exchange values between the application and the wire
 * encoder. It is a closed union over the primitive types, the containers and
 * the seven temporal kinds.
 */
class Value {
 public:
  /** Default constructor, makes Null */
  Value() = default;

  /** Types that can be stored in a Value. */
  enum class Type : unsigned {
    Null,
    Bool,
    Int,
    Double,
    String,
    List,
    Map,
    Duration,
    Date,
    LocalTime,
    OffsetTime,
    LocalDateTime,
    OffsetDateTime,
    ZonedDateTime
  };

  // Value is an incomplete type here, see the note on WireValue.
  using TList = std::vector<Value>;
  using TMap = std::map<std::string, Value>;

  // constructors for primitive types
  explicit Value(bool value) : value_(value) {}
  explicit Value(int value) : value_(int64_t{value}) {}
  explicit Value(int64_t value) : value_(value) {}
  explicit Value(double value) : value_(value) {}

  // constructors for non-primitive types
  explicit Value(const char *value) : value_(std::string(value)) {}
  explicit Value(std::string value) : value_(std::move(value)) {}
  explicit Value(TList value) : value_(std::move(value)) {}
  explicit Value(TMap value) : value_(std::move(value)) {}

  // constructors for temporal types
  explicit Value(const utils::Duration &value) : value_(value) {}
  explicit Value(const utils::Date &value) : value_(value) {}
  explicit Value(const utils::LocalTime &value) : value_(value) {}
  explicit Value(const utils::OffsetTime &value) : value_(value) {}
  explicit Value(const utils::LocalDateTime &value) : value_(value) {}
  explicit Value(const utils::OffsetDateTime &value) : value_(value) {}
  explicit Value(const utils::ZonedDateTime &value) : value_(value) {}

  Type type() const { return static_cast<Type>(value_.index()); }

  bool IsNull() const { return type() == Type::Null; }
  bool IsBool() const { return type() == Type::Bool; }
  bool IsInt() const { return type() == Type::Int; }
  bool IsDouble() const { return type() == Type::Double; }
  bool IsString() const { return type() == Type::String; }
  bool IsList() const { return type() == Type::List; }
  bool IsMap() const { return type() == Type::Map; }
  bool IsTemporal() const { return type() >= Type::Duration; }

  /**
   * Getters for the stored value.
   * @throw ValueException if the value holds another type.
   */
  bool ValueBool() const;
  int64_t ValueInt() const;
  double ValueDouble() const;
  const std::string &ValueString() const;
  const TList &ValueList() const;
  const TMap &ValueMap() const;
  const utils::Duration &ValueDuration() const;
  const utils::Date &ValueDate() const;
  const utils::LocalTime &ValueLocalTime() const;
  const utils::OffsetTime &ValueOffsetTime() const;
  const utils::LocalDateTime &ValueLocalDateTime() const;
  const utils::OffsetDateTime &ValueOffsetDateTime() const;
  const utils::ZonedDateTime &ValueZonedDateTime() const;

  bool operator==(const Value &other) const;

  friend std::ostream &operator<<(std::ostream &os, const Value &value);

 private:
  // The order of the alternatives follows Type.
  std::variant<std::monostate, bool, int64_t, double, std::string, TList, TMap, utils::Duration, utils::Date,
               utils::LocalTime, utils::OffsetTime, utils::LocalDateTime, utils::OffsetDateTime, utils::ZonedDateTime>
      value_;
};

std::string_view TypeName(Value::Type type);
std::ostream &operator<<(std::ostream &os, Value::Type type);

}  // namespace chronobolt::communication::bolt
