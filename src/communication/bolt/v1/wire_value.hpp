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

namespace chronobolt::communication::bolt {

class WireValue;

/**
 * A tagged tuple as exchanged with the transport: a one byte signature
 * followed by an ordered list of fields.
 */
struct Structure {
  uint8_t signature;
  std::vector<WireValue> fields;

  bool operator==(const Structure &other) const;
};

/**
 * A value in the form the transport frames onto the wire. Temporal values are
 * carried as structures, everything else as the corresponding primitive or
 * container.
 */
class WireValue {
 public:
  /** A value type. Each type corresponds to exactly one C++ type */
  enum class Type : unsigned { Null, Bool, Int, Double, String, List, Map, Structure };

  // WireValue is an incomplete type at this point and std::map with an
  // incomplete value type is not guaranteed by the standard. libstdc++ and
  // libc++ both support it; std::vector explicitly does since C++17.
  using TList = std::vector<WireValue>;
  using TMap = std::map<std::string, WireValue>;

  /** Construct a Null value. */
  WireValue() = default;

  explicit WireValue(bool value) : value_(value) {}
  explicit WireValue(int value) : value_(int64_t{value}) {}
  explicit WireValue(int64_t value) : value_(value) {}
  explicit WireValue(double value) : value_(value) {}
  explicit WireValue(const char *value) : value_(std::string(value)) {}
  explicit WireValue(std::string value) : value_(std::move(value)) {}
  explicit WireValue(TList value) : value_(std::move(value)) {}
  explicit WireValue(TMap value) : value_(std::move(value)) {}
  explicit WireValue(Structure value) : value_(std::move(value)) {}

  Type type() const { return static_cast<Type>(value_.index()); }

  bool IsNull() const { return type() == Type::Null; }

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
  const Structure &ValueStructure() const;

  bool operator==(const WireValue &other) const;

  friend std::ostream &operator<<(std::ostream &os, const WireValue &value);

 private:
  // The order of the alternatives follows Type.
  std::variant<std::monostate, bool, int64_t, double, std::string, TList, TMap, Structure> value_;
};

std::string_view TypeName(WireValue::Type type);
std::ostream &operator<<(std::ostream &os, WireValue::Type type);
std::ostream &operator<<(std::ostream &os, const Structure &structure);

}  // namespace chronobolt::communication::bolt
