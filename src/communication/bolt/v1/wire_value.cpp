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

#include "communication/bolt/v1/wire_value.hpp"

#include <iomanip>
#include <ostream>

#include "communication/bolt/v1/codes.hpp"
#include "communication/bolt/v1/exceptions.hpp"
#include "utils/algorithm.hpp"

namespace chronobolt::communication::bolt {

bool Structure::operator==(const Structure &other) const {
  return signature == other.signature && fields == other.fields;
}

#define DEF_GETTER_BY_VAL(type_param, type_enum, getter, alternative)        \
  type_param WireValue::getter() const {                                     \
    if (type() != Type::type_enum) {                                         \
      throw ValueException("Expected a wire {}, got {}.", #type_enum, TypeName(type())); \
    }                                                                        \
    return std::get<alternative>(value_);                                    \
  }

DEF_GETTER_BY_VAL(bool, Bool, ValueBool, bool)
DEF_GETTER_BY_VAL(int64_t, Int, ValueInt, int64_t)
DEF_GETTER_BY_VAL(double, Double, ValueDouble, double)

#undef DEF_GETTER_BY_VAL

#define DEF_GETTER_BY_REF(type_param, type_enum, getter, alternative)        \
  const type_param &WireValue::getter() const {                              \
    if (type() != Type::type_enum) {                                         \
      throw ValueException("Expected a wire {}, got {}.", #type_enum, TypeName(type())); \
    }                                                                        \
    return std::get<alternative>(value_);                                    \
  }

DEF_GETTER_BY_REF(std::string, String, ValueString, std::string)
DEF_GETTER_BY_REF(WireValue::TList, List, ValueList, TList)
DEF_GETTER_BY_REF(WireValue::TMap, Map, ValueMap, TMap)
DEF_GETTER_BY_REF(Structure, Structure, ValueStructure, Structure)

#undef DEF_GETTER_BY_REF

bool WireValue::operator==(const WireValue &other) const { return value_ == other.value_; }

std::string_view TypeName(const WireValue::Type type) {
  switch (type) {
    case WireValue::Type::Null:
      return "null";
    case WireValue::Type::Bool:
      return "bool";
    case WireValue::Type::Int:
      return "int";
    case WireValue::Type::Double:
      return "double";
    case WireValue::Type::String:
      return "string";
    case WireValue::Type::List:
      return "list";
    case WireValue::Type::Map:
      return "map";
    case WireValue::Type::Structure:
      return "structure";
  }
  return "unknown";
}

std::ostream &operator<<(std::ostream &os, const WireValue::Type type) { return os << TypeName(type); }

std::ostream &operator<<(std::ostream &os, const Structure &structure) {
  const auto signature = ToSignature(structure.signature);
  if (signature) {
    os << SignatureName(*signature);
  } else {
    os << "0x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(structure.signature) << std::dec;
  }
  os << "(";
  utils::PrintIterable(os, structure.fields);
  return os << ")";
}

std::ostream &operator<<(std::ostream &os, const WireValue &value) {
  switch (value.type()) {
    case WireValue::Type::Null:
      return os << "Null";
    case WireValue::Type::Bool:
      return os << (value.ValueBool() ? "true" : "false");
    case WireValue::Type::Int:
      return os << value.ValueInt();
    case WireValue::Type::Double:
      return os << value.ValueDouble();
    case WireValue::Type::String:
      return os << std::quoted(value.ValueString());
    case WireValue::Type::List:
      os << "[";
      utils::PrintIterable(os, value.ValueList());
      return os << "]";
    case WireValue::Type::Map:
      os << "{";
      utils::PrintIterable(os, value.ValueMap(), ", ",
                           [](auto &stream, const auto &pair) { stream << pair.first << ": " << pair.second; });
      return os << "}";
    case WireValue::Type::Structure:
      return os << value.ValueStructure();
  }
  return os;
}

}  // namespace chronobolt::communication::bolt
