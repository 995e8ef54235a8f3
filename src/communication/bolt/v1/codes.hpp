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

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace chronobolt::communication::bolt {

/**
 * Structure signatures of the temporal types. Each signature is the ASCII code
 * of the tag character the protocol uses for the type.
 */
enum class Signature : uint8_t {
  Duration = 0x45,        // 'E'
  Date = 0x44,            // 'D'
  LocalTime = 0x74,       // 't'
  Time = 0x54,            // 'T'
  LocalDateTime = 0x64,   // 'd'
  DateTime = 0x46,        // 'F'
  DateTimeZoneId = 0x66,  // 'f'
};

/// Number of fields a structure with the given signature carries.
constexpr size_t FieldCount(const Signature signature) {
  switch (signature) {
    case Signature::Duration:
      return 4;
    case Signature::Date:
    case Signature::LocalTime:
      return 1;
    case Signature::Time:
    case Signature::LocalDateTime:
      return 2;
    case Signature::DateTime:
    case Signature::DateTimeZoneId:
      return 3;
  }
  return 0;
}

/// Maps a raw signature byte to a known Signature.
constexpr std::optional<Signature> ToSignature(const uint8_t value) {
  switch (static_cast<Signature>(value)) {
    case Signature::Duration:
    case Signature::Date:
    case Signature::LocalTime:
    case Signature::Time:
    case Signature::LocalDateTime:
    case Signature::DateTime:
    case Signature::DateTimeZoneId:
      return static_cast<Signature>(value);
  }
  return std::nullopt;
}

constexpr std::string_view SignatureName(const Signature signature) {
  switch (signature) {
    case Signature::Duration:
      return "Duration";
    case Signature::Date:
      return "Date";
    case Signature::LocalTime:
      return "LocalTime";
    case Signature::Time:
      return "Time";
    case Signature::LocalDateTime:
      return "LocalDateTime";
    case Signature::DateTime:
      return "DateTime";
    case Signature::DateTimeZoneId:
      return "DateTimeZoneId";
  }
  return "Unknown";
}

}  // namespace chronobolt::communication::bolt
