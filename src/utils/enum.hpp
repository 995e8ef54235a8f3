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

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace chronobolt::utils {
enum class ValidationError : uint8_t { EmptyValue, InvalidValue };

// Mappings are pairs of (name, enum value).
auto GetAllowedEnumValuesString(const auto &mappings) -> std::string {
  std::string allowed_values;
  for (const auto &mapping : mappings) {
    if (!allowed_values.empty()) allowed_values += ", ";
    allowed_values += mapping.first;
  }
  return allowed_values;
}

auto IsValidEnumValueString(const auto &value, const auto &mappings) -> std::optional<ValidationError> {
  if (value.empty()) {
    return ValidationError::EmptyValue;
  }

  if (std::find_if(mappings.begin(), mappings.end(), [&](const auto &mapping) { return mapping.first == value; }) ==
      mappings.cend()) {
    return ValidationError::InvalidValue;
  }

  return std::nullopt;
}

template <typename Enum>
auto StringToEnum(const auto &value, const auto &mappings) -> std::optional<Enum> {
  const auto mapping_iter =
      std::find_if(mappings.begin(), mappings.end(), [&](const auto &mapping) { return mapping.first == value; });
  if (mapping_iter == mappings.cend()) {
    return std::nullopt;
  }

  return mapping_iter->second;
}

}  // namespace chronobolt::utils
