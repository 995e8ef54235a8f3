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
#include <vector>

#include "communication/bolt/v1/codes.hpp"
#include "communication/bolt/v1/value.hpp"
#include "communication/bolt/v1/wire_value.hpp"

namespace chronobolt::communication::bolt {

/**
 * Rebuilds a Value from its wire form, the inverse of Encode. Containers are
 * decoded element by element and the first failing element aborts the whole
 * container.
 *
 * @throw UnsupportedTypeException if a structure has an unknown signature
 * @throw MalformedValueException if a structure has the wrong number of
 *  fields, a field of the wrong type or a field out of range
 * @throw utils::UnknownZoneException if a zoned date time names a zone the
 *  timezone database doesn't know
 */
Value Decode(const WireValue &value);

/// Decodes a single structure, see Decode.
Value DecodeStructure(uint8_t signature, const std::vector<WireValue> &fields);
Value DecodeStructure(const Structure &structure);

/**
 * Decodes a structure that must hold a temporal value of the given type.
 * @throw MalformedValueException if the signature designates another type
 */
Value Decode(const Structure &structure, Value::Type expected_type);

/// Value type a signature decodes to.
Value::Type ToValueType(Signature signature);

}  // namespace chronobolt::communication::bolt
