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

#include "communication/bolt/v1/codes.hpp"
#include "communication/bolt/v1/value.hpp"
#include "communication/bolt/v1/wire_value.hpp"
#include "utils/temporal.hpp"

namespace chronobolt::communication::bolt {

/**
 * Converts a Value into its wire form. Primitives and containers keep their
 * shape, containers are converted element by element. Temporal values become
 * structures with the fields listed below.
 *
 *   Duration       -> E (months, days, seconds, nanoseconds)
 *   Date           -> D (days since epoch)
 *   LocalTime      -> t (nanosecond of day)
 *   OffsetTime     -> T (nanosecond of day, offset seconds)
 *   LocalDateTime  -> d (wall clock epoch second, nanosecond)
 *   OffsetDateTime -> F (UTC epoch second, nanosecond, offset seconds)
 *   ZonedDateTime  -> f (UTC epoch second, nanosecond, zone id)
 *
 * The whole value is converted or an exception is thrown.
 */
WireValue Encode(const Value &value);

Structure EncodeStructure(const utils::Duration &duration);
Structure EncodeStructure(const utils::Date &date);
Structure EncodeStructure(const utils::LocalTime &local_time);
Structure EncodeStructure(const utils::OffsetTime &offset_time);
Structure EncodeStructure(const utils::LocalDateTime &local_date_time);
Structure EncodeStructure(const utils::OffsetDateTime &offset_date_time);
Structure EncodeStructure(const utils::ZonedDateTime &zoned_date_time);

}  // namespace chronobolt::communication::bolt
