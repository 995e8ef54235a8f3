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

#include "communication/bolt/v1/value.hpp"
#include "utils/random_temporal.hpp"

namespace chronobolt::communication::bolt {

/**
 * Wraps a random temporal value of the given type.
 * @throw ValueException if the type is not a temporal type
 */
Value RandomTemporalValue(utils::RandomTemporalGenerator &generator, Value::Type type);

/// List of `size` random temporal values of the given type.
Value RandomTemporalList(utils::RandomTemporalGenerator &generator, Value::Type type, size_t size);

}  // namespace chronobolt::communication::bolt
