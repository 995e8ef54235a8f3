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

#include "utils/exceptions.hpp"

namespace chronobolt::communication::bolt {

/**
 * Raised when a Value or WireValue is read as a type it doesn't hold, or when
 * a value can't be represented on the wire.
 */
class ValueException : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(ValueException)
};

/**
 * Base of the errors raised while rebuilding a Value from its wire form. None
 * of them can be fixed by retrying with the same input.
 */
class DecodingException : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(DecodingException)
};

/// The structure signature doesn't name a known type.
class UnsupportedTypeException : public DecodingException {
 public:
  using DecodingException::DecodingException;
  SPECIALIZE_GET_EXCEPTION_NAME(UnsupportedTypeException)
};

/// The signature is known, but the fields don't match it in count, type or range.
class MalformedValueException : public DecodingException {
 public:
  using DecodingException::DecodingException;
  SPECIALIZE_GET_EXCEPTION_NAME(MalformedValueException)
};

}  // namespace chronobolt::communication::bolt
