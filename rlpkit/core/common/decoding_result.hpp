// Copyright 2026 The rlpkit Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <tl/expected.hpp>

namespace rlpkit {

//! Why an RLP input was rejected
enum class [[nodiscard]] DecodingError {
    kOverflow,                // integer wider than the target type
    kLeadingZero,             // integer payload starting with 0x00
    kInputTooShort,           // header announces more bytes than remain
    kInputTooLong,            // bytes left over after the item
    kNonCanonicalSize,        // header longer than needed for its payload
    kUnexpectedLength,        // fixed-size target, payload of another size
    kUnexpectedString,        // list expected
    kUnexpectedList,          // byte string expected
    kUnexpectedListElements,  // wrong number of list items
    kNestingTooDeep,          // lists nested beyond the decoder's limit
};

using DecodingResult = tl::expected<void, DecodingError>;

}  // namespace rlpkit
