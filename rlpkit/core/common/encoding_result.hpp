// Copyright 2026 The rlpkit Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <tl/expected.hpp>

namespace rlpkit {

// Error codes for conversions of host values into RLP.
// Encoding of a well-formed value is total, so only adapters report these.
enum class [[nodiscard]] EncodingError {
    kUnsupportedValue,  // e.g. a negative integer: RLP defines no sign convention
};

using EncodingResult = tl::expected<void, EncodingError>;

}  // namespace rlpkit
