// Copyright 2026 The rlpkit Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// Canonical ("compact") big endian forms of unsigned integers: no leading zero octets, zero is empty

#include <cstdint>

#include <intx/intx.hpp>

#include <rlpkit/core/common/base.hpp>
#include <rlpkit/core/common/bytes.hpp>
#include <rlpkit/core/common/decoding_result.hpp>

namespace rlpkit::endian {

//! \brief Number of octets in the compact big endian form of value
//! \remarks minimal_byte_length(0) == 0
template <UnsignedIntegral T>
constexpr size_t minimal_byte_length(const T& value) noexcept {
    if constexpr (std::same_as<T, intx::uint256>) {
        return intx::count_significant_bytes(value);
    } else {
        return intx::count_significant_bytes(static_cast<uint64_t>(value));
    }
}

//! \brief Compact big endian form of value, e.g. 1024 -> 04 00
//! \return A view into a thread-local buffer, valid until the next call on the same thread
ByteView to_big_compact(uint64_t value);

//! \copydoc to_big_compact(uint64_t)
ByteView to_big_compact(const intx::uint256& value);

//! \brief Reads back a compact big endian form into out
//! \return kOverflow if data is wider than T, kLeadingZero if data is not compact
template <UnsignedIntegral T>
DecodingResult from_big_compact(ByteView data, T& out) {
    if (data.size() > sizeof(T)) {
        return tl::unexpected{DecodingError::kOverflow};
    }
    if (!data.empty() && data[0] == 0) {
        return tl::unexpected{DecodingError::kLeadingZero};
    }

    T value{0};
    for (const uint8_t b : data) {
        value = static_cast<T>((value << 8) | T{b});
    }
    out = value;
    return {};
}

}  // namespace rlpkit::endian
