// Copyright 2026 The rlpkit Authors
// SPDX-License-Identifier: Apache-2.0

// RLP decoding functions as per
// https://ethereum.org/en/developers/docs/data-structures-and-encoding/rlp/

#pragma once

#include <array>
#include <concepts>
#include <cstring>
#include <limits>
#include <string>
#include <type_traits>

#include <intx/intx.hpp>

#include <rlpkit/core/common/base.hpp>
#include <rlpkit/core/common/bytes.hpp>
#include <rlpkit/core/common/decoding_result.hpp>
#include <rlpkit/core/rlp/encode.hpp>

namespace rlpkit::rlp {

// Whether to allow or prohibit trailing characters in an input after decoding.
// If prohibited and the input does contain extra characters, decode() returns DecodingResult::kInputTooLong.
enum class Leftover {
    kProhibit,
    kAllow,
};

// Consumes an RLP header unless it's a single byte in the [0x00, 0x7f] range,
// in which case the byte is put back.
tl::expected<Header, DecodingError> decode_header(ByteView& from) noexcept;

//! Consumes the header of a byte string and returns its payload length; a list fails with kUnexpectedList
tl::expected<size_t, DecodingError> decode_string_header(ByteView& from) noexcept;

inline DecodingResult check_leftover(ByteView from, Leftover mode) noexcept {
    if (mode != Leftover::kAllow && !from.empty()) {
        return tl::unexpected{DecodingError::kInputTooLong};
    }
    return {};
}

DecodingResult decode(ByteView& from, Bytes& to, Leftover mode = Leftover::kProhibit) noexcept;

template <UnsignedIntegral T>
DecodingResult decode(ByteView& from, T& to, Leftover mode = Leftover::kProhibit) noexcept {
    const auto len{decode_string_header(from)};
    if (!len) {
        return tl::unexpected{len.error()};
    }
    if (DecodingResult res{endian::from_big_compact(from.substr(0, *len), to)}; !res) {
        return res;
    }
    from.remove_prefix(*len);
    return check_leftover(from, mode);
}

DecodingResult decode(ByteView& from, bool& to, Leftover mode = Leftover::kProhibit) noexcept;

DecodingResult decode(ByteView& from, char& to, Leftover mode = Leftover::kProhibit) noexcept;

DecodingResult decode(ByteView& from, std::string& to, Leftover mode = Leftover::kProhibit) noexcept;

//! Counterpart of encode_signed: accepts the unsigned encodings of non-negative values only
template <std::signed_integral T>
DecodingResult decode_signed(ByteView& from, T& to, Leftover mode = Leftover::kProhibit) noexcept {
    std::make_unsigned_t<T> u{0};
    if (DecodingResult res{decode(from, u, mode)}; !res) {
        return res;
    }
    if (u > static_cast<std::make_unsigned_t<T>>(std::numeric_limits<T>::max())) {
        return tl::unexpected{DecodingError::kOverflow};
    }
    to = static_cast<T>(u);
    return {};
}

//! Fixed-size byte strings must carry exactly N bytes
template <size_t N>
DecodingResult decode(ByteView& from, std::array<uint8_t, N>& to, Leftover mode = Leftover::kProhibit) noexcept {
    const auto len{decode_string_header(from)};
    if (!len) {
        return tl::unexpected{len.error()};
    }
    if (*len != N) {
        return tl::unexpected{DecodingError::kUnexpectedLength};
    }
    std::memcpy(to.data(), from.data(), N);
    from.remove_prefix(N);
    return check_leftover(from, mode);
}

}  // namespace rlpkit::rlp
