// Copyright 2026 The rlpkit Authors
// SPDX-License-Identifier: Apache-2.0

// RLP encoding functions as per
// https://ethereum.org/en/developers/docs/data-structures-and-encoding/rlp/

#pragma once

#include <array>
#include <concepts>
#include <string>

#include <intx/intx.hpp>

#include <rlpkit/core/common/base.hpp>
#include <rlpkit/core/common/bytes.hpp>
#include <rlpkit/core/common/encoding_result.hpp>
#include <rlpkit/core/common/endian.hpp>

namespace rlpkit::rlp {

struct Header {
    bool list{false};
    size_t payload_length{0};
};

inline constexpr uint8_t kEmptyStringCode{0x80};
inline constexpr uint8_t kEmptyListCode{0xC0};

// Payloads longer than this need a long form header
inline constexpr size_t kMaxShortPayloadLength{55};

void encode_header(Bytes& to, Header header);

void encode(Bytes& to, ByteView str);

//! Integers are byte strings holding their big endian digits without leading zeros; zero is the empty string
template <UnsignedIntegral T>
void encode(Bytes& to, const T& n) {
    encode(to, endian::to_big_compact(n));
}

template <size_t N>
void encode(Bytes& to, const std::array<uint8_t, N>& bytes) {
    encode(to, ByteView{bytes});
}

void encode(Bytes& to, bool);

void encode(Bytes& to, char);

//! Text goes on the wire as its raw bytes; no charset conversion takes place
void encode(Bytes& to, const std::string& text);

//! RLP has no sign convention: non-negative values are encoded as unsigned ones, negative values are rejected
template <std::signed_integral T>
EncodingResult encode_signed(Bytes& to, T n) {
    if (n < 0) {
        return tl::unexpected{EncodingError::kUnsupportedValue};
    }
    encode(to, static_cast<uint64_t>(n));
    return {};
}

size_t length_of_length(uint64_t payload_length) noexcept;

size_t length(ByteView) noexcept;

template <UnsignedIntegral T>
size_t length(const T& n) noexcept {
    if (n < kEmptyStringCode) {
        return 1;
    }
    const size_t n_bytes{endian::minimal_byte_length(n)};
    return n_bytes + length_of_length(n_bytes);
}

template <size_t N>
size_t length(const std::array<uint8_t, N>& bytes) noexcept {
    return length(ByteView{bytes});
}

inline size_t length(bool) noexcept {
    return 1;
}

inline size_t length(char c) noexcept {
    return static_cast<uint8_t>(c) < kEmptyStringCode ? 1 : 2;
}

size_t length(const std::string& text) noexcept;

}  // namespace rlpkit::rlp
