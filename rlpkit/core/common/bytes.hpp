// Copyright 2026 The rlpkit Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstdint>

#include <evmc/bytes.hpp>

namespace rlpkit {

//! Owning byte string, the output buffer of every encoder
using Bytes = evmc::bytes;

//! Non-owning view over contiguous bytes, the input of every decoder.
//! Decoders advance it past what they consumed.
class ByteView : public evmc::bytes_view {
  public:
    using evmc::bytes_view::bytes_view;

    constexpr ByteView() noexcept = default;

    // NOLINTBEGIN(google-explicit-constructor, hicpp-explicit-conversions)
    constexpr ByteView(evmc::bytes_view view) noexcept : evmc::bytes_view{view} {}

    ByteView(const Bytes& bytes) noexcept : evmc::bytes_view{bytes.data(), bytes.size()} {}

    template <size_t N>
    constexpr ByteView(const std::array<uint8_t, N>& bytes) noexcept : evmc::bytes_view{bytes.data(), N} {}
    // NOLINTEND(google-explicit-constructor, hicpp-explicit-conversions)
};

}  // namespace rlpkit
