// Copyright 2026 The rlpkit Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// The most common and basic macros, concepts, types, and constants.

#include <concepts>
#include <cstddef>
#include <cstdint>

#include <intx/intx.hpp>

#if defined(__wasm__)
#define RLPKIT_THREAD_LOCAL static
#else
#define RLPKIT_THREAD_LOCAL thread_local
#endif

namespace rlpkit {

template <class T>
concept UnsignedIntegral = std::unsigned_integral<T> || std::same_as<T, intx::uint256>;

}  // namespace rlpkit
