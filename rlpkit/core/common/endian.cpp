// Copyright 2026 The rlpkit Authors
// SPDX-License-Identifier: Apache-2.0

#include "endian.hpp"

namespace rlpkit::endian {

template <UnsignedIntegral T>
static ByteView store_compact(const T& value) {
    RLPKIT_THREAD_LOCAL uint8_t buffer[sizeof(T)];
    intx::be::store(buffer, value);
    const size_t n{minimal_byte_length(value)};
    return {buffer + sizeof(T) - n, n};
}

ByteView to_big_compact(const uint64_t value) { return store_compact(value); }

ByteView to_big_compact(const intx::uint256& value) { return store_compact(value); }

}  // namespace rlpkit::endian
