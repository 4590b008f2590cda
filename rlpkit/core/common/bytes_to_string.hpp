// Copyright 2026 The rlpkit Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>

#include <rlpkit/core/common/bytes.hpp>

namespace rlpkit {

// Text is carried as raw bytes; these reinterpret between the two without copying,
// except string_to_bytes which owns its result.

inline ByteView string_view_to_byte_view(std::string_view text) {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

inline std::string_view byte_view_to_string_view(ByteView bytes) {
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

inline Bytes string_to_bytes(std::string_view text) {
    const ByteView view{string_view_to_byte_view(text)};
    return {view.begin(), view.end()};
}

}  // namespace rlpkit
