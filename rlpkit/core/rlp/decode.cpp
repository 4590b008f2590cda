// Copyright 2026 The rlpkit Authors
// SPDX-License-Identifier: Apache-2.0

#include "decode.hpp"

#include <rlpkit/core/common/bytes_to_string.hpp>
#include <rlpkit/core/common/endian.hpp>

namespace rlpkit::rlp {

// Reads the big endian length field of a long form header and checks it could not have been a short one
static tl::expected<size_t, DecodingError> decode_long_length(ByteView& from, size_t len_of_len) noexcept {
    if (from.size() < len_of_len) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    uint64_t len{0};
    if (DecodingResult res{endian::from_big_compact(from.substr(0, len_of_len), len)}; !res) {
        // A length field with leading zeros is just a longer than needed header
        if (res.error() == DecodingError::kLeadingZero) {
            return tl::unexpected{DecodingError::kNonCanonicalSize};
        }
        return tl::unexpected{res.error()};
    }
    from.remove_prefix(len_of_len);
    if (len <= kMaxShortPayloadLength) {
        return tl::unexpected{DecodingError::kNonCanonicalSize};
    }
    if constexpr (sizeof(size_t) < sizeof(uint64_t)) {
        if (len > std::numeric_limits<size_t>::max()) {
            return tl::unexpected{DecodingError::kOverflow};
        }
    }
    return static_cast<size_t>(len);
}

tl::expected<Header, DecodingError> decode_header(ByteView& from) noexcept {
    if (from.empty()) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }

    const uint8_t b{from[0]};
    if (b < kEmptyStringCode) {
        return Header{.list = false, .payload_length = 1};
    }
    from.remove_prefix(1);

    Header h{.list = b >= kEmptyListCode};
    const size_t offset{static_cast<size_t>(b - (h.list ? kEmptyListCode : kEmptyStringCode))};
    if (offset <= kMaxShortPayloadLength) {
        h.payload_length = offset;
        if (!h.list && h.payload_length == 1 && !from.empty() && from[0] < kEmptyStringCode) {
            return tl::unexpected{DecodingError::kNonCanonicalSize};
        }
    } else {
        const auto len{decode_long_length(from, offset - kMaxShortPayloadLength)};
        if (!len) {
            return tl::unexpected{len.error()};
        }
        h.payload_length = *len;
    }

    if (from.size() < h.payload_length) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    return h;
}

tl::expected<size_t, DecodingError> decode_string_header(ByteView& from) noexcept {
    const auto h{decode_header(from)};
    if (!h) {
        return tl::unexpected{h.error()};
    }
    if (h->list) {
        return tl::unexpected{DecodingError::kUnexpectedList};
    }
    return h->payload_length;
}

DecodingResult decode(ByteView& from, Bytes& to, Leftover mode) noexcept {
    const auto len{decode_string_header(from)};
    if (!len) {
        return tl::unexpected{len.error()};
    }
    to = from.substr(0, *len);
    from.remove_prefix(*len);
    return check_leftover(from, mode);
}

DecodingResult decode(ByteView& from, bool& to, Leftover mode) noexcept {
    uint64_t i{0};
    if (DecodingResult res{decode(from, i, mode)}; !res) {
        return res;
    }
    if (i > 1) {
        return tl::unexpected{DecodingError::kOverflow};
    }
    to = i;
    return {};
}

DecodingResult decode(ByteView& from, char& to, Leftover mode) noexcept {
    std::array<uint8_t, 1> b{};
    if (DecodingResult res{decode(from, b, mode)}; !res) {
        return res;
    }
    to = static_cast<char>(b[0]);
    return {};
}

DecodingResult decode(ByteView& from, std::string& to, Leftover mode) noexcept {
    Bytes raw;
    if (DecodingResult res{decode(from, raw, mode)}; !res) {
        return res;
    }
    to = byte_view_to_string_view(raw);
    return {};
}

}  // namespace rlpkit::rlp
