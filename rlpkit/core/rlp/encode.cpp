// Copyright 2026 The rlpkit Authors
// SPDX-License-Identifier: Apache-2.0

#include "encode.hpp"

#include <rlpkit/core/common/bytes_to_string.hpp>

namespace rlpkit::rlp {

void encode_header(Bytes& to, Header header) {
    const uint8_t base{header.list ? kEmptyListCode : kEmptyStringCode};
    if (header.payload_length <= kMaxShortPayloadLength) {
        to.push_back(static_cast<uint8_t>(base + header.payload_length));
        return;
    }
    // long form: base + 55 + number of length bytes, then the length itself
    const ByteView len_be{endian::to_big_compact(header.payload_length)};
    to.push_back(static_cast<uint8_t>(base + kMaxShortPayloadLength + len_be.size()));
    to.append(len_be);
}

size_t length_of_length(uint64_t payload_length) noexcept {
    if (payload_length <= kMaxShortPayloadLength) {
        return 1;
    }
    return 1 + endian::minimal_byte_length(payload_length);
}

void encode(Bytes& to, bool x) {
    to.push_back(x ? uint8_t{1} : kEmptyStringCode);
}

void encode(Bytes& to, char c) {
    const auto b{static_cast<uint8_t>(c)};
    encode(to, ByteView{&b, 1});
}

void encode(Bytes& to, const std::string& text) {
    encode(to, string_view_to_byte_view(text));
}

// A single byte below 0x80 is its own encoding
static bool is_self_encoding(ByteView s) noexcept {
    return s.size() == 1 && s[0] < kEmptyStringCode;
}

void encode(Bytes& to, ByteView s) {
    if (!is_self_encoding(s)) {
        encode_header(to, {.list = false, .payload_length = s.size()});
    }
    to.append(s);
}

size_t length(ByteView s) noexcept {
    return is_self_encoding(s) ? 1 : length_of_length(s.size()) + s.size();
}

size_t length(const std::string& text) noexcept {
    return length(string_view_to_byte_view(text));
}

}  // namespace rlpkit::rlp
