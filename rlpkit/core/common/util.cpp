// Copyright 2026 The rlpkit Authors
// SPDX-License-Identifier: Apache-2.0

#include "util.hpp"


namespace rlpkit {

ByteView zeroless_view(ByteView data) {
    const size_t first_nonzero{data.find_first_not_of(uint8_t{0})};
    return first_nonzero == ByteView::npos ? ByteView{} : data.substr(first_nonzero);
}

std::string to_hex(ByteView bytes, bool with_prefix) {
    static constexpr std::string_view kDigits{"0123456789abcdef"};
    std::string out{with_prefix ? "0x" : ""};
    out.reserve(out.size() + 2 * bytes.size());
    for (const uint8_t b : bytes) {
        out += kDigits[b >> 4];
        out += kDigits[b & 0x0f];
    }
    return out;
}

std::string abridge(std::string_view input, size_t length) {
    if (input.size() <= length) {
        return std::string{input};
    }
    return std::string{input.substr(0, length)} + "...";
}

std::optional<uint8_t> decode_hex_digit(char ch) noexcept {
    if (ch >= '0' && ch <= '9') return static_cast<uint8_t>(ch - '0');
    const char lower{static_cast<char>(ch | 0x20)};
    if (lower >= 'a' && lower <= 'f') return static_cast<uint8_t>(lower - 'a' + 10);
    return std::nullopt;
}

std::optional<Bytes> from_hex(std::string_view hex) noexcept {
    if (has_hex_prefix(hex)) {
        hex.remove_prefix(2);
    }
    // an odd count of digits reads as if a leading 0 were present
    Bytes out((hex.size() + 1) / 2, uint8_t{0});
    size_t nibble{hex.size() % 2};
    for (const char ch : hex) {
        const auto digit{decode_hex_digit(ch)};
        if (!digit) {
            return std::nullopt;
        }
        out[nibble / 2] = static_cast<uint8_t>(out[nibble / 2] | (nibble % 2 ? *digit : *digit << 4));
        ++nibble;
    }
    return out;
}

}  // namespace rlpkit
