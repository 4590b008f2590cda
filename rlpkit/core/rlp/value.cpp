// Copyright 2026 The rlpkit Authors
// SPDX-License-Identifier: Apache-2.0

#include "value.hpp"

#include <rlpkit/core/rlp/encode_vector.hpp>

namespace rlpkit::rlp {

bool operator==(const RlpValue& a, const RlpValue& b) {
    return a.data_ == b.data_;
}

static size_t length_items(const RlpValue::List& items) {
    size_t payload_length{0};
    for (const auto& item : items) {
        payload_length += length(item);
    }
    return payload_length;
}

size_t length(const RlpValue& value) {
    if (value.is_string()) {
        return length(ByteView{value.bytes()});
    }
    return list_length(length_items(value.items()));
}

void encode(Bytes& to, const RlpValue& value) {
    if (value.is_string()) {
        encode(to, ByteView{value.bytes()});
        return;
    }
    const Header h{.list = true, .payload_length = length_items(value.items())};
    encode_header(to, h);
    for (const auto& item : value.items()) {
        encode(to, item);
    }
}

Bytes encode(const RlpValue& value) {
    Bytes out;
    out.reserve(length(value));
    encode(out, value);
    return out;
}

// depth is the number of lists still allowed to be opened
static tl::expected<RlpValue, DecodingError> decode_item(ByteView& from, size_t depth) noexcept {
    const auto h{decode_header(from)};
    if (!h) {
        return tl::unexpected{h.error()};
    }
    if (!h->list) {
        RlpValue leaf{from.substr(0, h->payload_length)};
        from.remove_prefix(h->payload_length);
        return leaf;
    }

    if (depth == 0) {
        return tl::unexpected{DecodingError::kNestingTooDeep};
    }

    ByteView payload{from.substr(0, h->payload_length)};
    from.remove_prefix(h->payload_length);

    RlpValue::List items;
    while (!payload.empty()) {
        auto item{decode_item(payload, depth - 1)};
        if (!item) {
            return tl::unexpected{item.error()};
        }
        items.push_back(std::move(*item));
    }
    return RlpValue{std::move(items)};
}

tl::expected<RlpValue, DecodingError> decode_value(ByteView& from, size_t max_depth) noexcept {
    return decode_item(from, max_depth);
}

DecodingResult decode(ByteView& from, RlpValue& to, Leftover mode, size_t max_depth) noexcept {
    auto value{decode_item(from, max_depth)};
    if (!value) {
        return tl::unexpected{value.error()};
    }
    to = std::move(*value);
    if (mode != Leftover::kAllow && !from.empty()) {
        return tl::unexpected{DecodingError::kInputTooLong};
    }
    return {};
}

}  // namespace rlpkit::rlp
