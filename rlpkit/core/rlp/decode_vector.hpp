// Copyright 2026 The rlpkit Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <tuple>
#include <utility>
#include <vector>

#include <rlpkit/core/rlp/decode.hpp>
#include <rlpkit/core/rlp/encode_vector.hpp>

namespace rlpkit::rlp {

//! Consumes a list header and returns a view on exactly its payload
inline tl::expected<ByteView, DecodingError> decode_list_payload(ByteView& from) noexcept {
    const auto h{decode_header(from)};
    if (!h) {
        return tl::unexpected{h.error()};
    }
    if (!h->list) {
        return tl::unexpected{DecodingError::kUnexpectedString};
    }
    ByteView payload{from.substr(0, h->payload_length)};
    from.remove_prefix(h->payload_length);
    return payload;
}

template <typename T>
DecodingResult decode(ByteView& from, std::vector<T>& to, Leftover mode = Leftover::kProhibit) noexcept;

//! Decodes an RLP list of dynamic size with items of type T
template <typename T>
DecodingResult decode(ByteView& from, std::vector<T>& to, Leftover mode) noexcept {
    auto payload{decode_list_payload(from)};
    if (!payload) {
        return tl::unexpected{payload.error()};
    }

    to.clear();
    while (!payload->empty()) {
        to.emplace_back();
        if (DecodingResult res{decode(*payload, to.back(), Leftover::kAllow)}; !res) {
            return res;
        }
    }
    return check_leftover(from, mode);
}

/**
 * Splits an RLP list of dynamic size with items of any kind.
 * The resulting RlpByteView-s refer to the RLP-encoded items (header included) inside the input.
 * Use rlp::decode(to[i].data, ...) to fully decode them.
 */
template <>
inline DecodingResult decode(ByteView& from, std::vector<RlpByteView>& to, Leftover mode) noexcept {
    auto payload{decode_list_payload(from)};
    if (!payload) {
        return tl::unexpected{payload.error()};
    }

    to.clear();
    while (!payload->empty()) {
        const ByteView item_start{*payload};
        const auto item_header{decode_header(*payload)};
        if (!item_header) {
            return tl::unexpected{item_header.error()};
        }
        const size_t header_length{item_start.size() - payload->size()};
        to.emplace_back(item_start.substr(0, header_length + item_header->payload_length));
        payload->remove_prefix(item_header->payload_length);
    }
    return check_leftover(from, mode);
}

// One field of a fixed arity list: running out of payload means the list is too short
template <typename Arg>
DecodingResult decode_field(ByteView& payload, Arg& arg) noexcept {
    if (payload.empty()) {
        return tl::unexpected{DecodingError::kUnexpectedListElements};
    }
    return decode(payload, arg, Leftover::kAllow);
}

//! Decodes an RLP list with a fixed number of items with various types.
//! A list with fewer or more items than arguments fails with kUnexpectedListElements.
//! The arguments are assigned only if the whole list decodes successfully.
template <typename Arg1, typename Arg2, typename... Args>
DecodingResult decode(ByteView& from, Leftover mode, Arg1& arg1, Arg2& arg2, Args&... args) noexcept {
    auto payload{decode_list_payload(from)};
    if (!payload) {
        return tl::unexpected{payload.error()};
    }

    std::tuple<Arg1, Arg2, Args...> staged;
    DecodingResult res{std::apply(
        [&payload](auto&... fields) {
            DecodingResult r{};
            ((r = r ? decode_field(*payload, fields) : r), ...);
            return r;
        },
        staged)};
    if (!res) {
        return res;
    }
    if (!payload->empty()) {
        return tl::unexpected{DecodingError::kUnexpectedListElements};
    }
    if (res = check_leftover(from, mode); !res) {
        return res;
    }

    std::tie(arg1, arg2, args...) = std::move(staged);
    return {};
}

}  // namespace rlpkit::rlp
