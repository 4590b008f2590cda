// Copyright 2026 The rlpkit Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <numeric>
#include <span>
#include <vector>

#include <rlpkit/core/rlp/encode.hpp>

namespace rlpkit::rlp {

//! Size of a list with the given payload size, header included
inline size_t list_length(size_t payload_length) noexcept {
    return length_of_length(payload_length) + payload_length;
}

// Homogeneous lists: std::span and std::vector of any encodable T

template <typename T>
size_t length(const std::vector<T>& v);

template <typename T>
void encode(Bytes& to, const std::vector<T>& v);

template <typename T>
size_t length_items(std::span<const T> v) {
    return std::accumulate(v.begin(), v.end(), size_t{0}, [](size_t sum, const T& x) { return sum + length(x); });
}

template <typename T>
size_t length(std::span<const T> v) {
    return list_length(length_items(v));
}

template <typename T>
void encode(Bytes& to, std::span<const T> v) {
    const Header h{.list = true, .payload_length = length_items(v)};
    to.reserve(to.size() + list_length(h.payload_length));
    encode_header(to, h);
    for (const T& x : v) {
        encode(to, x);
    }
}

template <typename T>
size_t length(const std::vector<T>& v) {
    return length(std::span<const T>{v});
}

template <typename T>
void encode(Bytes& to, const std::vector<T>& v) {
    encode(to, std::span<const T>{v});
}

// Heterogeneous lists with a fixed number of fields known at the call site

template <typename Arg1, typename Arg2, typename... Args>
size_t length_items(const Arg1& arg1, const Arg2& arg2, const Args&... args) {
    return length(arg1) + length(arg2) + (size_t{0} + ... + length(args));
}

template <typename Arg1, typename Arg2, typename... Args>
size_t length(const Arg1& arg1, const Arg2& arg2, const Args&... args) {
    return list_length(length_items(arg1, arg2, args...));
}

template <typename Arg1, typename Arg2, typename... Args>
void encode(Bytes& to, const Arg1& arg1, const Arg2& arg2, const Args&... args) {
    const Header h{.list = true, .payload_length = length_items(arg1, arg2, args...)};
    to.reserve(to.size() + list_length(h.payload_length));
    encode_header(to, h);
    encode(to, arg1);
    encode(to, arg2);
    (encode(to, args), ...);
}

/**
 * RlpByteView refers to one complete RLP-encoded item (header included).
 * Items encoded separately, possibly of different kinds, are assembled into a list
 * by concatenation without being decoded again.
 */
struct RlpByteView {
    ByteView data;
    explicit RlpByteView(ByteView data1) : data(data1) {}
};

inline size_t length(const RlpByteView& item) noexcept {
    return item.data.size();
}

inline void encode(Bytes& to, const RlpByteView& item) {
    to.append(item.data);
}

}  // namespace rlpkit::rlp
