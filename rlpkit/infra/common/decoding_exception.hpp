// Copyright 2026 The rlpkit Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <utility>

#include <rlpkit/core/common/decoding_result.hpp>

namespace rlpkit {

//! Name of the enumerator, e.g. "kNonCanonicalSize"
std::string_view to_string(DecodingError err) noexcept;

//! Thrown where a DecodingError cannot be returned.
//! what() reads "<context>: <error name>", or "decoding failed: <error name>" without context.
class DecodingException : public std::runtime_error {
  public:
    explicit DecodingException(DecodingError err, std::string_view context = {});

    DecodingError err() const noexcept { return err_; }

  private:
    DecodingError err_;
};

//! Value held by \p res; throws DecodingException if it holds an error instead.
//! Also accepts a DecodingResult, which holds no value.
template <class T>
T unwrap_or_throw(tl::expected<T, DecodingError> res, std::string_view context = {}) {
    if (!res) {
        throw DecodingException{res.error(), context};
    }
    if constexpr (!std::is_void_v<T>) {
        return std::move(*res);
    }
}

}  // namespace rlpkit
