// Copyright 2026 The rlpkit Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <concepts>
#include <stdexcept>
#include <string>
#include <string_view>

namespace rlpkit {

//! Throws std::logic_error carrying \p message unless \p condition holds.
inline void ensure(bool condition, std::string_view message) {
    if (!condition) [[unlikely]] {
        throw std::logic_error{std::string{message}};
    }
}

//! Same check, with a message built only when it fails.
//! \code ensure(ok, [&] { return "bad fixture " + name; }); \endcode
template <std::invocable MessageBuilder>
void ensure(bool condition, MessageBuilder&& build_message) {
    if (!condition) [[unlikely]] {
        throw std::logic_error{std::string{build_message()}};
    }
}

}  // namespace rlpkit
