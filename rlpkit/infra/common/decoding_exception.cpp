// Copyright 2026 The rlpkit Authors
// SPDX-License-Identifier: Apache-2.0

#include "decoding_exception.hpp"

#include <string>

#include <absl/strings/str_cat.h>
#include <magic_enum.hpp>

namespace rlpkit {

std::string_view to_string(DecodingError err) noexcept { return magic_enum::enum_name(err); }

DecodingException::DecodingException(DecodingError err, std::string_view context)
    : std::runtime_error{absl::StrCat(context.empty() ? "decoding failed" : context, ": ", to_string(err))},
      err_{err} {}

}  // namespace rlpkit
