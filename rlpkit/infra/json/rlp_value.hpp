// Copyright 2026 The rlpkit Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <nlohmann/json.hpp>

#include <rlpkit/core/rlp/value.hpp>

namespace rlpkit::rlp {

//! \brief Builds the item described in the notation of the Ethereum RLP test fixtures
//! \details A string is taken verbatim as a byte string, unless it starts with '#' in which case it's
//! a decimal big integer; non-negative integers are encoded in their canonical form; arrays are lists.
//! \throws std::invalid_argument for values with no RLP representation (negative or fractional numbers, objects, null)
//! \brief Builds a value from the Ethereum RLP fixture notation
//! \param [in] max_depth : how many arrays may be nested inside each other, the outermost one included
//! \throws std::invalid_argument on values with no RLP representation or nesting beyond max_depth
RlpValue value_from_fixture(const nlohmann::json& json, size_t max_depth = kDefaultMaxDepth);

//! Renders byte strings as 0x-prefixed hex and lists as arrays
void to_json(nlohmann::json& json, const RlpValue& value);

}  // namespace rlpkit::rlp
