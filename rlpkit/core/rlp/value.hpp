// Copyright 2026 The rlpkit Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <variant>
#include <vector>

#include <rlpkit/core/common/bytes.hpp>
#include <rlpkit/core/common/decoding_result.hpp>
#include <rlpkit/core/rlp/decode.hpp>

namespace rlpkit::rlp {

//! Maximum list nesting accepted by decode() unless the caller asks otherwise
inline constexpr size_t kDefaultMaxDepth{1024};

/**
 * A structurally typed RLP item: either a byte string (leaf) or a list of items.
 * Instances are immutable once built; order of list items is significant.
 */
class RlpValue {
  public:
    using List = std::vector<RlpValue>;

    //! The empty byte string
    RlpValue() = default;

    explicit RlpValue(Bytes bytes) : data_{std::move(bytes)} {}
    explicit RlpValue(ByteView bytes) : data_{Bytes{bytes}} {}
    explicit RlpValue(List items) : data_{std::move(items)} {}

    bool is_list() const noexcept { return std::holds_alternative<List>(data_); }
    bool is_string() const noexcept { return std::holds_alternative<Bytes>(data_); }

    //! \throws std::bad_variant_access if this is a list
    const Bytes& bytes() const { return std::get<Bytes>(data_); }

    //! \throws std::bad_variant_access if this is a byte string
    const List& items() const { return std::get<List>(data_); }

    friend bool operator==(const RlpValue& a, const RlpValue& b);

  private:
    std::variant<Bytes, List> data_;
};

size_t length(const RlpValue& value);

void encode(Bytes& to, const RlpValue& value);

Bytes encode(const RlpValue& value);

//! \brief Decodes exactly one item from the front of the input.
//! \param [in,out] from : the input; on success it's left on the unconsumed remainder
//! \param [in] max_depth : how many lists may be nested inside each other, the outermost one included
//! \return the decoded item or the first violation found, in which case from is left unspecified
tl::expected<RlpValue, DecodingError> decode_value(ByteView& from, size_t max_depth = kDefaultMaxDepth) noexcept;

DecodingResult decode(ByteView& from, RlpValue& to, Leftover mode = Leftover::kProhibit,
                      size_t max_depth = kDefaultMaxDepth) noexcept;

}  // namespace rlpkit::rlp
