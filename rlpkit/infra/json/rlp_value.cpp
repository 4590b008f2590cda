// Copyright 2026 The rlpkit Authors
// SPDX-License-Identifier: Apache-2.0

#include "rlp_value.hpp"

#include <stdexcept>
#include <string>

#include <rlpkit/core/common/bytes_to_string.hpp>
#include <rlpkit/core/common/endian.hpp>
#include <rlpkit/core/common/util.hpp>

namespace rlpkit::rlp {

// Fixture integers may exceed 256 bits, so digits are accumulated into a big endian byte string
static RlpValue big_integer_from_decimal(std::string_view digits) {
    if (digits.empty()) {
        throw std::invalid_argument{"empty big integer"};
    }
    Bytes be;
    for (const char c : digits) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument{"invalid big integer digit: " + std::string{digits}};
        }
        unsigned carry{static_cast<unsigned>(c - '0')};
        for (auto it{be.rbegin()}; it != be.rend(); ++it) {
            const unsigned v{*it * 10u + carry};
            *it = static_cast<uint8_t>(v & 0xff);
            carry = v >> 8;
        }
        for (; carry; carry >>= 8) {
            be.insert(be.begin(), static_cast<uint8_t>(carry & 0xff));
        }
    }
    return RlpValue{zeroless_view(be)};
}

// depth is the number of arrays still allowed to be opened
static RlpValue from_fixture(const nlohmann::json& json, size_t depth) {
    switch (json.type()) {
        case nlohmann::json::value_t::string: {
            const auto& text{json.get_ref<const std::string&>()};
            if (!text.empty() && text[0] == '#') {
                return big_integer_from_decimal(std::string_view{text}.substr(1));
            }
            return RlpValue{string_to_bytes(text)};
        }
        case nlohmann::json::value_t::number_unsigned:
            return RlpValue{endian::to_big_compact(json.get<uint64_t>())};
        case nlohmann::json::value_t::boolean:
            return json.get<bool>() ? RlpValue{Bytes(1, uint8_t{1})} : RlpValue{};
        case nlohmann::json::value_t::array: {
            if (depth == 0) {
                throw std::invalid_argument{"JSON arrays nested too deep"};
            }
            RlpValue::List items;
            items.reserve(json.size());
            for (const auto& element : json) {
                items.push_back(from_fixture(element, depth - 1));
            }
            return RlpValue{std::move(items)};
        }
        case nlohmann::json::value_t::number_integer: {
            const auto n{json.get<int64_t>()};
            if (n < 0) {
                throw std::invalid_argument{"negative integer has no RLP representation: " + json.dump()};
            }
            return RlpValue{endian::to_big_compact(static_cast<uint64_t>(n))};
        }
        default:
            throw std::invalid_argument{"unsupported JSON value: " + json.dump()};
    }
}

RlpValue value_from_fixture(const nlohmann::json& json, size_t max_depth) {
    return from_fixture(json, max_depth);
}

void to_json(nlohmann::json& json, const RlpValue& value) {
    if (value.is_string()) {
        json = to_hex(value.bytes(), /*with_prefix=*/true);
        return;
    }
    json = nlohmann::json::array();
    for (const auto& item : value.items()) {
        nlohmann::json element;
        to_json(element, item);
        json.push_back(std::move(element));
    }
}

}  // namespace rlpkit::rlp
