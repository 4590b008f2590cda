// Copyright 2026 The rlpkit Authors
// SPDX-License-Identifier: Apache-2.0

#include "decode.hpp"

#include <catch2/catch.hpp>

#include <rlpkit/core/common/util.hpp>

#include "decode_vector.hpp"

namespace rlpkit::rlp {

template <class T>
static T decode_success(std::string_view hex) {
    Bytes bytes{*from_hex(hex)};
    ByteView view{bytes};
    T res{};
    REQUIRE(decode(view, res));
    return res;
}

template <class T>
static DecodingError decode_failure(std::string_view hex) {
    Bytes bytes{*from_hex(hex)};
    ByteView view{bytes};
    T x{};
    DecodingResult res{decode(view, x)};
    REQUIRE(!res);
    return res.error();
}

static tl::expected<Header, DecodingError> header_of(std::string_view hex) {
    Bytes bytes{*from_hex(hex)};
    ByteView view{bytes};
    return decode_header(view);
}

TEST_CASE("RLP header decoding", "[rlpkit][rlp][decode]") {
    SECTION("single byte is its own payload") {
        Bytes bytes{*from_hex("7f")};
        ByteView view{bytes};
        const auto h{decode_header(view)};
        REQUIRE(h);
        CHECK(!h->list);
        CHECK(h->payload_length == 1);
        CHECK(view.size() == 1);  // not consumed
    }

    SECTION("short forms") {
        CHECK(header_of("80")->payload_length == 0);
        CHECK(header_of("83646f67")->payload_length == 3);
        CHECK(header_of("c0")->list);
        CHECK(header_of("c3010203")->payload_length == 3);
    }

    SECTION("long forms") {
        const Bytes payload(56, 0x61);
        const auto h{header_of("b838" + to_hex(payload))};
        REQUIRE(h);
        CHECK(!h->list);
        CHECK(h->payload_length == 56);

        const auto l{header_of("f838" + to_hex(payload))};
        REQUIRE(l);
        CHECK(l->list);
        CHECK(l->payload_length == 56);
    }

    SECTION("insufficient bytes") {
        CHECK(header_of("") == tl::unexpected{DecodingError::kInputTooShort});
        CHECK(header_of("83646f") == tl::unexpected{DecodingError::kInputTooShort});
        CHECK(header_of("81") == tl::unexpected{DecodingError::kInputTooShort});
        CHECK(header_of("b9") == tl::unexpected{DecodingError::kInputTooShort});
        CHECK(header_of("b90400") == tl::unexpected{DecodingError::kInputTooShort});
        CHECK(header_of("c3") == tl::unexpected{DecodingError::kInputTooShort});
        CHECK(header_of("f90400") == tl::unexpected{DecodingError::kInputTooShort});
    }

    SECTION("non-canonical forms") {
        // single byte below 0x80 with an explicit header
        CHECK(header_of("8100") == tl::unexpected{DecodingError::kNonCanonicalSize});
        CHECK(header_of("817f") == tl::unexpected{DecodingError::kNonCanonicalSize});
        // long form for a payload that fits a short one
        CHECK(header_of("b800") == tl::unexpected{DecodingError::kNonCanonicalSize});
        CHECK(header_of("b80100") == tl::unexpected{DecodingError::kNonCanonicalSize});
        CHECK(header_of("b837" + std::string(110, '0')) == tl::unexpected{DecodingError::kNonCanonicalSize});
        CHECK(header_of("f800") == tl::unexpected{DecodingError::kNonCanonicalSize});
        CHECK(header_of("f80100") == tl::unexpected{DecodingError::kNonCanonicalSize});
        // leading zero in the length field
        CHECK(header_of("b90038" + std::string(112, '0')) == tl::unexpected{DecodingError::kNonCanonicalSize});
        CHECK(header_of("f90038" + std::string(112, '0')) == tl::unexpected{DecodingError::kNonCanonicalSize});
    }

    SECTION("oversized length field") {
        CHECK(header_of("bf0100000000000000") == tl::unexpected{DecodingError::kInputTooShort});
        CHECK(header_of("bfffffffffffffffff") == tl::unexpected{DecodingError::kInputTooShort});
    }
}

TEST_CASE("RLP decoding", "[rlpkit][rlp][decode]") {
    SECTION("strings") {
        CHECK(to_hex(decode_success<Bytes>("00")) == "00");
        CHECK(to_hex(decode_success<Bytes>("80")).empty());
        CHECK(to_hex(decode_success<Bytes>("83646f67")) == "646f67");
        CHECK(to_hex(decode_success<Bytes>("8D6F62636465666768696A6B6C6D")) == "6f62636465666768696a6b6c6d");

        CHECK(decode_failure<Bytes>("8D6F62636465666768696A6B6C6Daa") == DecodingError::kInputTooLong);
        CHECK(decode_failure<Bytes>("C0") == DecodingError::kUnexpectedList);
        CHECK(decode_failure<Bytes>("8100") == DecodingError::kNonCanonicalSize);
    }

    SECTION("leftover allowed") {
        Bytes bytes{*from_hex("83646f67aabb")};
        ByteView view{bytes};
        Bytes dog;
        REQUIRE(decode(view, dog, Leftover::kAllow));
        CHECK(to_hex(dog) == "646f67");
        CHECK(to_hex(view) == "aabb");
    }

    SECTION("uint64") {
        CHECK(decode_success<uint64_t>("09") == 9);
        CHECK(decode_success<uint64_t>("80") == 0);
        CHECK(decode_success<uint64_t>("820505") == 0x0505);
        CHECK(decode_success<uint64_t>("85CE05050505") == 0xCE05050505);

        CHECK(decode_failure<uint64_t>("85CE05050505aa") == DecodingError::kInputTooLong);
        CHECK(decode_failure<uint64_t>("C0") == DecodingError::kUnexpectedList);
        CHECK(decode_failure<uint64_t>("00") == DecodingError::kLeadingZero);
        CHECK(decode_failure<uint64_t>("8105") == DecodingError::kNonCanonicalSize);
        CHECK(decode_failure<uint64_t>("8200F4") == DecodingError::kLeadingZero);
        CHECK(decode_failure<uint64_t>("B8020004") == DecodingError::kNonCanonicalSize);
        CHECK(decode_failure<uint64_t>("8AFFFFFFFFFFFFFFFFFF7C") == DecodingError::kOverflow);
    }

    SECTION("narrow unsigned") {
        CHECK(decode_success<uint16_t>("820400") == 0x0400);
        CHECK(decode_failure<uint16_t>("83010000") == DecodingError::kOverflow);
        CHECK(decode_success<uint8_t>("81ff") == 0xff);
    }

    SECTION("uint256") {
        CHECK(decode_success<intx::uint256>("80") == 0);
        CHECK(decode_success<intx::uint256>("85CE05050505") == 0xCE05050505);
        CHECK(decode_success<intx::uint256>("8AFFFFFFFFFFFFFFFFFF7C") ==
              intx::from_string<intx::uint256>("0xFFFFFFFFFFFFFFFFFF7C"));

        CHECK(decode_failure<intx::uint256>("8BFFFFFFFFFFFFFFFFFF7C") == DecodingError::kInputTooShort);
        // 33 bytes of payload do not fit 256 bits
        CHECK(decode_failure<intx::uint256>("a101" + std::string(64, '0')) == DecodingError::kOverflow);
    }

    SECTION("bool") {
        CHECK(decode_success<bool>("01"));
        CHECK(!decode_success<bool>("80"));
        CHECK(decode_failure<bool>("02") == DecodingError::kOverflow);
    }

    SECTION("char and text") {
        CHECK(decode_success<char>("61") == 'a');
        CHECK(decode_success<char>("81e9") == static_cast<char>(0xE9));
        CHECK(decode_failure<char>("80") == DecodingError::kUnexpectedLength);
        CHECK(decode_failure<char>("826162") == DecodingError::kUnexpectedLength);

        CHECK(decode_success<std::string>("83646f67") == "dog");
        CHECK(decode_success<std::string>("80").empty());
        CHECK(decode_failure<std::string>("c0") == DecodingError::kUnexpectedList);
    }

    SECTION("signed integers") {
        Bytes bytes{*from_hex("820400")};
        ByteView view{bytes};
        int32_t i{0};
        REQUIRE(decode_signed(view, i));
        CHECK(i == 0x400);

        bytes = *from_hex("8180");
        view = bytes;
        int8_t small{0};
        CHECK(decode_signed(view, small) == tl::unexpected{DecodingError::kOverflow});

        bytes = *from_hex("7f");
        view = bytes;
        REQUIRE(decode_signed(view, small));
        CHECK(small == 127);
    }

    SECTION("fixed size byte arrays") {
        std::array<uint8_t, 2> arr{};
        Bytes bytes{*from_hex("82abba")};
        ByteView view{bytes};
        REQUIRE(decode(view, arr));
        CHECK(arr == std::array<uint8_t, 2>{0xAB, 0xBA});

        bytes = *from_hex("83abbacc");
        view = bytes;
        CHECK(decode(view, arr) == tl::unexpected{DecodingError::kUnexpectedLength});
    }

    SECTION("lists") {
        CHECK(decode_success<std::vector<intx::uint256>>("C0").empty());
        CHECK(decode_success<std::vector<uint64_t>>("C883BBCCB583FFC0B5") == std::vector<uint64_t>{0xBBCCB5, 0xFFC0B5});
        CHECK(decode_success<std::vector<std::string>>("c88363617483646f67") == std::vector<std::string>{"cat", "dog"});
        CHECK(decode_success<std::vector<std::vector<uint64_t>>>("c4c0c101c0") ==
              std::vector<std::vector<uint64_t>>{{}, {1}, {}});

        CHECK(decode_failure<std::vector<uint64_t>>("C883BBCCB583FFC0B5aa") == DecodingError::kInputTooLong);
        CHECK(decode_failure<std::vector<uint64_t>>("83646f67") == DecodingError::kUnexpectedString);
        // the second item claims more bytes than the list payload holds
        CHECK(decode_failure<std::vector<uint64_t>>("C583BBCCB583FF") == DecodingError::kInputTooShort);
        CHECK(decode_failure<std::vector<uint64_t>>("C583BBCCB583FFC0B5") == DecodingError::kInputTooShort);
    }

    SECTION("raw items") {
        std::vector<RlpByteView> items;
        Bytes bytes{*from_hex("c98363617401c283646f67")};
        ByteView view{bytes};
        REQUIRE(!decode(view, items));

        bytes = *from_hex("ca8363617401c483646f67");
        view = bytes;
        REQUIRE(decode(view, items));
        REQUIRE(items.size() == 3);
        CHECK(to_hex(items[0].data) == "83636174");
        CHECK(to_hex(items[1].data) == "01");
        CHECK(to_hex(items[2].data) == "c483646f67");
    }
}

}  // namespace rlpkit::rlp
