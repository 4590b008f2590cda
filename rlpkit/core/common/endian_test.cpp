// Copyright 2026 The rlpkit Authors
// SPDX-License-Identifier: Apache-2.0

#include "endian.hpp"

#include <catch2/catch.hpp>

#include <rlpkit/core/common/util.hpp>

namespace rlpkit::endian {

TEST_CASE("Minimal byte length", "[rlpkit][common][endian]") {
    CHECK(minimal_byte_length(uint64_t{0}) == 0);
    CHECK(minimal_byte_length(uint64_t{1}) == 1);
    CHECK(minimal_byte_length(uint64_t{0xFF}) == 1);
    CHECK(minimal_byte_length(uint64_t{0x100}) == 2);
    CHECK(minimal_byte_length(uint64_t{1024}) == 2);
    CHECK(minimal_byte_length(uint32_t{0xFFFFFFFF}) == 4);
    CHECK(minimal_byte_length(UINT64_MAX) == 8);
    CHECK(minimal_byte_length(intx::uint256{0}) == 0);
    CHECK(minimal_byte_length(intx::uint256{1} << 255) == 32);
}

TEST_CASE("Compact big endian form", "[rlpkit][common][endian]") {
    SECTION("to compact") {
        CHECK(to_big_compact(0).empty());
        CHECK(to_hex(to_big_compact(1024)) == "0400");
        CHECK(to_hex(to_big_compact(0x5485ffde)) == "5485ffde");
        CHECK(to_hex(to_big_compact(intx::uint256{0x7F})) == "7f");
        CHECK(to_big_compact(intx::uint256{0}).empty());
        CHECK(to_hex(to_big_compact(intx::uint256{1} << 200)) == "01" + std::string(50, '0'));
    }

    SECTION("compact length matches minimal byte length") {
        for (const uint64_t n : {uint64_t{0}, uint64_t{127}, uint64_t{128}, uint64_t{65535}, uint64_t{65536}, UINT64_MAX}) {
            CHECK(to_big_compact(n).size() == minimal_byte_length(n));
        }
    }

    SECTION("from compact") {
        uint64_t out64{0};
        REQUIRE(from_big_compact(*from_hex("5485ffde"), out64));
        CHECK(out64 == 0x5485ffde);

        REQUIRE(from_big_compact(Bytes{}, out64));
        CHECK(out64 == 0u);

        Bytes extra_long_bytes(sizeof(uint64_t) + 1, 1);
        CHECK(from_big_compact(extra_long_bytes, out64) == tl::unexpected{DecodingError::kOverflow});

        uint32_t out32{0};
        CHECK(from_big_compact(*from_hex("00AB"), out32) == tl::unexpected{DecodingError::kLeadingZero});
        REQUIRE(from_big_compact(*from_hex("ABCDEF01"), out32));
        CHECK(out32 == 0xABCDEF01);

        uint8_t out8{0};
        REQUIRE(from_big_compact(*from_hex("FE"), out8));
        CHECK(out8 == 0xFE);
        CHECK(from_big_compact(*from_hex("0100"), out8) == tl::unexpected{DecodingError::kOverflow});

        intx::uint256 out256{0};
        REQUIRE(from_big_compact(*from_hex("0100000000000000000000"), out256));
        CHECK(out256 == intx::uint256{1} << 80);
    }
}

}  // namespace rlpkit::endian
