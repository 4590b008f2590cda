// Copyright 2026 The rlpkit Authors
// SPDX-License-Identifier: Apache-2.0

#include "ensure.hpp"

#include <string>

#include <catch2/catch.hpp>

namespace rlpkit {

TEST_CASE("ensure", "[rlpkit][infra][ensure]") {
    CHECK_NOTHROW(ensure(true, "ignored"));
    CHECK_THROWS_AS(ensure(false, "error"), std::logic_error);
    CHECK_THROWS_WITH(ensure(false, "condition violation"), "condition violation");

    const std::string owned{"owned message"};
    CHECK_THROWS_WITH(ensure(false, owned), "owned message");
}

TEST_CASE("ensure dynamic message", "[rlpkit][infra][ensure]") {
    int built{0};
    CHECK_NOTHROW(ensure(true, [&]() { ++built; return "ignored"; }));
    CHECK(built == 0);

    CHECK_THROWS_AS(ensure(false, []() { return "error"; }), std::logic_error);
    CHECK_THROWS_WITH(ensure(false, [&]() { ++built; return "fixture " + std::to_string(42); }), "fixture 42");
    CHECK(built == 1);
}

}  // namespace rlpkit
