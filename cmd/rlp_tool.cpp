// Copyright 2026 The rlpkit Authors
// SPDX-License-Identifier: Apache-2.0

#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <rlpkit/core/common/util.hpp>
#include <rlpkit/core/rlp/value.hpp>
#include <rlpkit/infra/cli/common.hpp>
#include <rlpkit/infra/common/decoding_exception.hpp>
#include <rlpkit/infra/common/ensure.hpp>
#include <rlpkit/infra/common/log.hpp>
#include <rlpkit/infra/json/rlp_value.hpp>

using namespace rlpkit;

static Bytes hex_or_throw(const std::string& hex) {
    auto bytes{from_hex(hex)};
    if (!bytes) {
        throw std::invalid_argument{"invalid hex string: " + abridge(hex, 32)};
    }
    return std::move(*bytes);
}

static int encode_value(const std::string& input, size_t max_depth) {
    const auto json{nlohmann::json::parse(input)};
    const Bytes encoded{rlp::encode(rlp::value_from_fixture(json, max_depth))};
    std::cout << to_hex(encoded, /*with_prefix=*/true) << "\n";
    return 0;
}

static int decode_value(const std::string& input, bool allow_leftover, size_t max_depth) {
    const Bytes encoded{hex_or_throw(input)};
    ByteView view{encoded};
    const auto value{rlp::decode_value(view, max_depth)};
    if (!value) {
        RLPKIT_ERROR_M("Decoding failed", {"error", std::string{to_string(value.error())}, "offset", std::to_string(encoded.size() - view.size())});
        return -1;
    }
    if (!allow_leftover && !view.empty()) {
        RLPKIT_ERROR_M("Decoding failed", {"error", std::string{to_string(DecodingError::kInputTooLong)}, "leftover", std::to_string(view.size())});
        return -1;
    }

    nlohmann::json json;
    rlp::to_json(json, *value);
    std::cout << json.dump(2) << "\n";
    if (!view.empty()) {
        std::cout << "remainder: " << to_hex(view, /*with_prefix=*/true) << "\n";
    }
    return 0;
}

// Checks one test of an Ethereum RLP fixture: {"in": value | "VALID" | "INVALID", "out": hex}
static bool run_fixture_test(const nlohmann::json& test, size_t max_depth) {
    ensure(test.is_object() && test.contains("in") && test.contains("out"), "fixture test needs \"in\" and \"out\"");
    const Bytes expected{hex_or_throw(test.at("out").get<std::string>())};
    const auto& in{test.at("in")};

    ByteView view{expected};
    const auto decoded{rlp::decode_value(view, max_depth)};
    const bool valid{decoded && view.empty()};

    if (in.is_string() && in.get<std::string>() == "INVALID") {
        return !valid;
    }
    if (!valid || rlp::encode(*decoded) != expected) {
        return false;
    }
    if (in.is_string() && in.get<std::string>() == "VALID") {
        return true;
    }
    return rlp::encode(rlp::value_from_fixture(in, max_depth)) == expected;
}

static int check_fixtures(const std::vector<std::string>& files, size_t max_depth) {
    size_t passed{0};
    size_t failed{0};
    for (const auto& file : files) {
        std::ifstream in{file};
        const auto fixture{nlohmann::json::parse(in)};
        ensure(fixture.is_object(), [&]() { return "fixture file " + file + " does not hold a JSON object"; });
        RLPKIT_INFO_M("Running fixture", {"file", file, "tests", std::to_string(fixture.size())});
        for (const auto& [name, test] : fixture.items()) {
            bool ok{false};
            try {
                ok = run_fixture_test(test, max_depth);
            } catch (const std::exception& e) {
                RLPKIT_DEBUG_M("Malformed test", {"name", name, "error", e.what()});
            }
            if (ok) {
                ++passed;
                RLPKIT_TRACE_M("Test passed", {"name", name});
            } else {
                ++failed;
                RLPKIT_ERROR_M("Test failed", {"file", file, "name", name});
            }
        }
    }
    RLPKIT_LOG_M("Done", {"passed", std::to_string(passed), "failed", std::to_string(failed)});
    return failed == 0 ? 0 : -1;
}

int main(int argc, char* argv[]) {
    CLI::App app{"RLP encoding and decoding tool"};
    app.require_subcommand(1);

    log::Settings log_settings;
    cmd::common::add_logging_options(app, log_settings);

    size_t max_depth{rlp::kDefaultMaxDepth};

    auto& encode_cmd = *app.add_subcommand("encode", "Encode a value given in Ethereum RLP fixture notation");
    std::string value_json;
    encode_cmd.add_option("value", value_json, "JSON value, e.g. '[\"cat\", \"dog\", 1024]'")->required();
    cmd::common::add_option_max_depth(encode_cmd, max_depth);

    auto& decode_cmd = *app.add_subcommand("decode", "Decode one RLP item given as hex and print it as JSON");
    std::string encoded_hex;
    bool allow_leftover{false};
    decode_cmd.add_option("hex", encoded_hex, "RLP bytes as hex, with or without 0x prefix")->required();
    decode_cmd.add_flag("--allow-leftover", allow_leftover, "Accept and print bytes following the decoded item");
    cmd::common::add_option_max_depth(decode_cmd, max_depth);

    auto& check_cmd = *app.add_subcommand("check", "Run Ethereum RLP fixture files");
    std::vector<std::string> fixture_files;
    check_cmd.add_option("files", fixture_files, "Fixture JSON files")->required()->check(CLI::ExistingFile);
    cmd::common::add_option_max_depth(check_cmd, max_depth);

    CLI11_PARSE(app, argc, argv)

    try {
        log::init(log_settings);

        if (encode_cmd) {
            return encode_value(value_json, max_depth);
        }
        if (decode_cmd) {
            return decode_value(encoded_hex, allow_leftover, max_depth);
        }
        return check_fixtures(fixture_files, max_depth);
    } catch (const std::exception& e) {
        RLPKIT_CRIT_M("Unrecoverable failure", {"error", e.what()});
        return -1;
    }
}
