// Copyright 2026 The rlpkit Authors
// SPDX-License-Identifier: Apache-2.0

#include "common.hpp"

#include <map>
#include <string>

#include <rlpkit/core/rlp/value.hpp>

namespace rlpkit::cmd::common {

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    std::map<std::string, log::Level> level_mapping{
        {"critical", log::Level::kCritical},
        {"error", log::Level::kError},
        {"warning", log::Level::kWarning},
        {"info", log::Level::kInfo},
        {"debug", log::Level::kDebug},
        {"trace", log::Level::kTrace},
    };
    auto& log_opts = *cli.add_option_group("Log", "Logging options");
    log_opts.add_option("--log.verbosity", log_settings.log_verbosity, "Sets log verbosity")
        ->check(CLI::Range(log::Level::kCritical, log::Level::kTrace))
        ->transform(CLI::Transformer(level_mapping, CLI::ignore_case))
        ->default_val(log::Level::kInfo);
    log_opts.add_flag("--log.stdout", log_settings.log_std_out, "Outputs to std::out instead of std::err");
    log_opts.add_flag("--log.nocolor", log_settings.log_nocolor, "Disable colors on log lines");
    log_opts.add_flag("--log.utc", log_settings.log_utc, "Prints log timings in UTC");
    log_opts.add_flag("--log.threads", log_settings.log_threads, "Prints thread ids");
    log_opts.add_option("--log.file", log_settings.log_file, "Tee all log lines to given file name");
}

void add_option_max_depth(CLI::App& cli, size_t& max_depth) {
    cli.add_option("--max-depth", max_depth, "Maximum nesting of lists accepted on input")
        ->check(CLI::Range(size_t{1}, size_t{1'000'000}))
        ->default_val(rlp::kDefaultMaxDepth);
}

}  // namespace rlpkit::cmd::common
