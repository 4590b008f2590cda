// Copyright 2026 The rlpkit Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>

#include <CLI/CLI.hpp>

#include <rlpkit/infra/common/log.hpp>

namespace rlpkit::cmd::common {

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Set up option for the maximum list nesting accepted by the decoder
void add_option_max_depth(CLI::App& cli, size_t& max_depth);

}  // namespace rlpkit::cmd::common
