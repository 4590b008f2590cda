// Copyright 2026 The rlpkit Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>

#include <rlpkit/infra/common/log.hpp>

namespace rlpkit::test_util {

//! Overrides the log verbosity for the lifetime of the guard, so tests do not leak settings into each other
class SetLogVerbosityGuard {
  public:
    explicit SetLogVerbosityGuard(log::Level level) : saved_level_{log::get_verbosity()} {
        log::set_verbosity(level);
    }
    ~SetLogVerbosityGuard() { log::set_verbosity(saved_level_); }

    SetLogVerbosityGuard(const SetLogVerbosityGuard&) = delete;
    SetLogVerbosityGuard& operator=(const SetLogVerbosityGuard&) = delete;

  private:
    log::Level saved_level_;
};

//! Redirects everything written to target into replacement until destroyed
class StreamSwap {
  public:
    StreamSwap(std::ostream& target, std::ostream& replacement)
        : target_{target}, saved_buffer_{target.rdbuf(replacement.rdbuf())} {}
    ~StreamSwap() { target_.rdbuf(saved_buffer_); }

    StreamSwap(const StreamSwap&) = delete;
    StreamSwap& operator=(const StreamSwap&) = delete;

  private:
    std::ostream& target_;
    std::streambuf* saved_buffer_;
};

}  // namespace rlpkit::test_util
