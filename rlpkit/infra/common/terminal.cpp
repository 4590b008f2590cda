// Copyright 2026 The rlpkit Authors
// SPDX-License-Identifier: Apache-2.0

#include "terminal.hpp"

#include <cstdio>

#include <unistd.h>

namespace rlpkit {

bool is_terminal_stdout() {
    return isatty(fileno(stdout));
}

bool is_terminal_stderr() {
    return isatty(fileno(stderr));
}

}  // namespace rlpkit
