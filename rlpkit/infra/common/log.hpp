// Copyright 2026 The rlpkit Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <rlpkit/infra/common/terminal.hpp>

namespace rlpkit::log {

//! Verbosity levels, from always printed (kNone) to most verbose (kTrace)
enum class Level {
    kNone,
    kCritical,
    kError,
    kWarning,
    kInfo,
    kDebug,
    kTrace,
};

struct Settings {
    bool log_std_out{false};  // console output on std::cout instead of std::cerr
    bool log_utc{true};       // timestamps in UTC, local time otherwise
    bool log_nocolor{false};
    bool log_threads{false};  // prefix lines with the thread id
    Level log_verbosity{Level::kInfo};
    std::string log_file;  // copy of every line, without colors; empty for none
};

//! Applies \p settings process-wide. Call once at startup, before any logging.
//! \throws std::runtime_error when settings.log_file cannot be opened for appending
void init(const Settings& settings = {});

Level get_verbosity();
void set_verbosity(Level level);

//! True if a line at \p level would be printed
bool test_verbosity(Level level);

//! Flat key/value list: {"items", "2", "depth", "1"} prints as items=2 depth=1
using Args = std::vector<std::string>;

//! Accumulates one log line and prints it on destruction.
//! Nothing is formatted when the level is filtered out.
class LineBuffer {
  public:
    ~LineBuffer();

    template <class T>
    LineBuffer& operator<<(const T& value) {
        if (enabled_) ss_ << value;
        return *this;
    }
    LineBuffer& operator<<(const Args& args) {
        write_pairs(args);
        return *this;
    }

  protected:
    LineBuffer(Level level, std::string_view msg, const Args& args);

    std::stringstream ss_;

  private:
    void write_pairs(const Args& args);

    const bool enabled_;
};

template <Level level>
class LogBuffer : public LineBuffer {
  public:
    explicit LogBuffer(std::string_view msg = {}, const Args& args = {}) : LineBuffer(level, msg, args) {}
};

}  // namespace rlpkit::log

#define RLPKIT_LOGBUFFER(level_, ...)           \
    if (!rlpkit::log::test_verbosity(level_)) { \
    } else                                      \
        rlpkit::log::LogBuffer<level_>(__VA_ARGS__)

#define RLPKIT_TRACE_M(...) RLPKIT_LOGBUFFER(rlpkit::log::Level::kTrace, __VA_ARGS__)
#define RLPKIT_DEBUG_M(...) RLPKIT_LOGBUFFER(rlpkit::log::Level::kDebug, __VA_ARGS__)
#define RLPKIT_INFO_M(...) RLPKIT_LOGBUFFER(rlpkit::log::Level::kInfo, __VA_ARGS__)
#define RLPKIT_WARN_M(...) RLPKIT_LOGBUFFER(rlpkit::log::Level::kWarning, __VA_ARGS__)
#define RLPKIT_ERROR_M(...) RLPKIT_LOGBUFFER(rlpkit::log::Level::kError, __VA_ARGS__)
#define RLPKIT_CRIT_M(...) RLPKIT_LOGBUFFER(rlpkit::log::Level::kCritical, __VA_ARGS__)
#define RLPKIT_LOG_M(...) RLPKIT_LOGBUFFER(rlpkit::log::Level::kNone, __VA_ARGS__)
