// Copyright 2026 The rlpkit Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <array>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <regex>
#include <stdexcept>
#include <thread>

#include <absl/strings/str_cat.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

namespace rlpkit::log {

namespace {

struct LevelTag {
    std::string_view label;
    std::string_view color;
};

// Indexed by Level
constexpr std::array<LevelTag, 7> kLevelTags{{
    {"     ", kColorReset},
    {" CRIT", kBackgroundRed},
    {"ERROR", kColorRed},
    {" WARN", kColorOrangeHigh},
    {" INFO", kColorGreen},
    {"DEBUG", kBackgroundPurple},
    {"TRACE", kColorCoal},
}};

constexpr int kMessageWidth{36};

Settings settings_{};
std::mutex out_mutex_;
std::unique_ptr<std::ofstream> file_;

std::unique_ptr<std::ofstream> open_for_append(const std::string& path) {
    auto file{std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app)};
    if (!file->is_open()) {
        throw std::runtime_error{"Could not open log file " + path};
    }
    return file;
}

}  // namespace

void init(const Settings& settings) {
    file_ = settings.log_file.empty() ? nullptr : open_for_append(settings.log_file);
    settings_ = settings;
    const bool on_terminal{settings_.log_std_out ? is_terminal_stdout() : is_terminal_stderr()};
    settings_.log_nocolor = settings_.log_nocolor || file_ || !on_terminal;
}

Level get_verbosity() { return settings_.log_verbosity; }

void set_verbosity(Level level) { settings_.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= settings_.log_verbosity; }

LineBuffer::LineBuffer(Level level, std::string_view msg, const Args& args) : enabled_{test_verbosity(level)} {
    if (!enabled_) return;

    const LevelTag& tag{kLevelTags[static_cast<size_t>(level)]};
    const absl::TimeZone tz{settings_.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone()};
    ss_ << kColorReset << " " << tag.color << tag.label << kColorReset << " " << kColorWhite << "["
        << absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), tz) << "] " << kColorReset;

    if (settings_.log_threads) {
        std::ostringstream thread_id;
        thread_id << std::this_thread::get_id();
        ss_ << absl::StrCat("[", thread_id.str(), "] ");
    }
    if (!msg.empty()) {
        ss_ << std::left << std::setw(kMessageWidth) << msg;
    }
    write_pairs(args);
}

void LineBuffer::write_pairs(const Args& args) {
    if (!enabled_) return;
    for (size_t i{0}; i < args.size(); ++i) {
        if (i % 2 == 0) {
            ss_ << kColorGreen << args[i] << kColorReset << "=";
        } else {
            ss_ << kColorWhite << args[i] << kColorReset << " ";
        }
    }
}

LineBuffer::~LineBuffer() {
    if (!enabled_) return;

    static const std::regex kEscapeSequence{"\x1b\\[[0-9;]+m"};
    const std::string colored{ss_.str()};
    const std::string plain{std::regex_replace(colored, kEscapeSequence, "")};

    std::scoped_lock lock{out_mutex_};
    (settings_.log_std_out ? std::cout : std::cerr) << (settings_.log_nocolor ? plain : colored) << '\n';
    if (file_) {
        *file_ << plain << '\n';
    }
}

}  // namespace rlpkit::log
