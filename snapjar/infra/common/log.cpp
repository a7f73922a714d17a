// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <unistd.h>

#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

#include <absl/time/clock.h>
#include <absl/time/time.h>

namespace snapjar::log {

namespace {

    constexpr std::string_view kReset{"\x1b[0m"};
    constexpr std::string_view kCoal{"\x1b[90m"};
    constexpr std::string_view kWhite{"\x1b[97m"};
    constexpr std::string_view kRed{"\x1b[91m"};
    constexpr std::string_view kGreen{"\x1b[32m"};
    constexpr std::string_view kYellow{"\x1b[1;33m"};
    constexpr std::string_view kBackgroundRed{"\x1b[101m"};
    constexpr std::string_view kBackgroundPurple{"\x1b[105m"};

    // Width the message is padded to before key-value pairs
    constexpr int kMessageWidth{41};

    Settings settings_{};
    std::mutex out_mutex_;
    std::unique_ptr<std::ofstream> file_;

    struct LevelTag {
        std::string_view text;
        std::string_view color;
    };

    LevelTag level_tag(Level level) {
        switch (level) {
            case Level::kTrace:
                return {"TRACE", kCoal};
            case Level::kDebug:
                return {"DEBUG", kBackgroundPurple};
            case Level::kInfo:
                return {" INFO", kGreen};
            case Level::kWarning:
                return {" WARN", kYellow};
            case Level::kError:
                return {"ERROR", kRed};
            case Level::kCritical:
                return {" CRIT", kBackgroundRed};
            case Level::kNone:
                break;
        }
        return {"     ", kReset};
    }

    //! Writes text wrapped in color codes only when coloring is on
    struct Painted {
        std::string_view color;
        std::string_view text;
        bool enabled;
    };

    std::ostream& operator<<(std::ostream& out, const Painted& painted) {
        if (painted.enabled) return out << painted.color << painted.text << kReset;
        return out << painted.text;
    }

}  // namespace

void init(const Settings& settings) {
    settings_ = settings;
    file_.reset();
    if (!settings_.log_file.empty()) {
        file_ = std::make_unique<std::ofstream>(settings_.log_file, std::ios::out | std::ios::app);
        if (!file_->is_open()) {
            file_.reset();
            throw std::runtime_error("Could not open log file " + settings_.log_file);
        }
        settings_.log_nocolor = true;
    }
    const int fd{settings_.log_std_out ? fileno(stdout) : fileno(stderr)};
    if (!isatty(fd)) {
        settings_.log_nocolor = true;
    }
}

Level get_verbosity() { return settings_.log_verbosity; }

void set_verbosity(Level level) { settings_.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= settings_.log_verbosity; }

BufferBase::BufferBase(Level level)
    : enabled_{test_verbosity(level)}, colored_{!settings_.log_nocolor} {
    if (!enabled_) return;

    const auto [text, color] = level_tag(level);
    line_ << " " << Painted{color, text, colored_} << " ";

    static const absl::TimeZone kTimeZone{settings_.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone()};
    const std::string timestamp{"[" + absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), kTimeZone) + "]"};
    line_ << Painted{kWhite, timestamp, colored_} << " ";

    if (settings_.log_threads) {
        line_ << "[" << std::this_thread::get_id() << "] ";
    }
}

BufferBase::BufferBase(Level level, std::string_view msg, const Args& args) : BufferBase(level) {
    if (!enabled_) return;
    line_ << std::left << std::setw(kMessageWidth) << msg;
    append_args(args);
}

void BufferBase::append_args(const Args& args) {
    if (!enabled_) return;
    for (size_t i{0}; i < args.size(); ++i) {
        const std::string_view arg{args[i]};
        if (i % 2 == 0) {
            line_ << Painted{kGreen, arg, colored_} << "=";
        } else {
            line_ << Painted{kWhite, arg, colored_} << " ";
        }
    }
}

void BufferBase::flush() {
    if (!enabled_) return;
    const std::string line{line_.str()};
    std::scoped_lock lock{out_mutex_};
    (settings_.log_std_out ? std::cout : std::cerr) << line << '\n';
    if (file_) {
        *file_ << line << '\n';
    }
}

}  // namespace snapjar::log
