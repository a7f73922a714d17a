// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace snapjar::log {

//! \brief Verbosity levels, a message is printed if its level is lower than or equal to the configured one
enum class Level {
    kNone,      // no severity, always printed
    kCritical,  // the process cannot go on
    kError,
    kWarning,
    kInfo,
    kDebug,
    kTrace,
};

struct Settings {
    bool log_std_out{false};  // print to std::cout instead of std::cerr
    bool log_utc{true};       // timestamps in UTC instead of local time
    bool log_nocolor{false};  // never colorize, forced when not on a terminal or when teeing to file
    bool log_threads{false};  // print the thread id
    Level log_verbosity{Level::kInfo};
    std::string log_file;  // tee every line to this file when not empty
};

//! \brief Apply the settings, throws std::runtime_error if the log file cannot be opened
//! \note Not thread safe, call once at start of process
void init(const Settings& settings = {});

Level get_verbosity();

//! \note Not thread safe, meant for process start and tests
void set_verbosity(Level level);

//! \brief True if messages at the given level are printed with the current settings
bool test_verbosity(Level level);

//! Key-value pairs following the message: key1, value1, key2, value2...
using Args = std::vector<std::string>;

//! \brief BufferBase accumulates one log line and prints it on destruction
class BufferBase {
  public:
    explicit BufferBase(Level level);
    BufferBase(Level level, std::string_view msg, const Args& args);
    ~BufferBase() { flush(); }

    BufferBase(const BufferBase&) = delete;
    BufferBase& operator=(const BufferBase&) = delete;

    template <class T>
    BufferBase& operator<<(const T& value) {
        if (enabled_) line_ << value;
        return *this;
    }
    BufferBase& operator<<(const Args& args) {
        append_args(args);
        return *this;
    }

  protected:
    void append_args(const Args& args);
    void flush();

    const bool enabled_;
    const bool colored_;
    std::ostringstream line_;
};

template <Level level>
class LogBuffer : public BufferBase {
  public:
    LogBuffer() : BufferBase(level) {}
    explicit LogBuffer(std::string_view msg, const Args& args = {}) : BufferBase(level, msg, args) {}
};

}  // namespace snapjar::log

#define SNAP_LOGBUFFER(level_, ...)              \
    if (!snapjar::log::test_verbosity(level_)) { \
    } else                                       \
        snapjar::log::LogBuffer<level_>(__VA_ARGS__)

#define SNAP_TRACE_M(...) SNAP_LOGBUFFER(snapjar::log::Level::kTrace, __VA_ARGS__)
#define SNAP_DEBUG_M(...) SNAP_LOGBUFFER(snapjar::log::Level::kDebug, __VA_ARGS__)
#define SNAP_INFO_M(...) SNAP_LOGBUFFER(snapjar::log::Level::kInfo, __VA_ARGS__)
#define SNAP_WARN_M(...) SNAP_LOGBUFFER(snapjar::log::Level::kWarning, __VA_ARGS__)
#define SNAP_ERROR_M(...) SNAP_LOGBUFFER(snapjar::log::Level::kError, __VA_ARGS__)
#define SNAP_CRIT_M(...) SNAP_LOGBUFFER(snapjar::log::Level::kCritical, __VA_ARGS__)

#define SNAP_TRACE SNAP_TRACE_M()
#define SNAP_DEBUG SNAP_DEBUG_M()
#define SNAP_INFO SNAP_INFO_M()
#define SNAP_WARN SNAP_WARN_M()
#define SNAP_ERROR SNAP_ERROR_M()
#define SNAP_CRIT SNAP_CRIT_M()
