// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>
#include <sstream>
#include <string>

#include <snapjar/infra/common/log.hpp>

namespace snapjar::test_util {

//! Restores the log verbosity on scope exit, so that tests can run in any order
class SetLogVerbosityGuard {
  public:
    explicit SetLogVerbosityGuard(log::Level level) : saved_{log::get_verbosity()} { log::set_verbosity(level); }
    ~SetLogVerbosityGuard() { log::set_verbosity(saved_); }

  private:
    log::Level saved_;
};

//! Redirects a stream into a string buffer until scope exit
class CaptureStream {
  public:
    explicit CaptureStream(std::ostream& stream) : stream_{stream}, saved_{stream.rdbuf(captured_.rdbuf())} {}
    ~CaptureStream() { stream_.rdbuf(saved_); }

    std::string str() const { return captured_.str(); }

  private:
    std::ostream& stream_;
    std::ostringstream captured_;
    std::streambuf* saved_;
};

}  // namespace snapjar::test_util
