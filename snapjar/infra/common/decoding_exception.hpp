// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string_view>
#include <utility>

#include <snapjar/core/common/decoding_result.hpp>

namespace snapjar {

//! Raised when a segment cell does not hold what its column promises
class DecodingException : public std::runtime_error {
  public:
    DecodingException(DecodingError err, std::string_view context);

    DecodingError err() const noexcept { return err_; }

  private:
    DecodingError err_;
};

//! Unwrap a decoding outcome, throwing DecodingException described by context on failure
template <class T>
T value_or_throw(tl::expected<T, DecodingError>&& res, std::string_view context) {
    if (!res) {
        throw DecodingException{res.error(), context};
    }
    return std::move(*res);
}

}  // namespace snapjar
