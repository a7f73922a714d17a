// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>

namespace snapjar {

namespace detail {

    //! The message is either a string or a callable building it, only invoked on failure
    template <typename Message>
    std::string failure_message(const Message& message) {
        if constexpr (std::is_invocable_v<const Message&>) {
            return std::string{message()};
        } else {
            return std::string{message};
        }
    }

}  // namespace detail

//! Ensure that condition is met, otherwise raise std::logic_error
//! Usage: `ensure(condition, "literal")` or `ensure(condition, [&]() { return "Message: " + get_str(); })`
template <typename Message>
void ensure(bool condition, const Message& message) {
    if (!condition) [[unlikely]] {
        throw std::logic_error{detail::failure_message(message)};
    }
}

//! Ensure that an argument satisfies the requirements of the callee, otherwise raise std::invalid_argument
template <typename Message>
void ensure_pre_condition(bool condition, const Message& message) {
    if (!condition) [[unlikely]] {
        throw std::invalid_argument{"Pre-condition violation: " + detail::failure_message(message)};
    }
}

}  // namespace snapjar
