// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

#include <tl/expected.hpp>

namespace snapjar {

//! Reasons for rejecting the content of a segment cell
enum class [[nodiscard]] DecodingError : uint8_t {
    kInputTooShort,               // an item runs past the end of its enclosing input
    kInputTooLong,                // bytes follow the last expected item
    kLeadingZero,                 // integer or length prefix not in minimal form
    kNonCanonicalSize,            // item header longer than needed
    kOverflow,                    // integer does not fit its destination type
    kUnexpectedLength,            // fixed-size field of the wrong size
    kUnexpectedList,              // list found where a string is expected
    kUnexpectedString,            // string found where a list is expected
    kUnexpectedListElements,      // list with items missing or left over
    kInvalidVInSignature,         // legacy v neither 27, 28 nor >= 35
    kUnsupportedTransactionType,  // unknown EIP-2718 type byte
};

using DecodingResult = tl::expected<void, DecodingError>;

}  // namespace snapjar
