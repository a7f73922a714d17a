// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>

// Recursive Length Prefix serialization, see Yellow Paper Appendix B.
// The first byte of an item tells its shape:
// [0x00, 0x7f] single byte string, [0x80, 0xbf] string header, [0xc0, 0xff] list header

namespace snapjar::rlp {

inline constexpr uint8_t kStringOffset{0x80};
inline constexpr uint8_t kListOffset{0xC0};

//! Longest payload whose length is packed in the first byte, longer ones get a big-endian length after it
inline constexpr size_t kMaxShortPayload{55};

}  // namespace snapjar::rlp
