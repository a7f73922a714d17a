// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <snapjar/core/common/bytes.hpp>

namespace snapjar {

//! Lowercase hex digits of the bytes, optionally 0x-prefixed
std::string to_hex(ByteView bytes, bool with_prefix = false);

//! Bytes of an even-length hex string, 0x prefix allowed; std::nullopt on any other input
std::optional<Bytes> from_hex(std::string_view hex);

}  // namespace snapjar
