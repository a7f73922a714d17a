// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "util.hpp"

#include <evmc/hex.hpp>

namespace snapjar {

std::string to_hex(ByteView bytes, bool with_prefix) {
    std::string hex{with_prefix ? "0x" : ""};
    hex += evmc::hex(bytes);
    return hex;
}

std::optional<Bytes> from_hex(std::string_view hex) {
    if (hex.starts_with("0x") || hex.starts_with("0X")) {
        hex.remove_prefix(2);
    }
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }
    return evmc::from_hex(hex);
}

}  // namespace snapjar
