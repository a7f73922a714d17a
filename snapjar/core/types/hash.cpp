// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "hash.hpp"

#include <algorithm>

#include <ethash/keccak.hpp>
#include <evmc/hex.hpp>
#include <intx/intx.hpp>

#include <snapjar/core/common/util.hpp>

namespace snapjar {

std::optional<Hash> Hash::from_bytes(ByteView data) {
    if (data.size() != kHashLength) {
        return std::nullopt;
    }
    Hash hash;
    std::ranges::copy(data, hash.bytes);
    return hash;
}

std::optional<Hash> Hash::from_hex(std::string_view hex) {
    return evmc::from_hex<Hash>(hex);
}

std::string Hash::to_hex() const {
    return snapjar::to_hex(view(), /*with_prefix=*/true);
}

uint64_t Hash::prefix_u64() const {
    return intx::be::unsafe::load<uint64_t>(bytes);
}

Hash keccak256(ByteView data) {
    const ethash::hash256 digest{ethash::keccak256(data.data(), data.size())};
    Hash hash;
    std::ranges::copy(digest.bytes, hash.bytes);
    return hash;
}

}  // namespace snapjar
