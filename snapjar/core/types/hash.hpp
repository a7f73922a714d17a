// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <evmc/evmc.hpp>

#include <snapjar/core/common/base.hpp>
#include <snapjar/core/common/bytes.hpp>

namespace snapjar {

//! Keccak-256 digest identifying a block or a transaction
class Hash : public evmc::bytes32 {
  public:
    using evmc::bytes32::bytes32;

    Hash() = default;
    Hash(const evmc::bytes32& value) : evmc::bytes32{value} {}  // NOLINT(*-explicit-*)

    //! Hash held in a view of exactly kHashLength bytes, std::nullopt for any other size
    static std::optional<Hash> from_bytes(ByteView data);

    //! Hash in hex form, 0x prefix allowed
    static std::optional<Hash> from_hex(std::string_view hex);

    std::string to_hex() const;

    //! First 8 bytes read as a big-endian integer, the fingerprint stored in segment indexes
    uint64_t prefix_u64() const;

    ByteView view() const { return ByteView{bytes}; }
};

Hash keccak256(ByteView data);

}  // namespace snapjar

template <>
struct std::hash<snapjar::Hash> : public std::hash<evmc::bytes32> {};
