// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// See Yellow Paper, Appendix F "Signing Transactions"

#include <optional>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <snapjar/core/common/bytes.hpp>
#include <snapjar/core/types/hash.hpp>

namespace snapjar::ecdsa {

struct Signature {
    intx::uint256 r{0};
    intx::uint256 s{0};
    bool odd_y_parity{false};

    friend bool operator==(const Signature&, const Signature&) = default;
};

//! \brief Checks r and s are within the curve order, and s in its lower half when homestead rules apply (EIP-2)
bool is_valid_signature(const intx::uint256& r, const intx::uint256& s, bool homestead) noexcept;

//! \brief Address of the account owning the 32-byte private key, std::nullopt if the key is invalid
std::optional<evmc::address> private_key_to_address(ByteView private_key);

//! \brief Signs the message hash, std::nullopt if the key is invalid
//! \remarks Used to produce fixtures, segments never need signing
std::optional<Signature> sign(const Hash& message, ByteView private_key);

//! \brief Tries to recover the address used for message signing
//! \return The signer address or std::nullopt if recovery fails
//! \remarks Safe to call concurrently from multiple threads
std::optional<evmc::address> recover_address(const Hash& message, const Signature& signature);

}  // namespace snapjar::ecdsa
