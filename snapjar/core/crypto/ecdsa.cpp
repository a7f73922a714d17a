// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "ecdsa.hpp"

#include <secp256k1.h>

#include <algorithm>

#include <secp256k1_recovery.h>

namespace snapjar::ecdsa {

// See Appendix F "Signing Transactions" of the Yellow Paper.
inline constexpr intx::uint256 kSecp256k1n{
    intx::from_string<intx::uint256>("0xfffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141")};

inline constexpr intx::uint256 kSecp256k1Halfn{kSecp256k1n >> 1};

// Never destroyed, secp256k1 allows concurrent use of a context once created
static secp256k1_context* const kDefaultContext{
    secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY)};

static constexpr size_t kUncompressedPublicKeySize{65};

bool is_valid_signature(const intx::uint256& r, const intx::uint256& s, bool homestead) noexcept {
    if (!r || !s) {
        return false;
    }
    if (r >= kSecp256k1n || s >= kSecp256k1n) {
        return false;
    }
    // https://eips.ethereum.org/EIPS/eip-2
    if (homestead && s > kSecp256k1Halfn) {
        return false;
    }
    return true;
}

//! Address is the last 20 bytes of the hash of the uncompressed key, its 0x04 marker skipped
static evmc::address to_address(const secp256k1_pubkey& public_key) {
    uint8_t serialized[kUncompressedPublicKeySize];
    size_t size{kUncompressedPublicKeySize};
    secp256k1_ec_pubkey_serialize(kDefaultContext, serialized, &size, &public_key, SECP256K1_EC_UNCOMPRESSED);

    const Hash key_hash{keccak256(ByteView{serialized}.substr(1))};
    evmc::address out;
    std::copy_n(key_hash.bytes + kHashLength - kAddressLength, kAddressLength, out.bytes);
    return out;
}

std::optional<evmc::address> private_key_to_address(ByteView private_key) {
    if (private_key.size() != kHashLength || !secp256k1_ec_seckey_verify(kDefaultContext, private_key.data())) {
        return std::nullopt;
    }
    secp256k1_pubkey public_key;
    if (!secp256k1_ec_pubkey_create(kDefaultContext, &public_key, private_key.data())) {
        return std::nullopt;
    }
    return to_address(public_key);
}

std::optional<Signature> sign(const Hash& message, ByteView private_key) {
    if (private_key.size() != kHashLength) {
        return std::nullopt;
    }
    secp256k1_ecdsa_recoverable_signature sig;
    if (!secp256k1_ecdsa_sign_recoverable(kDefaultContext, &sig, message.bytes, private_key.data(), nullptr, nullptr)) {
        return std::nullopt;
    }
    uint8_t compact[2 * kHashLength];
    int recovery_id{0};
    secp256k1_ecdsa_recoverable_signature_serialize_compact(kDefaultContext, compact, &recovery_id, &sig);
    return Signature{
        .r = intx::be::unsafe::load<intx::uint256>(compact),
        .s = intx::be::unsafe::load<intx::uint256>(compact + kHashLength),
        .odd_y_parity = recovery_id == 1,
    };
}

std::optional<evmc::address> recover_address(const Hash& message, const Signature& signature) {
    uint8_t compact[2 * kHashLength];
    intx::be::unsafe::store(compact, signature.r);
    intx::be::unsafe::store(compact + kHashLength, signature.s);

    secp256k1_ecdsa_recoverable_signature sig;
    if (!secp256k1_ecdsa_recoverable_signature_parse_compact(kDefaultContext, &sig, compact, signature.odd_y_parity ? 1 : 0)) {
        return std::nullopt;
    }
    secp256k1_pubkey public_key;
    if (!secp256k1_ecdsa_recover(kDefaultContext, &public_key, &sig, message.bytes)) {
        return std::nullopt;
    }
    return to_address(public_key);
}

}  // namespace snapjar::ecdsa
