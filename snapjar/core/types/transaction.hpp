// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <tl/expected.hpp>

#include <snapjar/core/common/bytes.hpp>
#include <snapjar/core/common/decoding_result.hpp>
#include <snapjar/core/rlp/reader.hpp>
#include <snapjar/core/rlp/writer.hpp>
#include <snapjar/core/types/hash.hpp>

namespace snapjar {

//! EIP-2930 access list item
struct AccessListEntry {
    evmc::address account{};
    std::vector<evmc::bytes32> storage_keys{};

    friend bool operator==(const AccessListEntry&, const AccessListEntry&) = default;
};

//! EIP-2718 type byte
enum class TransactionType : uint8_t {
    kLegacy = 0,
    kAccessList = 1,  // EIP-2930
    kDynamicFee = 2,  // EIP-1559
};

struct UnsignedTransaction {
    TransactionType type{TransactionType::kLegacy};

    std::optional<intx::uint256> chain_id;  // legacy transactions before EIP-155 have none

    uint64_t nonce{0};
    intx::uint256 max_priority_fee_per_gas{0};  // same as max_fee_per_gas before EIP-1559
    intx::uint256 max_fee_per_gas{0};           // gas price before EIP-1559
    uint64_t gas_limit{0};
    std::optional<evmc::address> to;  // contract creation if missing
    intx::uint256 value{0};
    Bytes data;
    std::vector<AccessListEntry> access_list;

    //! Payload whose Keccak-256 is signed by the sender
    Bytes signing_payload() const;

    friend bool operator==(const UnsignedTransaction&, const UnsignedTransaction&) = default;
};

//! \brief Signed transaction as stored in transaction segments, its hash is not part of it.
//! \see compute_hash and with_hash to get the hash
struct Transaction : public UnsignedTransaction {
    bool odd_y_parity{false};
    intx::uint256 r{0};
    intx::uint256 s{0};

    //! Signature v as defined by EIP-155 (27 or 28 without chain id)
    intx::uint256 v() const;

    //! Split v into y parity and chain id, false if v is neither 27, 28 nor >= 35
    bool set_v(const intx::uint256& v);

    //! \brief Address recovered from the signature, std::nullopt if recovery fails
    //! \remarks Recovery runs on each call, nothing is cached
    std::optional<evmc::address> sender() const;

    friend bool operator==(const Transaction&, const Transaction&) = default;
};

struct TransactionWithHash {
    Transaction transaction;
    Hash hash;

    friend bool operator==(const TransactionWithHash&, const TransactionWithHash&) = default;
};

//! Raw EIP-2718 envelope: the RLP list of a legacy transaction, otherwise the type byte followed by the RLP list
Bytes encode_transaction(const Transaction& txn);

//! Parse a raw EIP-2718 envelope, typed transactions wrapped into an RLP string are rejected
tl::expected<Transaction, DecodingError> decode_transaction(ByteView envelope);

//! Keccak-256 of the raw EIP-2718 envelope
Hash compute_hash(const Transaction& txn);

TransactionWithHash with_hash(Transaction txn);

namespace rlp {
    void encode(Writer& writer, const AccessListEntry& entry);
    DecodingResult decode(Reader& reader, AccessListEntry& entry);
}  // namespace rlp

}  // namespace snapjar
