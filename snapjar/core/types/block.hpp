// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <utility>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <tl/expected.hpp>

#include <snapjar/core/common/bytes.hpp>
#include <snapjar/core/common/decoding_result.hpp>
#include <snapjar/core/types/hash.hpp>
#include <snapjar/core/types/receipt.hpp>

namespace snapjar {

using TotalDifficulty = intx::uint256;

//! \brief Block header fields in RLP order.
//! \details Fields introduced by later forks are optional and trail the list: each one may be present only if all the
//! previous ones are.
struct BlockHeader {
    evmc::bytes32 parent_hash{};
    evmc::bytes32 ommers_hash{};
    evmc::address beneficiary{};
    evmc::bytes32 state_root{};
    evmc::bytes32 transactions_root{};
    evmc::bytes32 receipts_root{};
    Bloom logs_bloom{};
    intx::uint256 difficulty{0};
    BlockNum number{0};
    uint64_t gas_limit{0};
    uint64_t gas_used{0};
    uint64_t timestamp{0};
    Bytes extra_data;
    evmc::bytes32 mix_hash{};  // prev_randao since EIP-4399
    std::array<uint8_t, 8> nonce{};

    std::optional<intx::uint256> base_fee_per_gas;         // London
    std::optional<evmc::bytes32> withdrawals_root;         // Shanghai
    std::optional<uint64_t> blob_gas_used;                 // Cancun
    std::optional<uint64_t> excess_blob_gas;               // Cancun
    std::optional<evmc::bytes32> parent_beacon_block_root; // Cancun
    std::optional<evmc::bytes32> requests_hash;            // Prague

    //! Keccak-256 of the encoded header, computed on each call
    Hash hash() const;

    friend bool operator==(const BlockHeader&, const BlockHeader&) = default;
};

//! A header travelling with its block hash as read from storage, never recomputed
struct SealedHeader {
    BlockHeader header;
    Hash hash;

    friend bool operator==(const SealedHeader&, const SealedHeader&) = default;
};

inline SealedHeader seal(BlockHeader header, const Hash& hash) {
    return SealedHeader{std::move(header), hash};
}

Bytes encode_block_header(const BlockHeader& header);
tl::expected<BlockHeader, DecodingError> decode_block_header(ByteView data);

//! Total difficulty is stored as a single RLP integer
Bytes encode_total_difficulty(const TotalDifficulty& total_difficulty);
tl::expected<TotalDifficulty, DecodingError> decode_total_difficulty(ByteView data);

}  // namespace snapjar
