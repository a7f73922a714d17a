// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <vector>

#include <evmc/evmc.hpp>

#include <snapjar/core/common/base.hpp>
#include <snapjar/core/common/bytes.hpp>
#include <snapjar/core/types/block.hpp>
#include <snapjar/core/types/receipt.hpp>
#include <snapjar/core/types/transaction.hpp>

namespace snapjar::test_util {

//! Private keys of the accounts sending the sample transactions
extern const std::vector<Bytes> kSamplePrivateKeys;

//! Sign the transaction with the specified private key
Transaction sign_transaction(UnsignedTransaction txn, ByteView private_key);

//! Address of the account owning the specified private key
evmc::address address_of(ByteView private_key);

//! Deterministic chain of headers, signed transactions and receipts
struct SampleChain {
    BlockNum first_block_num{0};
    TxnId first_txn_id{0};

    std::vector<BlockHeader> headers;
    std::vector<TotalDifficulty> total_difficulties;

    std::vector<Transaction> transactions;
    std::vector<evmc::address> senders;
    std::vector<Receipt> receipts;

    //! Generate block_count blocks from first_block_num each one including txns_per_block transactions,
    //! transaction numbers starting at first_txn_id. Transaction types cycle through legacy, access list and dynamic fee
    static SampleChain make(BlockNum first_block_num, size_t block_count, TxnId first_txn_id, size_t txns_per_block);

    //! Content of the segments storing this chain
    Bytes headers_segment() const;
    Bytes transactions_segment() const;
    Bytes receipts_segment() const;
};

}  // namespace snapjar::test_util
