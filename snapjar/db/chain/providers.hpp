// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <utility>
#include <vector>

#include <evmc/evmc.hpp>

#include <snapjar/core/common/base.hpp>
#include <snapjar/core/types/block.hpp>
#include <snapjar/core/types/chain_info.hpp>
#include <snapjar/core/types/hash.hpp>
#include <snapjar/core/types/receipt.hpp>
#include <snapjar/core/types/transaction.hpp>

#include "range.hpp"

// Query capabilities shared by every chain data provider, either backed by the live database or by immutable segments.
// Not-found is reported as std::nullopt (or as a shorter result for range queries), while queries that a provider
// cannot answer by construction throw ProviderException with ProviderError::kUnsupportedProvider.

namespace snapjar::db::chain {

//! HeaderProvider gives access to block headers and their total difficulty
class HeaderProvider {
  public:
    virtual ~HeaderProvider() = default;

    //! Get the header with the specified block hash
    virtual std::optional<BlockHeader> header(const Hash& block_hash) const = 0;

    //! Get the header at the specified block number
    virtual std::optional<BlockHeader> header_by_number(BlockNum block_num) const = 0;

    //! Get the total difficulty of the block with the specified hash
    virtual std::optional<TotalDifficulty> header_td(const Hash& block_hash) const = 0;

    //! Get the total difficulty of the block at the specified number
    virtual std::optional<TotalDifficulty> header_td_by_number(BlockNum block_num) const = 0;

    //! Get the headers in the specified range, skipping the missing ones
    virtual std::vector<BlockHeader> headers_range(const RangeBounds& range) const = 0;

    //! Get the sealed headers in the specified range, skipping the missing ones
    virtual std::vector<SealedHeader> sealed_headers_range(const RangeBounds& range) const = 0;

    //! Get the sealed header at the specified block number
    virtual std::optional<SealedHeader> sealed_header(BlockNum block_num) const = 0;
};

//! BlockHashReader gives access to canonical block hashes
class BlockHashReader {
  public:
    virtual ~BlockHashReader() = default;

    //! Get the hash of the block at the specified number
    virtual std::optional<Hash> block_hash(BlockNum block_num) const = 0;

    //! Get the canonical hashes in [start, end), skipping the missing ones
    virtual std::vector<Hash> canonical_hashes_range(BlockNum start, BlockNum end) const = 0;
};

//! BlockNumReader gives access to block numbers and to the chain head
class BlockNumReader {
  public:
    virtual ~BlockNumReader() = default;

    virtual ChainInfo chain_info() const = 0;

    virtual BlockNum best_block_number() const = 0;

    virtual BlockNum last_block_number() const = 0;

    //! Get the number of the block with the specified hash
    virtual std::optional<BlockNum> block_number(const Hash& block_hash) const = 0;
};

//! TransactionsProvider gives access to signed transactions and their senders
class TransactionsProvider {
  public:
    virtual ~TransactionsProvider() = default;

    //! Get the transaction number of the transaction with the specified hash
    virtual std::optional<TxnId> transaction_id(const Hash& tx_hash) const = 0;

    //! Get the transaction with the specified number, hash included
    virtual std::optional<TransactionWithHash> transaction_by_id(TxnId id) const = 0;

    //! Get the transaction with the specified number, hash *not* included
    virtual std::optional<Transaction> transaction_by_id_no_hash(TxnId id) const = 0;

    //! Get the transaction with the specified hash
    virtual std::optional<TransactionWithHash> transaction_by_hash(const Hash& tx_hash) const = 0;

    //! Get the transaction with the specified hash together with its position in the chain
    virtual std::optional<std::pair<TransactionWithHash, TransactionMeta>> transaction_by_hash_with_meta(
        const Hash& tx_hash) const = 0;

    //! Get the number of the block including the transaction with the specified number
    virtual std::optional<BlockNum> transaction_block(TxnId id) const = 0;

    //! Get the transactions of the specified block
    virtual std::optional<std::vector<TransactionWithHash>> transactions_by_block(const BlockHashOrNumber& block) const = 0;

    //! Get the transactions of each block in the specified range
    virtual std::vector<std::vector<TransactionWithHash>> transactions_by_block_range(const RangeBounds& range) const = 0;

    //! Get the transactions in the specified range of transaction numbers, skipping the missing ones
    virtual std::vector<Transaction> transactions_by_tx_range(const RangeBounds& range) const = 0;

    //! Get the senders of the transactions in the specified range of transaction numbers
    //! \throws ExecutionException if any sender in the range cannot be recovered
    virtual std::vector<evmc::address> senders_by_tx_range(const RangeBounds& range) const = 0;

    //! Get the sender of the transaction with the specified number
    virtual std::optional<evmc::address> transaction_sender(TxnId id) const = 0;
};

//! ReceiptProvider gives access to transaction receipts
class ReceiptProvider {
  public:
    virtual ~ReceiptProvider() = default;

    //! Get the receipt of the transaction with the specified number
    virtual std::optional<Receipt> receipt(TxnId id) const = 0;

    //! Get the receipt of the transaction with the specified hash
    virtual std::optional<Receipt> receipt_by_hash(const Hash& tx_hash) const = 0;

    //! Get the receipts of the specified block
    virtual std::optional<std::vector<Receipt>> receipts_by_block(const BlockHashOrNumber& block) const = 0;
};

}  // namespace snapjar::db::chain
