// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <snapjar/db/chain/providers.hpp>
#include <snapjar/infra/concurrency/worker_pool.hpp>

#include "segment.hpp"
#include "segment_cursor.hpp"

namespace snapjar::snapshots {

//! \brief SegmentProvider answers chain data queries reading from one immutable segment.
//! \details It exposes the same query capabilities as the live database. Queries that need data a single segment does
//! not carry (chain head, transaction-to-block mapping, block contents) throw ProviderException and must be asked to the
//! live database instead. Every query keyed by hash checks the hash decoded at each row indexed under its fingerprint,
//! so that index collisions never shadow the row actually holding the queried hash.
//! \warning The provider borrows its segment (and the optional worker pool), which must outlive it
class SegmentProvider : public db::chain::HeaderProvider,
                        public db::chain::BlockHashReader,
                        public db::chain::BlockNumReader,
                        public db::chain::TransactionsProvider,
                        public db::chain::ReceiptProvider {
  public:
    explicit SegmentProvider(const Segment& segment, WorkerPool* workers = nullptr)
        : segment_{&segment}, workers_{workers} {}

    //! Provides a cursor for more granular data access
    SegmentCursor cursor() const { return SegmentCursor{*segment_}; }

    const Segment& segment() const { return *segment_; }

    //! \brief Attach a provider over a transactions segment to help query data from this one
    //! \details Used to resolve transaction hashes into transaction numbers for receipt segments
    //! \throws std::invalid_argument if the auxiliary segment is not a transactions one or has the same kind as this
    SegmentProvider& with_auxiliary(SegmentProvider auxiliary);

    const SegmentProvider* auxiliary() const { return auxiliary_.get(); }

    // HeaderProvider
    std::optional<BlockHeader> header(const Hash& block_hash) const override;
    std::optional<BlockHeader> header_by_number(BlockNum block_num) const override;
    std::optional<TotalDifficulty> header_td(const Hash& block_hash) const override;
    std::optional<TotalDifficulty> header_td_by_number(BlockNum block_num) const override;
    std::vector<BlockHeader> headers_range(const db::chain::RangeBounds& range) const override;
    std::vector<SealedHeader> sealed_headers_range(const db::chain::RangeBounds& range) const override;
    std::optional<SealedHeader> sealed_header(BlockNum block_num) const override;

    // BlockHashReader
    std::optional<Hash> block_hash(BlockNum block_num) const override;
    std::vector<Hash> canonical_hashes_range(BlockNum start, BlockNum end) const override;

    // BlockNumReader
    ChainInfo chain_info() const override;
    BlockNum best_block_number() const override;
    BlockNum last_block_number() const override;
    std::optional<BlockNum> block_number(const Hash& block_hash) const override;

    // TransactionsProvider
    std::optional<TxnId> transaction_id(const Hash& tx_hash) const override;
    std::optional<TransactionWithHash> transaction_by_id(TxnId id) const override;
    std::optional<Transaction> transaction_by_id_no_hash(TxnId id) const override;
    std::optional<TransactionWithHash> transaction_by_hash(const Hash& tx_hash) const override;
    std::optional<std::pair<TransactionWithHash, TransactionMeta>> transaction_by_hash_with_meta(
        const Hash& tx_hash) const override;
    std::optional<BlockNum> transaction_block(TxnId id) const override;
    std::optional<std::vector<TransactionWithHash>> transactions_by_block(const BlockHashOrNumber& block) const override;
    std::vector<std::vector<TransactionWithHash>> transactions_by_block_range(const db::chain::RangeBounds& range) const override;
    std::vector<Transaction> transactions_by_tx_range(const db::chain::RangeBounds& range) const override;
    std::vector<evmc::address> senders_by_tx_range(const db::chain::RangeBounds& range) const override;
    std::optional<evmc::address> transaction_sender(TxnId id) const override;

    // ReceiptProvider
    std::optional<Receipt> receipt(TxnId id) const override;
    std::optional<Receipt> receipt_by_hash(const Hash& tx_hash) const override;
    std::optional<std::vector<Receipt>> receipts_by_block(const BlockHashOrNumber& block) const override;

  private:
    //! Check that the hash decoded at the row resolved by the index is the queried one
    bool hash_matches(const Hash& decoded, const Hash& queried) const;

    //! First transaction indexed under the hash whose own hash is the queried one
    std::optional<Transaction> find_transaction(SegmentCursor& cursor, const Hash& tx_hash) const;

    //! Restrict the row keys to the ones published in the segment
    RowKeyRange clamp(RowKeyRange range) const;

    [[noreturn]] static void throw_unsupported(const char* query);

    const Segment* segment_;
    WorkerPool* workers_;
    std::unique_ptr<SegmentProvider> auxiliary_;
};

}  // namespace snapjar::snapshots
