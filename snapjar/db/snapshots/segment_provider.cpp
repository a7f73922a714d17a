// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "segment_provider.hpp"

#include <algorithm>
#include <string>

#include <snapjar/db/chain/provider_error.hpp>
#include <snapjar/db/chain/sender_recovery.hpp>
#include <snapjar/infra/common/ensure.hpp>
#include <snapjar/infra/common/log.hpp>

namespace snapjar::snapshots {

using db::chain::ExecutionException;
using db::chain::ProviderError;
using db::chain::ProviderException;
using db::chain::RangeBounds;
using db::chain::to_range;
using db::chain::ValidationError;

SegmentProvider& SegmentProvider::with_auxiliary(SegmentProvider auxiliary) {
    const SegmentKind auxiliary_kind{auxiliary.segment().kind()};
    ensure_pre_condition(auxiliary_kind == SegmentKind::transactions && auxiliary_kind != segment_->kind(), [&]() {
        return "SegmentProvider: " + std::string{to_string(auxiliary_kind)} + " segment cannot help querying " +
               std::string{to_string(segment_->kind())} + " segment " + segment_->path().filename();
    });
    auxiliary_ = std::make_unique<SegmentProvider>(std::move(auxiliary));
    return *this;
}

bool SegmentProvider::hash_matches(const Hash& decoded, const Hash& queried) const {
    if (decoded != queried) {
        SNAP_TRACE << "SegmentProvider: hash mismatch in " << segment_->path().filename()
                   << " queried: " << queried.to_hex() << " decoded: " << decoded.to_hex();
        return false;
    }
    return true;
}

std::optional<Transaction> SegmentProvider::find_transaction(SegmentCursor& cursor, const Hash& tx_hash) const {
    return cursor.find_one<TransactionMask<TransactionColumn>>(
        tx_hash, [&](const Transaction& transaction) { return hash_matches(compute_hash(transaction), tx_hash); });
}

RowKeyRange SegmentProvider::clamp(RowKeyRange range) const {
    const RowKey start{std::max(range.start, segment_->row_key_from())};
    const RowKey end{std::min(range.end, segment_->row_key_to())};
    return start < end ? RowKeyRange{start, end} : RowKeyRange{start, start};
}

void SegmentProvider::throw_unsupported(const char* query) {
    throw ProviderException{ProviderError::kUnsupportedProvider, std::string{"SegmentProvider::"} + query};
}

// HeaderProvider

std::optional<BlockHeader> SegmentProvider::header(const Hash& block_hash) const {
    auto header_and_hash = cursor().find_two<HeaderMask<HeaderColumn, BlockHashColumn>>(
        block_hash, [&](const auto& values) { return hash_matches(values.second, block_hash); });
    if (!header_and_hash) {
        return std::nullopt;
    }
    return std::move(header_and_hash->first);
}

std::optional<BlockHeader> SegmentProvider::header_by_number(BlockNum block_num) const {
    return cursor().get_one<HeaderMask<HeaderColumn>>(block_num);
}

std::optional<TotalDifficulty> SegmentProvider::header_td(const Hash& block_hash) const {
    const auto td_and_hash = cursor().find_two<HeaderMask<TotalDifficultyColumn, BlockHashColumn>>(
        block_hash, [&](const auto& values) { return hash_matches(values.second, block_hash); });
    if (!td_and_hash) {
        return std::nullopt;
    }
    return td_and_hash->first;
}

std::optional<TotalDifficulty> SegmentProvider::header_td_by_number(BlockNum block_num) const {
    return cursor().get_one<HeaderMask<TotalDifficultyColumn>>(block_num);
}

std::vector<BlockHeader> SegmentProvider::headers_range(const RangeBounds& range) const {
    const auto row_keys = clamp(to_range(range));

    auto cursor = this->cursor();
    std::vector<BlockHeader> headers;
    headers.reserve(row_keys.size());
    for (BlockNum block_num{row_keys.start}; block_num < row_keys.end; ++block_num) {
        if (auto header = cursor.get_one<HeaderMask<HeaderColumn>>(block_num)) {
            headers.push_back(std::move(*header));
        }
    }
    return headers;
}

std::vector<SealedHeader> SegmentProvider::sealed_headers_range(const RangeBounds& range) const {
    const auto row_keys = clamp(to_range(range));

    auto cursor = this->cursor();
    std::vector<SealedHeader> headers;
    headers.reserve(row_keys.size());
    for (BlockNum block_num{row_keys.start}; block_num < row_keys.end; ++block_num) {
        if (auto header_and_hash = cursor.get_two<HeaderMask<HeaderColumn, BlockHashColumn>>(block_num)) {
            headers.push_back(seal(std::move(header_and_hash->first), header_and_hash->second));
        }
    }
    return headers;
}

std::optional<SealedHeader> SegmentProvider::sealed_header(BlockNum block_num) const {
    auto header_and_hash = cursor().get_two<HeaderMask<HeaderColumn, BlockHashColumn>>(block_num);
    if (!header_and_hash) {
        return std::nullopt;
    }
    return seal(std::move(header_and_hash->first), header_and_hash->second);
}

// BlockHashReader

std::optional<Hash> SegmentProvider::block_hash(BlockNum block_num) const {
    return cursor().get_one<HeaderMask<BlockHashColumn>>(block_num);
}

std::vector<Hash> SegmentProvider::canonical_hashes_range(BlockNum start, BlockNum end) const {
    if (start >= end) {
        return {};
    }
    const auto row_keys = clamp({start, end});

    auto cursor = this->cursor();
    std::vector<Hash> hashes;
    hashes.reserve(row_keys.size());
    for (BlockNum block_num{row_keys.start}; block_num < row_keys.end; ++block_num) {
        if (const auto hash = cursor.get_one<HeaderMask<BlockHashColumn>>(block_num)) {
            hashes.push_back(*hash);
        }
    }
    return hashes;
}

// BlockNumReader: the chain head is known just by the live database

ChainInfo SegmentProvider::chain_info() const {
    throw_unsupported("chain_info");
}

BlockNum SegmentProvider::best_block_number() const {
    throw_unsupported("best_block_number");
}

BlockNum SegmentProvider::last_block_number() const {
    throw_unsupported("last_block_number");
}

std::optional<BlockNum> SegmentProvider::block_number(const Hash& block_hash) const {
    auto cursor = this->cursor();
    const auto hash = cursor.find_one<HeaderMask<BlockHashColumn>>(
        block_hash, [&](const Hash& decoded) { return hash_matches(decoded, block_hash); });
    if (!hash) {
        return std::nullopt;
    }
    return cursor.number();
}

// TransactionsProvider

std::optional<TxnId> SegmentProvider::transaction_id(const Hash& tx_hash) const {
    auto cursor = this->cursor();
    const auto transaction = find_transaction(cursor, tx_hash);
    if (!transaction) {
        return std::nullopt;
    }
    return cursor.number();
}

std::optional<TransactionWithHash> SegmentProvider::transaction_by_id(TxnId id) const {
    auto transaction = cursor().get_one<TransactionMask<TransactionColumn>>(id);
    if (!transaction) {
        return std::nullopt;
    }
    return with_hash(std::move(*transaction));
}

std::optional<Transaction> SegmentProvider::transaction_by_id_no_hash(TxnId id) const {
    return cursor().get_one<TransactionMask<TransactionColumn>>(id);
}

std::optional<TransactionWithHash> SegmentProvider::transaction_by_hash(const Hash& tx_hash) const {
    auto cursor = this->cursor();
    auto transaction = find_transaction(cursor, tx_hash);
    if (!transaction) {
        return std::nullopt;
    }
    return TransactionWithHash{.transaction = std::move(*transaction), .hash = tx_hash};
}

// Transaction-to-block mapping is available just in the live database indexes: callers must get the transaction
// number range from there and then use transactions_by_tx_range

std::optional<std::pair<TransactionWithHash, TransactionMeta>> SegmentProvider::transaction_by_hash_with_meta(
    const Hash& /*tx_hash*/) const {
    throw_unsupported("transaction_by_hash_with_meta");
}

std::optional<BlockNum> SegmentProvider::transaction_block(TxnId /*id*/) const {
    throw_unsupported("transaction_block");
}

std::optional<std::vector<TransactionWithHash>> SegmentProvider::transactions_by_block(const BlockHashOrNumber& /*block*/) const {
    throw_unsupported("transactions_by_block");
}

std::vector<std::vector<TransactionWithHash>> SegmentProvider::transactions_by_block_range(const RangeBounds& /*range*/) const {
    throw_unsupported("transactions_by_block_range");
}

std::vector<Transaction> SegmentProvider::transactions_by_tx_range(const RangeBounds& range) const {
    const auto row_keys = clamp(to_range(range));

    auto cursor = this->cursor();
    std::vector<Transaction> transactions;
    transactions.reserve(row_keys.size());
    for (TxnId id{row_keys.start}; id < row_keys.end; ++id) {
        if (auto transaction = cursor.get_one<TransactionMask<TransactionColumn>>(id)) {
            transactions.push_back(std::move(*transaction));
        }
    }
    return transactions;
}

std::vector<evmc::address> SegmentProvider::senders_by_tx_range(const RangeBounds& range) const {
    const auto transactions = transactions_by_tx_range(range);
    auto senders = db::chain::recover_senders(transactions, transactions.size(), workers_);
    if (!senders) {
        throw ExecutionException{ValidationError::kSenderRecoveryError,
                                 "SegmentProvider::senders_by_tx_range " + segment_->path().filename()};
    }
    return std::move(*senders);
}

std::optional<evmc::address> SegmentProvider::transaction_sender(TxnId id) const {
    const auto transaction = cursor().get_one<TransactionMask<TransactionColumn>>(id);
    if (!transaction) {
        return std::nullopt;
    }
    return transaction->sender();
}

// ReceiptProvider

std::optional<Receipt> SegmentProvider::receipt(TxnId id) const {
    return cursor().get_one<ReceiptMask<ReceiptColumn>>(id);
}

std::optional<Receipt> SegmentProvider::receipt_by_hash(const Hash& tx_hash) const {
    if (!auxiliary_) {
        return std::nullopt;
    }
    const auto id = auxiliary_->transaction_id(tx_hash);
    if (!id) {
        return std::nullopt;
    }
    return receipt(*id);
}

std::optional<std::vector<Receipt>> SegmentProvider::receipts_by_block(const BlockHashOrNumber& /*block*/) const {
    // Block-to-transactions mapping is available just in the live database: get the transaction number range from
    // there and then call receipt for each one
    throw_unsupported("receipts_by_block");
}

}  // namespace snapjar::snapshots
