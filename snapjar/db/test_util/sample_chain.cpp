// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "sample_chain.hpp"

#include <stdexcept>
#include <utility>

#include <snapjar/core/common/util.hpp>
#include <snapjar/core/crypto/ecdsa.hpp>
#include <snapjar/core/types/hash.hpp>

#include "segment_builder.hpp"

namespace snapjar::test_util {

using namespace evmc::literals;

const std::vector<Bytes> kSamplePrivateKeys{
    *from_hex("45a915e4d060149eb4365960e6a7a45f334393093061116b197e3240065ff2d8"),
    *from_hex("4c0883a69102937d6231471b5dbb6204fe5129617082792ae468d01a3f362318"),
};

static constexpr auto kSampleBeneficiary{0x8a40bfaa73256b60764c1bf40675a99083efb075_address};
static constexpr auto kSampleRecipient{0x5df9b87991262f6ba471f09758cde1c0fc1de734_address};

Transaction sign_transaction(UnsignedTransaction txn, ByteView private_key) {
    const auto signature{ecdsa::sign(keccak256(txn.signing_payload()), private_key)};
    if (!signature) {
        throw std::runtime_error{"sign_transaction: cannot sign"};
    }

    Transaction signed_txn;
    static_cast<UnsignedTransaction&>(signed_txn) = std::move(txn);
    signed_txn.r = signature->r;
    signed_txn.s = signature->s;
    signed_txn.odd_y_parity = signature->odd_y_parity;
    return signed_txn;
}

evmc::address address_of(ByteView private_key) {
    const auto address{ecdsa::private_key_to_address(private_key)};
    if (!address) {
        throw std::runtime_error{"address_of: invalid private key"};
    }
    return *address;
}

static UnsignedTransaction make_unsigned_transaction(TxnId txn_id, uint64_t nonce) {
    UnsignedTransaction txn;
    txn.type = static_cast<TransactionType>(txn_id % 3);
    txn.chain_id = 1;
    txn.nonce = nonce;
    txn.gas_limit = 21'000 + txn_id;
    txn.to = kSampleRecipient;
    txn.value = intx::uint256{1'000'000'000} * (txn_id + 1);
    txn.data = Bytes(txn_id % 4, static_cast<uint8_t>(txn_id));
    switch (txn.type) {
        case TransactionType::kLegacy:
            // Legacy transactions carry one gas price only
            txn.max_priority_fee_per_gas = 20'000'000'000;
            txn.max_fee_per_gas = 20'000'000'000;
            break;
        case TransactionType::kAccessList:
            txn.max_priority_fee_per_gas = 30'000'000'000;
            txn.max_fee_per_gas = 30'000'000'000;
            txn.access_list = {{kSampleRecipient, {evmc::bytes32{txn_id}}}};
            break;
        case TransactionType::kDynamicFee:
            txn.max_priority_fee_per_gas = 1'000'000'000;
            txn.max_fee_per_gas = 40'000'000'000;
            break;
    }
    return txn;
}

SampleChain SampleChain::make(BlockNum first_block_num, size_t block_count, TxnId first_txn_id, size_t txns_per_block) {
    SampleChain chain;
    chain.first_block_num = first_block_num;
    chain.first_txn_id = first_txn_id;

    std::vector<evmc::address> accounts;
    for (const auto& private_key : kSamplePrivateKeys) {
        accounts.push_back(address_of(private_key));
    }
    std::vector<uint64_t> nonces(kSamplePrivateKeys.size(), 0);

    Hash parent_hash;
    TotalDifficulty total_difficulty{0};
    TxnId txn_id{first_txn_id};
    for (size_t i{0}; i < block_count; ++i) {
        const BlockNum block_num{first_block_num + i};

        uint64_t cumulative_gas_used{0};
        for (size_t j{0}; j < txns_per_block; ++j, ++txn_id) {
            const size_t account{txn_id % kSamplePrivateKeys.size()};
            auto txn{sign_transaction(make_unsigned_transaction(txn_id, nonces[account]++), kSamplePrivateKeys[account])};

            cumulative_gas_used += txn.gas_limit;
            Receipt receipt{
                .type = txn.type,
                .success = txn_id % 4 != 3,
                .cumulative_gas_used = cumulative_gas_used,
                .bloom = {},
                .logs = {Log{
                    .address = kSampleRecipient,
                    .topics = {evmc::bytes32{txn_id}, evmc::bytes32{block_num}},
                    .data = Bytes(txn_id % 3, 0xab),
                }},
            };
            receipt.bloom = logs_bloom(receipt.logs);

            chain.transactions.push_back(std::move(txn));
            chain.senders.push_back(accounts[account]);
            chain.receipts.push_back(std::move(receipt));
        }

        BlockHeader header;
        header.parent_hash = parent_hash;
        header.beneficiary = kSampleBeneficiary;
        header.state_root = evmc::bytes32{block_num * 7 + 1};
        header.difficulty = 131'072 + block_num;
        header.number = block_num;
        header.gas_limit = 30'000'000;
        header.gas_used = cumulative_gas_used;
        header.timestamp = 1'600'000'000 + block_num * 12;
        header.extra_data = *from_hex("736e61706a6172");
        header.base_fee_per_gas = 7;

        total_difficulty += header.difficulty;
        parent_hash = header.hash();
        chain.headers.push_back(std::move(header));
        chain.total_difficulties.push_back(total_difficulty);
    }
    return chain;
}

Bytes SampleChain::headers_segment() const {
    SegmentBuilder builder{SegmentKind::headers, first_block_num};
    for (size_t i{0}; i < headers.size(); ++i) {
        builder.add_header(headers[i], total_difficulties[i]);
    }
    return builder.build();
}

Bytes SampleChain::transactions_segment() const {
    SegmentBuilder builder{SegmentKind::transactions, first_txn_id};
    for (const auto& txn : transactions) {
        builder.add_transaction(txn);
    }
    return builder.build();
}

Bytes SampleChain::receipts_segment() const {
    SegmentBuilder builder{SegmentKind::receipts, first_txn_id};
    for (const auto& receipt : receipts) {
        builder.add_receipt(receipt);
    }
    return builder.build();
}

}  // namespace snapjar::test_util
