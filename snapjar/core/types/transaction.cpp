// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "transaction.hpp"

#include <algorithm>
#include <utility>

#include <snapjar/core/crypto/ecdsa.hpp>

namespace snapjar {

namespace rlp {

    void encode(Writer& writer, const AccessListEntry& entry) {
        writer.begin_list().add(entry.account).add(entry.storage_keys).end_list();
    }

    DecodingResult decode(Reader& reader, AccessListEntry& entry) {
        auto items{reader.list()};
        if (!items) return tl::unexpected{items.error()};
        if (auto res{items->read(entry.account, entry.storage_keys)}; !res) return res;
        return items->finish();
    }

}  // namespace rlp

// EIP-155: v = {0,1} + 27 without chain id, v = {0,1} + chain_id * 2 + 35 with it
static constexpr uint64_t kUnprotectedVBase{27};
static constexpr uint64_t kProtectedVBase{35};

intx::uint256 Transaction::v() const {
    const intx::uint256 parity{odd_y_parity ? 1u : 0u};
    if (!chain_id) {
        return parity + kUnprotectedVBase;
    }
    return parity + *chain_id * 2 + kProtectedVBase;
}

bool Transaction::set_v(const intx::uint256& v) {
    if (v == kUnprotectedVBase || v == kUnprotectedVBase + 1) {
        odd_y_parity = v == kUnprotectedVBase + 1;
        chain_id.reset();
        return true;
    }
    if (v < kProtectedVBase) {
        return false;
    }
    odd_y_parity = ((v - kProtectedVBase) & 1) != 0;
    chain_id = (v - kProtectedVBase) >> 1;
    return true;
}

// Fields shared by the signing payload and the signed envelope, in wire order
static void add_common_fields(rlp::Writer& writer, const UnsignedTransaction& txn) {
    const bool typed{txn.type != TransactionType::kLegacy};
    if (typed) {
        writer.add(txn.chain_id.value_or(0));
    }
    writer.add(txn.nonce);
    if (txn.type == TransactionType::kDynamicFee) {
        writer.add(txn.max_priority_fee_per_gas);
    }
    writer.add(txn.max_fee_per_gas).add(txn.gas_limit);
    if (txn.to) {
        writer.add(*txn.to);
    } else {
        writer.add(ByteView{});
    }
    writer.add(txn.value).add(ByteView{txn.data});
    if (typed) {
        writer.add(txn.access_list);
    }
}

static void add_type_byte(rlp::Writer& writer, TransactionType type) {
    if (type != TransactionType::kLegacy) {
        const uint8_t type_byte{static_cast<uint8_t>(type)};
        writer.add_raw(ByteView{&type_byte, 1});
    }
}

Bytes UnsignedTransaction::signing_payload() const {
    rlp::Writer writer;
    add_type_byte(writer, type);
    writer.begin_list();
    add_common_fields(writer, *this);
    if (type == TransactionType::kLegacy && chain_id) {
        writer.add(*chain_id).add(uint64_t{0}).add(uint64_t{0});
    }
    writer.end_list();
    return std::move(writer).release();
}

Bytes encode_transaction(const Transaction& txn) {
    rlp::Writer writer;
    add_type_byte(writer, txn.type);
    writer.begin_list();
    add_common_fields(writer, txn);
    if (txn.type == TransactionType::kLegacy) {
        writer.add(txn.v());
    } else {
        writer.add(txn.odd_y_parity);
    }
    writer.add(txn.r).add(txn.s).end_list();
    return std::move(writer).release();
}

//! Recipient is either a 20-byte address or the empty string for contract creation
static DecodingResult read_recipient(rlp::Reader& items, std::optional<evmc::address>& to) {
    const auto payload{items.string()};
    if (!payload) return tl::unexpected{payload.error()};
    if (payload->empty()) {
        to.reset();
        return {};
    }
    if (payload->size() != kAddressLength) return tl::unexpected{DecodingError::kUnexpectedLength};
    to.emplace();
    std::copy(payload->begin(), payload->end(), to->bytes);
    return {};
}

static DecodingResult read_legacy(ByteView envelope, Transaction& txn) {
    auto items{rlp::read_list(envelope)};
    if (!items) return tl::unexpected{items.error()};

    txn.type = TransactionType::kLegacy;
    if (auto res{items->read(txn.nonce, txn.max_fee_per_gas, txn.gas_limit)}; !res) return res;
    txn.max_priority_fee_per_gas = txn.max_fee_per_gas;
    if (auto res{read_recipient(*items, txn.to)}; !res) return res;

    intx::uint256 v;
    if (auto res{items->read(txn.value, txn.data, v, txn.r, txn.s)}; !res) return res;
    if (!txn.set_v(v)) return tl::unexpected{DecodingError::kInvalidVInSignature};
    return items->finish();
}

static DecodingResult read_typed(ByteView envelope, Transaction& txn) {
    txn.type = static_cast<TransactionType>(envelope[0]);
    if (txn.type != TransactionType::kAccessList && txn.type != TransactionType::kDynamicFee) {
        return tl::unexpected{DecodingError::kUnsupportedTransactionType};
    }
    auto items{rlp::read_list(envelope.substr(1))};
    if (!items) return tl::unexpected{items.error()};

    if (auto res{items->read(txn.chain_id.emplace(), txn.nonce)}; !res) return res;
    if (txn.type == TransactionType::kDynamicFee) {
        if (auto res{items->read(txn.max_priority_fee_per_gas, txn.max_fee_per_gas)}; !res) return res;
    } else {
        if (auto res{items->read(txn.max_fee_per_gas)}; !res) return res;
        txn.max_priority_fee_per_gas = txn.max_fee_per_gas;
    }
    if (auto res{items->read(txn.gas_limit)}; !res) return res;
    if (auto res{read_recipient(*items, txn.to)}; !res) return res;
    if (auto res{items->read(txn.value, txn.data, txn.access_list, txn.odd_y_parity, txn.r, txn.s)}; !res) return res;
    return items->finish();
}

tl::expected<Transaction, DecodingError> decode_transaction(ByteView envelope) {
    if (envelope.empty()) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    Transaction txn;
    const DecodingResult res{envelope[0] >= rlp::kListOffset ? read_legacy(envelope, txn) : read_typed(envelope, txn)};
    if (!res) {
        return tl::unexpected{res.error()};
    }
    return txn;
}

Hash compute_hash(const Transaction& txn) {
    return keccak256(encode_transaction(txn));
}

TransactionWithHash with_hash(Transaction txn) {
    const Hash hash{compute_hash(txn)};
    return {.transaction = std::move(txn), .hash = hash};
}

std::optional<evmc::address> Transaction::sender() const {
    if (!ecdsa::is_valid_signature(r, s, /*homestead=*/false)) {
        return std::nullopt;
    }
    return ecdsa::recover_address(keccak256(signing_payload()), {.r = r, .s = s, .odd_y_parity = odd_y_parity});
}

}  // namespace snapjar
