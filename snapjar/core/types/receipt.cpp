// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "receipt.hpp"

#include <utility>

#include <snapjar/core/types/hash.hpp>

namespace snapjar {

namespace rlp {

    void encode(Writer& writer, const Log& log) {
        writer.begin_list().add(log.address).add(log.topics).add(ByteView{log.data}).end_list();
    }

    DecodingResult decode(Reader& reader, Log& log) {
        auto items{reader.list()};
        if (!items) return tl::unexpected{items.error()};
        if (auto res{items->read(log.address, log.topics, log.data)}; !res) return res;
        return items->finish();
    }

}  // namespace rlp

void add_to_bloom(Bloom& bloom, ByteView item) {
    const Hash hash{keccak256(item)};
    // Each of the first three byte pairs of the hash selects one bit out of 2048
    for (size_t pair{0}; pair < 3; ++pair) {
        const unsigned bit{((hash.bytes[2 * pair] & 0x07u) << 8) | hash.bytes[2 * pair + 1]};
        bloom[kBloomByteLength - 1 - bit / 8] |= static_cast<uint8_t>(1u << (bit % 8));
    }
}

Bloom logs_bloom(const std::vector<Log>& logs) {
    Bloom bloom{};
    for (const auto& log : logs) {
        add_to_bloom(bloom, ByteView{log.address.bytes});
        for (const auto& topic : log.topics) {
            add_to_bloom(bloom, ByteView{topic.bytes});
        }
    }
    return bloom;
}

Bytes encode_receipt(const Receipt& receipt) {
    rlp::Writer writer;
    if (receipt.type != TransactionType::kLegacy) {
        const uint8_t type_byte{static_cast<uint8_t>(receipt.type)};
        writer.add_raw(ByteView{&type_byte, 1});
    }
    writer.begin_list()
        .add(receipt.success)
        .add(receipt.cumulative_gas_used)
        .add(receipt.bloom)
        .add(receipt.logs)
        .end_list();
    return std::move(writer).release();
}

tl::expected<Receipt, DecodingError> decode_receipt(ByteView envelope) {
    if (envelope.empty()) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    Receipt receipt;
    if (envelope[0] < rlp::kListOffset) {
        receipt.type = static_cast<TransactionType>(envelope[0]);
        if (receipt.type != TransactionType::kAccessList && receipt.type != TransactionType::kDynamicFee) {
            return tl::unexpected{DecodingError::kUnsupportedTransactionType};
        }
        envelope.remove_prefix(1);
    }
    auto items{rlp::read_list(envelope)};
    if (!items) {
        return tl::unexpected{items.error()};
    }
    if (auto res{items->read(receipt.success, receipt.cumulative_gas_used, receipt.bloom, receipt.logs)}; !res) {
        return tl::unexpected{res.error()};
    }
    if (auto res{items->finish()}; !res) {
        return tl::unexpected{res.error()};
    }
    return receipt;
}

}  // namespace snapjar
