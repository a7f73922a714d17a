// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "block.hpp"

#include <utility>

#include <snapjar/core/rlp/reader.hpp>
#include <snapjar/core/rlp/writer.hpp>

namespace snapjar {

Hash BlockHeader::hash() const {
    return keccak256(encode_block_header(*this));
}

Bytes encode_block_header(const BlockHeader& header) {
    rlp::Writer writer;
    writer.begin_list()
        .add(header.parent_hash)
        .add(header.ommers_hash)
        .add(header.beneficiary)
        .add(header.state_root)
        .add(header.transactions_root)
        .add(header.receipts_root)
        .add(header.logs_bloom)
        .add(header.difficulty)
        .add(header.number)
        .add(header.gas_limit)
        .add(header.gas_used)
        .add(header.timestamp)
        .add(ByteView{header.extra_data})
        .add(header.mix_hash)
        .add(header.nonce)
        .add(header.base_fee_per_gas)
        .add(header.withdrawals_root)
        .add(header.blob_gas_used)
        .add(header.excess_blob_gas)
        .add(header.parent_beacon_block_root)
        .add(header.requests_hash)
        .end_list();
    return std::move(writer).release();
}

tl::expected<BlockHeader, DecodingError> decode_block_header(ByteView data) {
    auto items{rlp::read_list(data)};
    if (!items) {
        return tl::unexpected{items.error()};
    }
    BlockHeader header;
    const DecodingResult res{items->read(
        header.parent_hash, header.ommers_hash, header.beneficiary, header.state_root, header.transactions_root,
        header.receipts_root, header.logs_bloom, header.difficulty, header.number, header.gas_limit, header.gas_used,
        header.timestamp, header.extra_data, header.mix_hash, header.nonce,
        header.base_fee_per_gas, header.withdrawals_root, header.blob_gas_used, header.excess_blob_gas,
        header.parent_beacon_block_root, header.requests_hash)};
    if (!res) {
        return tl::unexpected{res.error()};
    }
    if (auto end{items->finish()}; !end) {
        return tl::unexpected{end.error()};
    }
    return header;
}

Bytes encode_total_difficulty(const TotalDifficulty& total_difficulty) {
    rlp::Writer writer;
    writer.add(total_difficulty);
    return std::move(writer).release();
}

tl::expected<TotalDifficulty, DecodingError> decode_total_difficulty(ByteView data) {
    rlp::Reader reader{data};
    TotalDifficulty total_difficulty;
    if (auto res{reader.read(total_difficulty)}; !res) {
        return tl::unexpected{res.error()};
    }
    if (!reader.done()) {
        return tl::unexpected{DecodingError::kInputTooLong};
    }
    return total_difficulty;
}

}  // namespace snapjar
