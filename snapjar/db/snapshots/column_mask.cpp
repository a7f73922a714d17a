// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "column_mask.hpp"

#include <string>

#include <snapjar/infra/common/decoding_exception.hpp>

namespace snapjar::snapshots {

BlockHeader HeaderColumn::decode(ByteView cell) {
    return value_or_throw(decode_block_header(cell), "header column");
}

TotalDifficulty TotalDifficultyColumn::decode(ByteView cell) {
    return value_or_throw(decode_total_difficulty(cell), "total difficulty column");
}

Hash BlockHashColumn::decode(ByteView cell) {
    const auto hash{Hash::from_bytes(cell)};
    if (!hash) {
        throw DecodingException{DecodingError::kUnexpectedLength, "block hash column of " + std::to_string(cell.size()) + " bytes"};
    }
    return *hash;
}

Transaction TransactionColumn::decode(ByteView cell) {
    return value_or_throw(decode_transaction(cell), "transaction column");
}

Receipt ReceiptColumn::decode(ByteView cell) {
    return value_or_throw(decode_receipt(cell), "receipt column");
}

}  // namespace snapjar::snapshots
