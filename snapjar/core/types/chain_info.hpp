// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <variant>

#include <intx/intx.hpp>

#include <snapjar/core/common/base.hpp>
#include <snapjar/core/types/hash.hpp>

namespace snapjar {

//! Current status of the canonical chain
struct ChainInfo {
    Hash best_hash;
    BlockNum best_number{0};

    friend bool operator==(const ChainInfo&, const ChainInfo&) = default;
};

//! Position of a transaction inside the canonical chain
struct TransactionMeta {
    Hash tx_hash;
    uint64_t index{0};
    Hash block_hash;
    BlockNum block_num{0};
    std::optional<intx::uint256> base_fee_per_gas;
    uint64_t timestamp{0};

    friend bool operator==(const TransactionMeta&, const TransactionMeta&) = default;
};

using BlockHashOrNumber = std::variant<BlockNum, Hash>;

}  // namespace snapjar
