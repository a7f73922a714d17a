// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

namespace snapjar {

using BlockNum = uint64_t;
using TxnId = uint64_t;

inline constexpr BlockNum kMaxBlockNum{std::numeric_limits<BlockNum>::max()};

//! Key of a segment row: the block number in header segments, the transaction number in the others
using RowKey = uint64_t;

inline constexpr RowKey kMaxRowKey{std::numeric_limits<RowKey>::max()};

//! Row keys in [start, end)
struct RowKeyRange {
    RowKey start{0};
    RowKey end{0};

    bool empty() const { return end <= start; }
    bool contains(RowKey key) const { return key >= start && key < end; }
    RowKey size() const { return empty() ? 0 : end - start; }

    std::string to_string() const {
        return "[" + std::to_string(start) + ", " + std::to_string(end) + ")";
    }

    friend bool operator==(const RowKeyRange&, const RowKeyRange&) = default;
};

inline constexpr size_t kAddressLength{20};
inline constexpr size_t kHashLength{32};

}  // namespace snapjar
