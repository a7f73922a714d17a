// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <concepts>
#include <cstddef>
#include <tuple>

#include <snapjar/core/common/bytes.hpp>
#include <snapjar/core/types/block.hpp>
#include <snapjar/core/types/hash.hpp>
#include <snapjar/core/types/receipt.hpp>
#include <snapjar/core/types/transaction.hpp>

#include "segment_kind.hpp"

namespace snapjar::snapshots {

//! A column descriptor names the segment kind and column it belongs to, its value type and how to decode it
template <typename T>
concept ColumnDescriptor = requires(ByteView cell) {
    typename T::ValueType;
    { T::kKind } -> std::convertible_to<SegmentKind>;
    { T::kColumn } -> std::convertible_to<size_t>;
    { T::decode(cell) } -> std::same_as<typename T::ValueType>;
};

// Decoders throw DecodingException if the cell content is malformed

struct HeaderColumn {
    using ValueType = BlockHeader;
    static constexpr SegmentKind kKind{SegmentKind::headers};
    static constexpr size_t kColumn{0};
    static BlockHeader decode(ByteView cell);
};

struct TotalDifficultyColumn {
    using ValueType = TotalDifficulty;
    static constexpr SegmentKind kKind{SegmentKind::headers};
    static constexpr size_t kColumn{1};
    static TotalDifficulty decode(ByteView cell);
};

struct BlockHashColumn {
    using ValueType = Hash;
    static constexpr SegmentKind kKind{SegmentKind::headers};
    static constexpr size_t kColumn{2};
    static Hash decode(ByteView cell);
};

//! Stored transaction record: the raw EIP-2718 envelope, without any cached hash
struct TransactionColumn {
    using ValueType = Transaction;
    static constexpr SegmentKind kKind{SegmentKind::transactions};
    static constexpr size_t kColumn{0};
    static Transaction decode(ByteView cell);
};

struct ReceiptColumn {
    using ValueType = Receipt;
    static constexpr SegmentKind kKind{SegmentKind::receipts};
    static constexpr size_t kColumn{0};
    static Receipt decode(ByteView cell);
};

//! Selection of one or two columns of the same segment kind to decode from a row
template <SegmentKind kind, ColumnDescriptor... Columns>
    requires(sizeof...(Columns) >= 1 && sizeof...(Columns) <= 2 && ((Columns::kKind == kind) && ...))
struct ColumnMask {
    static constexpr SegmentKind kKind{kind};
    static constexpr size_t kSize{sizeof...(Columns)};

    template <size_t I>
    using Column = std::tuple_element_t<I, std::tuple<Columns...>>;
};

template <ColumnDescriptor... Columns>
using HeaderMask = ColumnMask<SegmentKind::headers, Columns...>;

template <ColumnDescriptor... Columns>
using TransactionMask = ColumnMask<SegmentKind::transactions, Columns...>;

template <ColumnDescriptor... Columns>
using ReceiptMask = ColumnMask<SegmentKind::receipts, Columns...>;

}  // namespace snapjar::snapshots
