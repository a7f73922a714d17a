// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <concepts>
#include <optional>
#include <utility>

#include <snapjar/core/common/base.hpp>
#include <snapjar/core/types/hash.hpp>

#include "column_mask.hpp"
#include "segment.hpp"

namespace snapjar::snapshots {

//! \brief SegmentCursor decodes masked columns from the rows of one segment.
//! \details A cursor remembers the row key of its last successful decode, hence it must not be shared across threads.
//! Keys out of the segment range, hashes missing from the index and empty cells all yield std::nullopt.
//! Lookups by hash walk every row indexed under the hash fingerprint and let the caller accept the decoded value.
class SegmentCursor {
  public:
    explicit SegmentCursor(const Segment& segment) : segment_{segment} {}

    template <typename Mask>
    using OneValue = typename Mask::template Column<0>::ValueType;

    template <typename Mask>
    using TwoValues = std::pair<typename Mask::template Column<0>::ValueType, typename Mask::template Column<1>::ValueType>;

    //! Decode the only column selected by Mask
    template <typename Mask>
        requires(Mask::kSize == 1)
    std::optional<OneValue<Mask>> get_one(RowKey row_key) {
        using C0 = typename Mask::template Column<0>;
        check_kind(Mask::kKind);
        const auto cell = segment_.cell(row_key, C0::kColumn);
        if (!cell) return std::nullopt;
        auto value{C0::decode(*cell)};
        row_key_ = row_key;
        return value;
    }

    //! Decode both columns selected by Mask, std::nullopt if any of them is missing
    template <typename Mask>
        requires(Mask::kSize == 2)
    std::optional<TwoValues<Mask>> get_two(RowKey row_key) {
        using C0 = typename Mask::template Column<0>;
        using C1 = typename Mask::template Column<1>;
        check_kind(Mask::kKind);
        const auto cell0 = segment_.cell(row_key, C0::kColumn);
        const auto cell1 = segment_.cell(row_key, C1::kColumn);
        if (!cell0 || !cell1) return std::nullopt;
        auto values{std::make_pair(C0::decode(*cell0), C1::decode(*cell1))};
        row_key_ = row_key;
        return values;
    }

    //! Decode the only column selected by Mask at the first row indexed under the hash that accept returns true for
    template <typename Mask, std::predicate<const OneValue<Mask>&> Accept>
        requires(Mask::kSize == 1)
    std::optional<OneValue<Mask>> find_one(const Hash& hash, Accept accept) {
        for (const RowKey row_key : segment_.lookup_by_hash(hash)) {
            auto value{get_one<Mask>(row_key)};
            if (value && accept(*value)) return value;
        }
        return std::nullopt;
    }

    //! Decode both columns selected by Mask at the first row indexed under the hash that accept returns true for
    template <typename Mask, std::predicate<const TwoValues<Mask>&> Accept>
        requires(Mask::kSize == 2)
    std::optional<TwoValues<Mask>> find_two(const Hash& hash, Accept accept) {
        for (const RowKey row_key : segment_.lookup_by_hash(hash)) {
            auto values{get_two<Mask>(row_key)};
            if (values && accept(*values)) return values;
        }
        return std::nullopt;
    }

    //! Row key of the last successful decode
    RowKey number() const { return row_key_; }

    const Segment& segment() const { return segment_; }

  private:
    void check_kind(SegmentKind mask_kind) const;

    const Segment& segment_;
    RowKey row_key_{0};
};

}  // namespace snapjar::snapshots
