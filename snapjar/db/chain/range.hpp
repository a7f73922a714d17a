// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <snapjar/core/common/base.hpp>

namespace snapjar::db::chain {

//! One end of a range of row keys: included value, excluded value or no limit at all
class Bound {
  public:
    enum class Kind : uint8_t {
        kIncluded,
        kExcluded,
        kUnbounded,
    };

    static Bound included(RowKey value) { return Bound{Kind::kIncluded, value}; }
    static Bound excluded(RowKey value) { return Bound{Kind::kExcluded, value}; }
    static Bound unbounded() { return Bound{Kind::kUnbounded, 0}; }

    Kind kind() const { return kind_; }
    RowKey value() const { return value_; }

    friend bool operator==(const Bound&, const Bound&) = default;

  private:
    Bound(Kind kind, RowKey value) : kind_{kind}, value_{value} {}

    Kind kind_;
    RowKey value_;
};

//! Range of row keys with arbitrary start and end bounds
struct RangeBounds {
    Bound start{Bound::unbounded()};
    Bound end{Bound::unbounded()};

    //! [start, end)
    static RangeBounds half_open(RowKey start, RowKey end) {
        return {Bound::included(start), Bound::excluded(end)};
    }

    //! [start, end]
    static RangeBounds closed(RowKey start, RowKey end) {
        return {Bound::included(start), Bound::included(end)};
    }

    //! [start, ..)
    static RangeBounds from(RowKey start) {
        return {Bound::included(start), Bound::unbounded()};
    }

    friend bool operator==(const RangeBounds&, const RangeBounds&) = default;
};

//! \brief Normalize any range bounds into the half-open interval [start, end)
//! \details Unbounded start maps to zero and unbounded end to kMaxRowKey, which is *not* the segment length.
//! Values that cannot be shifted by one without overflow saturate at kMaxRowKey.
RowKeyRange to_range(const RangeBounds& bounds);

}  // namespace snapjar::db::chain
