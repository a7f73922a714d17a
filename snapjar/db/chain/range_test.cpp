// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "range.hpp"

#include <catch2/catch_test_macros.hpp>

namespace snapjar::db::chain {

TEST_CASE("to_range", "[snapjar][db][chain][range]") {
    SECTION("half-open") {
        CHECK(to_range(RangeBounds::half_open(10, 20)) == RowKeyRange{10, 20});
        CHECK(to_range({Bound::included(10), Bound::excluded(20)}) == RowKeyRange{10, 20});
    }
    SECTION("closed") {
        CHECK(to_range(RangeBounds::closed(10, 20)) == RowKeyRange{10, 21});
    }
    SECTION("excluded start") {
        CHECK(to_range({Bound::excluded(10), Bound::excluded(20)}) == RowKeyRange{11, 20});
    }
    SECTION("unbounded start") {
        CHECK(to_range({Bound::unbounded(), Bound::excluded(20)}) == RowKeyRange{0, 20});
    }
    SECTION("unbounded end maps to max row key") {
        CHECK(to_range(RangeBounds::from(5)) == RowKeyRange{5, kMaxRowKey});
        CHECK(to_range(RangeBounds{}) == RowKeyRange{0, kMaxRowKey});
    }
    SECTION("saturation at max row key") {
        CHECK(to_range({Bound::excluded(kMaxRowKey), Bound::unbounded()}) == RowKeyRange{kMaxRowKey, kMaxRowKey});
        CHECK(to_range(RangeBounds::closed(0, kMaxRowKey)) == RowKeyRange{0, kMaxRowKey});
    }
    SECTION("empty and reversed") {
        CHECK(to_range(RangeBounds::half_open(7, 7)).empty());
        CHECK(to_range(RangeBounds::half_open(9, 3)).empty());
        CHECK(to_range(RangeBounds::half_open(9, 3)).size() == 0);
    }
}

TEST_CASE("Bound", "[snapjar][db][chain][range]") {
    CHECK(Bound::included(3).kind() == Bound::Kind::kIncluded);
    CHECK(Bound::included(3).value() == 3);
    CHECK(Bound::excluded(4).kind() == Bound::Kind::kExcluded);
    CHECK(Bound::unbounded().kind() == Bound::Kind::kUnbounded);
    CHECK(Bound::included(3) != Bound::excluded(3));
}

}  // namespace snapjar::db::chain
