// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "range.hpp"

namespace snapjar::db::chain {

static RowKey saturating_next(RowKey value) {
    return value == kMaxRowKey ? kMaxRowKey : value + 1;
}

RowKeyRange to_range(const RangeBounds& bounds) {
    RowKey start{0};
    switch (bounds.start.kind()) {
        case Bound::Kind::kIncluded:
            start = bounds.start.value();
            break;
        case Bound::Kind::kExcluded:
            start = saturating_next(bounds.start.value());
            break;
        case Bound::Kind::kUnbounded:
            start = 0;
            break;
    }

    RowKey end{kMaxRowKey};
    switch (bounds.end.kind()) {
        case Bound::Kind::kIncluded:
            end = saturating_next(bounds.end.value());
            break;
        case Bound::Kind::kExcluded:
            end = bounds.end.value();
            break;
        case Bound::Kind::kUnbounded:
            end = kMaxRowKey;
            break;
    }

    return {start, end};
}

}  // namespace snapjar::db::chain
