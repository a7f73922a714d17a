// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace snapjar::snapshots {

//! The kind of data stored in a segment (enumerator names are used as-is in segment file names)
enum class SegmentKind : uint8_t {
    headers = 0,
    transactions = 1,
    receipts = 2,
};

//! Number of columns stored in each row of a segment of the given kind
constexpr size_t column_count_of(SegmentKind kind) {
    switch (kind) {
        case SegmentKind::headers:
            return 3;
        case SegmentKind::transactions:
        case SegmentKind::receipts:
            return 1;
    }
    return 0;
}

//! Flag indicating if segments of the given kind carry a hash index
constexpr bool is_indexed(SegmentKind kind) {
    return kind != SegmentKind::receipts;
}

std::string_view to_string(SegmentKind kind);

std::optional<SegmentKind> segment_kind_from_string(std::string_view name);

}  // namespace snapjar::snapshots
