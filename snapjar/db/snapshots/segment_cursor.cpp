// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "segment_cursor.hpp"

#include <string>

#include <snapjar/infra/common/ensure.hpp>

namespace snapjar::snapshots {

void SegmentCursor::check_kind(SegmentKind mask_kind) const {
    ensure(mask_kind == segment_.kind(), [&]() {
        return "SegmentCursor: mask for " + std::string{to_string(mask_kind)} +
               " used on " + std::string{to_string(segment_.kind())} + " segment " + segment_.path().filename();
    });
}

}  // namespace snapjar::snapshots
