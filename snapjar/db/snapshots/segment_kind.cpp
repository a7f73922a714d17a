// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "segment_kind.hpp"

#include <magic_enum.hpp>

namespace snapjar::snapshots {

std::string_view to_string(SegmentKind kind) {
    return magic_enum::enum_name(kind);
}

std::optional<SegmentKind> segment_kind_from_string(std::string_view name) {
    return magic_enum::enum_cast<SegmentKind>(name);
}

}  // namespace snapjar::snapshots
