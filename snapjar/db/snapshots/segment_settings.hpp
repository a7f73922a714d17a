// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>

namespace snapjar::snapshots {

struct SegmentSettings {
    std::filesystem::path repository_dir{"snapshots"};  // Path to the segment repository on disk
    bool print_items{true};                             // Flag indicating if items returned by range queries are printed one by one
};

}  // namespace snapjar::snapshots
