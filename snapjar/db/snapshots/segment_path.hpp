// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <snapjar/core/common/base.hpp>

#include "segment_kind.hpp"

namespace snapjar::snapshots {

//! The scale factor to convert the block numbers to/from the values in segment file names
inline constexpr int kFileNameBlockScaleFactor{1'000};

inline constexpr const char* kSegmentExtension{".jar"};

//! The segment format version 1 aka v1
inline constexpr uint8_t kSegmentV1{1};

//! Path of a segment file, whose name follows the pattern v<version>-<from>-<to>-<kind>.jar
class SegmentPath {
  public:
    [[nodiscard]] static std::optional<SegmentPath> parse(std::filesystem::path path);

    [[nodiscard]] static SegmentPath from(const std::filesystem::path& dir,
                                          uint8_t version,
                                          BlockNum block_from,
                                          BlockNum block_to,
                                          SegmentKind kind);

    [[nodiscard]] std::string filename() const { return path_.filename().string(); }

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    [[nodiscard]] uint8_t version() const { return version_; }

    [[nodiscard]] BlockNum block_from() const { return block_from_; }

    [[nodiscard]] BlockNum block_to() const { return block_to_; }

    [[nodiscard]] SegmentKind kind() const { return kind_; }

    [[nodiscard]] bool exists() const { return std::filesystem::exists(path_); }

    //! Path of the segment of another kind covering the same block range in the same directory
    [[nodiscard]] SegmentPath related_path(SegmentKind kind) const;

    friend bool operator<(const SegmentPath& lhs, const SegmentPath& rhs);
    friend bool operator==(const SegmentPath&, const SegmentPath&) = default;

  private:
    static std::filesystem::path build_filename(uint8_t version, BlockNum block_from, BlockNum block_to, SegmentKind kind);

    SegmentPath(std::filesystem::path path, uint8_t version, BlockNum block_from, BlockNum block_to, SegmentKind kind);

    std::filesystem::path path_;
    uint8_t version_{0};
    BlockNum block_from_{0};
    BlockNum block_to_{0};
    SegmentKind kind_;
};

using SegmentPathList = std::vector<SegmentPath>;

//! List the valid segment paths found in the given directory, sorted
SegmentPathList list_segments(const std::filesystem::path& dir);

}  // namespace snapjar::snapshots
