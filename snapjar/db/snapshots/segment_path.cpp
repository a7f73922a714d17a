// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "segment_path.hpp"

#include <algorithm>
#include <charconv>
#include <string_view>
#include <tuple>
#include <utility>

#include <absl/strings/str_format.h>
#include <absl/strings/str_split.h>

#include <snapjar/infra/common/ensure.hpp>
#include <snapjar/infra/common/log.hpp>

namespace snapjar::snapshots {

namespace fs = std::filesystem;

//! Parse the whole token as unsigned integer
template <typename T>
static bool parse_number(absl::string_view token, T& value) {
    const char* end = token.data() + token.size();
    const auto result = std::from_chars(token.data(), end, value);
    return result.ec == std::errc{} && result.ptr == end;
}

std::optional<SegmentPath> SegmentPath::parse(fs::path path) {
    if (path.extension().string() != kSegmentExtension) {
        return std::nullopt;
    }
    const std::string filename_no_ext = path.stem().string();

    // Expected stem format: <version>-<6_digit_block_from>-<6_digit_block_to>-<kind>
    const std::vector<absl::string_view> tokens = absl::StrSplit(filename_no_ext, '-');
    if (tokens.size() != 4) {
        return std::nullopt;
    }

    const auto [ver, scaled_from, scaled_to, tag] = std::tie(tokens[0], tokens[1], tokens[2], tokens[3]);

    // Expected version format: v<x> (hence check length, check first char and parse w/ offset by one)
    if (ver.size() < 2 || ver[0] != 'v') {
        return std::nullopt;
    }
    uint8_t version{0};
    if (!parse_number(ver.substr(1), version)) {
        return std::nullopt;
    }

    // Expected scaled block format: <dddddd>
    if (scaled_from.size() != 6 || scaled_to.size() != 6) {
        return std::nullopt;
    }
    BlockNum scaled_block_from{0};
    if (!parse_number(scaled_from, scaled_block_from)) {
        return std::nullopt;
    }
    BlockNum scaled_block_to{0};
    if (!parse_number(scaled_to, scaled_block_to)) {
        return std::nullopt;
    }
    const BlockNum block_from{scaled_block_from * kFileNameBlockScaleFactor};
    const BlockNum block_to{scaled_block_to * kFileNameBlockScaleFactor};

    // Expected proper block range: [block_from, block_to)
    if (block_to < block_from) {
        return std::nullopt;
    }

    // Expected kind format: headers|transactions|receipts
    const auto kind = segment_kind_from_string(std::string_view{tag.data(), tag.size()});
    if (!kind) {
        return std::nullopt;
    }

    return SegmentPath{std::move(path), version, block_from, block_to, *kind};
}

SegmentPath SegmentPath::from(const fs::path& dir, uint8_t version, BlockNum block_from, BlockNum block_to, SegmentKind kind) {
    const auto filename = SegmentPath::build_filename(version, block_from, block_to, kind);
    return SegmentPath{dir / filename, version, block_from, block_to, kind};
}

SegmentPath SegmentPath::related_path(SegmentKind kind) const {
    return SegmentPath::from(path_.parent_path(), version_, block_from_, block_to_, kind);
}

fs::path SegmentPath::build_filename(uint8_t version, BlockNum block_from, BlockNum block_to, SegmentKind kind) {
    const std::string_view kind_name{to_string(kind)};
    std::string filename{absl::StrFormat("v%d-%06d-%06d-%s%s",
                                         version,
                                         block_from / kFileNameBlockScaleFactor,
                                         block_to / kFileNameBlockScaleFactor,
                                         kind_name,
                                         kSegmentExtension)};
    return fs::path{filename};
}

SegmentPath::SegmentPath(fs::path path, uint8_t version, BlockNum block_from, BlockNum block_to, SegmentKind kind)
    : path_(std::move(path)), version_(version), block_from_(block_from), block_to_(block_to), kind_(kind) {
    ensure(block_to >= block_from, "SegmentPath: block_to less than block_from");
}

bool operator<(const SegmentPath& lhs, const SegmentPath& rhs) {
    if (lhs.version_ != rhs.version_) {
        return lhs.version_ < rhs.version_;
    }
    if (lhs.block_from_ != rhs.block_from_) {
        return lhs.block_from_ < rhs.block_from_;
    }
    if (lhs.block_to_ != rhs.block_to_) {
        return lhs.block_to_ < rhs.block_to_;
    }
    return lhs.kind_ < rhs.kind_;
}

SegmentPathList list_segments(const fs::path& dir) {
    ensure(fs::is_directory(dir), [&]() { return "list_segments: " + dir.string() + " is not a folder"; });

    SegmentPathList segment_files;
    for (const auto& file : fs::directory_iterator{dir}) {
        if (!fs::is_regular_file(file.path()) || file.path().extension().string() != kSegmentExtension) {
            continue;
        }
        auto segment_file = SegmentPath::parse(file.path());
        if (segment_file) {
            segment_files.push_back(std::move(*segment_file));
        } else {
            SNAP_TRACE << "unexpected format for file: " << file.path().filename() << ", skipped";
        }
    }

    // Order segment files by version/block-range/kind
    std::sort(segment_files.begin(), segment_files.end());

    return segment_files;
}

}  // namespace snapjar::snapshots
