// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include <snapjar/core/common/base.hpp>
#include <snapjar/core/common/bytes.hpp>
#include <snapjar/core/types/hash.hpp>
#include <snapjar/infra/common/memory_mapped_file.hpp>

#include "segment_kind.hpp"
#include "segment_path.hpp"

namespace snapjar::snapshots {

// Segment file layout (integers are big-endian):
// magic "SJAR" | version u8 | kind u8 | column_count u8 | reserved u8 |
// first_row_key u64 | row_count u64 | index_entry_count u64 |
// offsets[row_count * column_count + 1] u64 | data | index entries (fingerprint u64, row u64) sorted by fingerprint

inline constexpr std::array<uint8_t, 4> kSegmentMagic{'S', 'J', 'A', 'R'};
inline constexpr uint8_t kSegmentFormatVersion{1};
inline constexpr size_t kSegmentHeaderSize{32};
inline constexpr size_t kOffsetSize{sizeof(uint64_t)};
inline constexpr size_t kIndexEntrySize{2 * sizeof(uint64_t)};

//! \brief Segment is an immutable columnar store of rows for one kind of data, memory-mapped read-only.
//! \details Rows are addressed by row key in [row_key_from, row_key_to), each row holding column_count cells.
//! A cell of length zero means the value is missing. Hash-indexed segments resolve a hash to *candidate* row keys:
//! entries are keyed by hash fingerprint, so the caller must check the hash decoded at each row.
class Segment {
  public:
    explicit Segment(SegmentPath path, std::optional<MemoryMappedRegion> region = std::nullopt);
    ~Segment();

    Segment(const Segment&) = delete;
    Segment& operator=(const Segment&) = delete;

    const SegmentPath& path() const { return path_; }
    SegmentKind kind() const { return kind_; }
    size_t column_count() const { return column_count_; }

    RowKey row_key_from() const { return first_row_key_; }
    RowKey row_key_to() const { return first_row_key_ + row_count_; }
    RowKeyRange row_key_range() const { return {row_key_from(), row_key_to()}; }
    uint64_t row_count() const { return row_count_; }

    uint64_t index_entry_count() const { return index_entry_count_; }

    MemoryMappedRegion region() const { return file_.region(); }

    //! Cell at the specified row key and column, std::nullopt if row key is out of range or cell is empty
    std::optional<ByteView> cell(RowKey row_key, size_t column) const;

    //! Row keys of all the index entries matching the fingerprint of the hash, in index order
    std::vector<RowKey> lookup_by_hash(const Hash& hash) const;

  private:
    static MemoryMappedFile open_file(const SegmentPath& path, std::optional<MemoryMappedRegion> region);

    void validate_header();
    void validate_offsets();
    void validate_index();

    uint64_t offset_at(size_t position) const;
    uint64_t fingerprint_at(size_t entry) const;
    uint64_t row_at(size_t entry) const;

    SegmentPath path_;
    MemoryMappedFile file_;

    SegmentKind kind_{SegmentKind::headers};
    size_t column_count_{0};
    RowKey first_row_key_{0};
    uint64_t row_count_{0};
    uint64_t index_entry_count_{0};

    //! Views over the sections of the mapped file
    ByteView offsets_;
    ByteView data_;
    ByteView index_;
};

}  // namespace snapjar::snapshots
