// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <utility>
#include <vector>

#include <snapjar/core/common/base.hpp>
#include <snapjar/core/common/bytes.hpp>
#include <snapjar/core/types/block.hpp>
#include <snapjar/core/types/hash.hpp>
#include <snapjar/core/types/receipt.hpp>
#include <snapjar/core/types/transaction.hpp>
#include <snapjar/db/snapshots/segment.hpp>
#include <snapjar/db/snapshots/segment_path.hpp>

namespace snapjar::test_util {

using snapshots::SegmentKind;
using snapshots::SegmentPath;

//! Writer of segment files for tests: rows are appended in row key order, index entries in any order
class SegmentBuilder {
  public:
    SegmentBuilder(SegmentKind kind, RowKey first_row_key);

    //! Append a row with one cell per column, an empty cell means missing value
    SegmentBuilder& add_row(std::vector<Bytes> cells);

    //! Append a row with all cells missing
    SegmentBuilder& add_empty_row();

    //! Add a raw index entry from the hash fingerprint to the specified row key
    SegmentBuilder& add_index_entry(const Hash& hash, RowKey row_key);

    //! Append a header row (header, total difficulty, block hash) indexed by block hash
    SegmentBuilder& add_header(const BlockHeader& header, const TotalDifficulty& total_difficulty);

    //! Append a header row storing the specified hash as block hash, indexed by it
    SegmentBuilder& add_header(const BlockHeader& header, const TotalDifficulty& total_difficulty, const Hash& hash);

    //! Append a transaction row indexed by transaction hash
    SegmentBuilder& add_transaction(const Transaction& transaction);

    SegmentBuilder& add_receipt(const Receipt& receipt);

    RowKey next_row_key() const { return first_row_key_ + rows_.size(); }

    //! Serialize the segment content
    Bytes build() const;

  private:
    SegmentKind kind_;
    size_t column_count_;
    RowKey first_row_key_;
    std::vector<std::vector<Bytes>> rows_;
    std::vector<std::pair<uint64_t, uint64_t>> index_entries_;
};

//! Segment file written on construction and removed on destruction
class TemporarySegmentFile {
  public:
    TemporarySegmentFile(SegmentPath path, ByteView data);
    ~TemporarySegmentFile();

    TemporarySegmentFile(const TemporarySegmentFile&) = delete;
    TemporarySegmentFile& operator=(const TemporarySegmentFile&) = delete;

    const SegmentPath& path() const { return path_; }

  private:
    SegmentPath path_;
};

}  // namespace snapjar::test_util
