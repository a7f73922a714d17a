// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "segment_builder.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

#include <intx/intx.hpp>

#include <snapjar/infra/common/ensure.hpp>

namespace snapjar::test_util {

using namespace snapjar::snapshots;

static void append_big_u64(Bytes& out, uint64_t value) {
    uint8_t buffer[sizeof(uint64_t)];
    intx::be::unsafe::store(buffer, value);
    out.append(buffer, sizeof(uint64_t));
}

SegmentBuilder::SegmentBuilder(SegmentKind kind, RowKey first_row_key)
    : kind_{kind}, column_count_{column_count_of(kind)}, first_row_key_{first_row_key} {}

SegmentBuilder& SegmentBuilder::add_row(std::vector<Bytes> cells) {
    ensure(cells.size() == column_count_, "SegmentBuilder: wrong cell count");
    rows_.push_back(std::move(cells));
    return *this;
}

SegmentBuilder& SegmentBuilder::add_empty_row() {
    return add_row(std::vector<Bytes>(column_count_));
}

SegmentBuilder& SegmentBuilder::add_index_entry(const Hash& hash, RowKey row_key) {
    ensure(row_key >= first_row_key_, "SegmentBuilder: row key before first row");
    index_entries_.emplace_back(hash.prefix_u64(), row_key - first_row_key_);
    return *this;
}

SegmentBuilder& SegmentBuilder::add_header(const BlockHeader& header, const TotalDifficulty& total_difficulty) {
    return add_header(header, total_difficulty, header.hash());
}

SegmentBuilder& SegmentBuilder::add_header(const BlockHeader& header, const TotalDifficulty& total_difficulty,
                                           const Hash& hash) {
    ensure(kind_ == SegmentKind::headers, "SegmentBuilder: not a headers segment");
    add_index_entry(hash, next_row_key());
    return add_row({encode_block_header(header), encode_total_difficulty(total_difficulty), Bytes{hash.view()}});
}

SegmentBuilder& SegmentBuilder::add_transaction(const Transaction& transaction) {
    ensure(kind_ == SegmentKind::transactions, "SegmentBuilder: not a transactions segment");
    Bytes envelope{encode_transaction(transaction)};
    add_index_entry(keccak256(envelope), next_row_key());
    return add_row({std::move(envelope)});
}

SegmentBuilder& SegmentBuilder::add_receipt(const Receipt& receipt) {
    ensure(kind_ == SegmentKind::receipts, "SegmentBuilder: not a receipts segment");
    return add_row({encode_receipt(receipt)});
}

Bytes SegmentBuilder::build() const {
    Bytes out;
    out.append(kSegmentMagic.data(), kSegmentMagic.size());
    out.push_back(kSegmentFormatVersion);
    out.push_back(static_cast<uint8_t>(kind_));
    out.push_back(static_cast<uint8_t>(column_count_));
    out.push_back(0);  // reserved
    append_big_u64(out, first_row_key_);
    append_big_u64(out, rows_.size());
    append_big_u64(out, index_entries_.size());

    Bytes data;
    append_big_u64(out, 0);
    for (const auto& row : rows_) {
        for (const auto& cell : row) {
            data.append(cell);
            append_big_u64(out, data.size());
        }
    }
    out.append(data);

    auto index_entries{index_entries_};
    std::stable_sort(index_entries.begin(), index_entries.end(),
                     [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });
    for (const auto& [fingerprint, row] : index_entries) {
        append_big_u64(out, fingerprint);
        append_big_u64(out, row);
    }
    return out;
}

TemporarySegmentFile::TemporarySegmentFile(SegmentPath path, ByteView data) : path_{std::move(path)} {
    std::ofstream stream{path_.path(), std::ios::binary | std::ios::trunc};
    stream.exceptions(std::ios::failbit | std::ios::badbit);
    stream.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

TemporarySegmentFile::~TemporarySegmentFile() {
    std::error_code ec;
    std::filesystem::remove(path_.path(), ec);
}

}  // namespace snapjar::test_util
