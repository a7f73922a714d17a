// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "segment.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

#include <intx/intx.hpp>
#include <magic_enum.hpp>

#include <snapjar/infra/common/log.hpp>

namespace snapjar::snapshots {

namespace fs = std::filesystem;

//! Big-endian u64 at the specified position, bounds are checked by the callers
static uint64_t load_u64(ByteView bytes, size_t position) {
    return intx::be::unsafe::load<uint64_t>(&bytes[position]);
}

Segment::Segment(SegmentPath path, std::optional<MemoryMappedRegion> region)
    : path_{std::move(path)},
      file_{open_file(path_, region)} {
    validate_header();
    validate_offsets();
    validate_index();
    file_.advise_random();
    SNAP_DEBUG << "Segment opened: " << path_.filename() << " kind: " << to_string(kind_)
               << " rows: " << row_key_range().to_string() << " index entries: " << index_entry_count_;
}

Segment::~Segment() {
    SNAP_DEBUG << "Segment closed: " << path_.filename();
}

MemoryMappedFile Segment::open_file(const SegmentPath& path, std::optional<MemoryMappedRegion> region) {
    if (!fs::is_regular_file(path.path())) {
        throw std::runtime_error{"Segment: file not found: " + path.path().string()};
    }
    if (!region && fs::file_size(path.path()) < kSegmentHeaderSize) {
        throw std::runtime_error{"Segment: file too short: " + path.path().string()};
    }
    if (region) {
        return MemoryMappedFile::borrow(path.path(), *region);
    }
    return MemoryMappedFile::map(path.path());
}

void Segment::validate_header() {
    const ByteView content{file_.region()};
    const std::string file{path_.path().string()};
    if (content.size() < kSegmentHeaderSize) {
        throw std::runtime_error{"Segment: file too short: " + file};
    }
    if (!std::equal(kSegmentMagic.cbegin(), kSegmentMagic.cend(), content.cbegin())) {
        throw std::runtime_error{"Segment: bad magic: " + file};
    }
    const uint8_t version{content[4]};
    if (version != kSegmentFormatVersion) {
        throw std::runtime_error{"Segment: unsupported version " + std::to_string(version) + ": " + file};
    }
    const auto kind = magic_enum::enum_cast<SegmentKind>(content[5]);
    if (!kind) {
        throw std::runtime_error{"Segment: unknown kind " + std::to_string(content[5]) + ": " + file};
    }
    if (*kind != path_.kind()) {
        throw std::runtime_error{"Segment: kind " + std::string{to_string(*kind)} + " does not match file name: " + file};
    }
    kind_ = *kind;
    column_count_ = content[6];
    if (column_count_ != column_count_of(kind_)) {
        throw std::runtime_error{"Segment: unexpected column count " + std::to_string(column_count_) + ": " + file};
    }

    first_row_key_ = load_u64(content, 8);
    row_count_ = load_u64(content, 16);
    index_entry_count_ = load_u64(content, 24);
    if (row_count_ > kMaxRowKey - first_row_key_) {
        throw std::runtime_error{"Segment: row key range overflow: " + file};
    }
    if (!is_indexed(kind_) && index_entry_count_ > 0) {
        throw std::runtime_error{"Segment: unexpected index entries: " + file};
    }

    // Check sizes against the file size before any multiplication may overflow
    const uint64_t available{content.size() - kSegmentHeaderSize};
    if (available < kOffsetSize || row_count_ > (available / kOffsetSize - 1) / column_count_) {
        throw std::runtime_error{"Segment: offsets out of bounds: " + file};
    }
    const uint64_t offsets_size{(row_count_ * column_count_ + 1) * kOffsetSize};
    offsets_ = content.substr(kSegmentHeaderSize, offsets_size);
    if (index_entry_count_ > (available - offsets_size) / kIndexEntrySize) {
        throw std::runtime_error{"Segment: index out of bounds: " + file};
    }
    const uint64_t index_size{index_entry_count_ * kIndexEntrySize};
    const uint64_t data_size{available - offsets_size - index_size};
    data_ = content.substr(kSegmentHeaderSize + offsets_size, data_size);
    index_ = content.substr(kSegmentHeaderSize + offsets_size + data_size, index_size);
}

void Segment::validate_offsets() {
    const size_t offset_count{offsets_.size() / kOffsetSize};
    if (offset_at(0) != 0) {
        throw std::runtime_error{"Segment: first offset is not zero: " + path_.path().string()};
    }
    for (size_t i{1}; i < offset_count; ++i) {
        if (offset_at(i) < offset_at(i - 1)) {
            throw std::runtime_error{"Segment: offsets not sorted at " + std::to_string(i) + ": " + path_.path().string()};
        }
    }
    if (offset_at(offset_count - 1) != data_.size()) {
        throw std::runtime_error{"Segment: data size mismatch: " + path_.path().string()};
    }
}

void Segment::validate_index() {
    for (size_t i{0}; i < index_entry_count_; ++i) {
        if (row_at(i) >= row_count_) {
            throw std::runtime_error{"Segment: index entry " + std::to_string(i) + " out of rows: " + path_.path().string()};
        }
        if (i > 0 && fingerprint_at(i) < fingerprint_at(i - 1)) {
            throw std::runtime_error{"Segment: index not sorted at " + std::to_string(i) + ": " + path_.path().string()};
        }
    }
}

uint64_t Segment::offset_at(size_t position) const {
    return load_u64(offsets_, position * kOffsetSize);
}

uint64_t Segment::fingerprint_at(size_t entry) const {
    return load_u64(index_, entry * kIndexEntrySize);
}

uint64_t Segment::row_at(size_t entry) const {
    return load_u64(index_, entry * kIndexEntrySize + sizeof(uint64_t));
}

std::optional<ByteView> Segment::cell(RowKey row_key, size_t column) const {
    if (!row_key_range().contains(row_key) || column >= column_count_) {
        return std::nullopt;
    }
    const size_t position{(row_key - first_row_key_) * column_count_ + column};
    const uint64_t begin{offset_at(position)};
    const uint64_t end{offset_at(position + 1)};
    if (begin == end) {
        return std::nullopt;
    }
    return data_.substr(begin, end - begin);
}

std::vector<RowKey> Segment::lookup_by_hash(const Hash& hash) const {
    const uint64_t fingerprint{hash.prefix_u64()};

    // Lower bound of fingerprint among entries sorted by fingerprint
    size_t low{0};
    size_t high{index_entry_count_};
    while (low < high) {
        const size_t middle{low + (high - low) / 2};
        if (fingerprint_at(middle) < fingerprint) {
            low = middle + 1;
        } else {
            high = middle;
        }
    }

    std::vector<RowKey> candidates;
    for (size_t entry{low}; entry < index_entry_count_ && fingerprint_at(entry) == fingerprint; ++entry) {
        candidates.push_back(first_row_key_ + row_at(entry));
    }
    return candidates;
}

}  // namespace snapjar::snapshots
