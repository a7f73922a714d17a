// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "writer.hpp"

#include <stdexcept>
#include <utility>

namespace snapjar::rlp {

static Bytes make_header(size_t payload_size, uint8_t offset) {
    Bytes header;
    if (payload_size <= kMaxShortPayload) {
        header.push_back(static_cast<uint8_t>(offset + payload_size));
        return header;
    }
    Bytes length;
    for (uint64_t n{payload_size}; n != 0; n >>= 8) {
        length.insert(length.begin(), static_cast<uint8_t>(n & 0xFF));
    }
    header.push_back(static_cast<uint8_t>(offset + kMaxShortPayload + length.size()));
    header += length;
    return header;
}

Writer& Writer::add(ByteView string) {
    if (string.size() == 1 && string[0] < kStringOffset) {
        out_.push_back(string[0]);
        return *this;
    }
    out_ += make_header(string.size(), kStringOffset);
    out_ += string;
    return *this;
}

Writer& Writer::add(const intx::uint256& value) {
    uint8_t big_endian[sizeof(intx::uint256)];
    intx::be::store(big_endian, value);
    const size_t leading_zeros{sizeof(big_endian) - intx::count_significant_bytes(value)};
    return add(ByteView{big_endian + leading_zeros, sizeof(big_endian) - leading_zeros});
}

Writer& Writer::add_raw(ByteView bytes) {
    out_ += bytes;
    return *this;
}

Writer& Writer::begin_list() {
    open_lists_.push_back(out_.size());
    return *this;
}

Writer& Writer::end_list() {
    if (open_lists_.empty()) {
        throw std::logic_error{"rlp::Writer::end_list without begin_list"};
    }
    const size_t payload_start{open_lists_.back()};
    open_lists_.pop_back();
    out_.insert(payload_start, make_header(out_.size() - payload_start, kListOffset));
    return *this;
}

Bytes Writer::release() && {
    if (!open_lists_.empty()) {
        throw std::logic_error{"rlp::Writer::release with open lists"};
    }
    return std::move(out_);
}

}  // namespace snapjar::rlp
