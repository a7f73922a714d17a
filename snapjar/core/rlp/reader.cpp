// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "reader.hpp"

#include <algorithm>

namespace snapjar::rlp {

namespace {

    struct Item {
        bool list{false};
        ByteView payload;
    };

    //! Big-endian integer of at most sizeof(uint64_t) bytes, in minimal form
    tl::expected<uint64_t, DecodingError> parse_length(ByteView bytes) {
        if (bytes.size() > sizeof(uint64_t)) return tl::unexpected{DecodingError::kOverflow};
        if (bytes.empty() || bytes[0] == 0) return tl::unexpected{DecodingError::kLeadingZero};
        uint64_t length{0};
        for (const uint8_t b : bytes) {
            length = (length << 8) | b;
        }
        return length;
    }

    //! Split the next item off the input
    tl::expected<Item, DecodingError> take_item(ByteView& input) {
        if (input.empty()) return tl::unexpected{DecodingError::kInputTooShort};

        const uint8_t prefix{input[0]};
        if (prefix < kStringOffset) {
            Item item{.list = false, .payload = input.substr(0, 1)};
            input.remove_prefix(1);
            return item;
        }

        const bool list{prefix >= kListOffset};
        const uint8_t offset{list ? kListOffset : kStringOffset};
        size_t header_size{1};
        uint64_t payload_size{static_cast<uint8_t>(prefix - offset)};
        if (payload_size > kMaxShortPayload) {
            const size_t length_size{payload_size - kMaxShortPayload};
            if (input.size() <= length_size) return tl::unexpected{DecodingError::kInputTooShort};
            const auto length{parse_length(input.substr(1, length_size))};
            if (!length) return tl::unexpected{length.error()};
            if (*length <= kMaxShortPayload) return tl::unexpected{DecodingError::kNonCanonicalSize};
            header_size += length_size;
            payload_size = *length;
        }
        if (payload_size > input.size() - header_size) return tl::unexpected{DecodingError::kInputTooShort};

        Item item{.list = list, .payload = input.substr(header_size, payload_size)};
        if (!list && payload_size == 1 && item.payload[0] < kStringOffset) {
            // A single byte below 0x80 is its own encoding
            return tl::unexpected{DecodingError::kNonCanonicalSize};
        }
        input.remove_prefix(header_size + payload_size);
        return item;
    }

    //! Integer payload: big-endian, no leading zeros, zero is the empty string
    template <typename T>
    DecodingResult parse_integer(ByteView payload, T& to) {
        if (payload.size() > sizeof(T)) return tl::unexpected{DecodingError::kOverflow};
        if (!payload.empty() && payload[0] == 0) return tl::unexpected{DecodingError::kLeadingZero};
        to = 0;
        for (const uint8_t b : payload) {
            to = (to << 8) | T{b};
        }
        return {};
    }

}  // namespace

ReaderResult Reader::list() {
    const auto item{take_item(payload_)};
    if (!item) return tl::unexpected{item.error()};
    if (!item->list) return tl::unexpected{DecodingError::kUnexpectedString};
    return Reader{item->payload};
}

tl::expected<ByteView, DecodingError> Reader::string() {
    const auto item{take_item(payload_)};
    if (!item) return tl::unexpected{item.error()};
    if (item->list) return tl::unexpected{DecodingError::kUnexpectedList};
    return item->payload;
}

DecodingResult Reader::read(Bytes& to) {
    const auto payload{string()};
    if (!payload) return tl::unexpected{payload.error()};
    to.assign(payload->begin(), payload->end());
    return {};
}

DecodingResult Reader::read(uint64_t& to) {
    const auto payload{string()};
    if (!payload) return tl::unexpected{payload.error()};
    return parse_integer(*payload, to);
}

DecodingResult Reader::read(intx::uint256& to) {
    const auto payload{string()};
    if (!payload) return tl::unexpected{payload.error()};
    return parse_integer(*payload, to);
}

DecodingResult Reader::read(bool& to) {
    uint64_t value{0};
    if (auto res{read(value)}; !res) return res;
    if (value > 1) return tl::unexpected{DecodingError::kOverflow};
    to = value == 1;
    return {};
}

DecodingResult Reader::read_fixed(std::span<uint8_t> to) {
    const auto payload{string()};
    if (!payload) return tl::unexpected{payload.error()};
    if (payload->size() != to.size()) return tl::unexpected{DecodingError::kUnexpectedLength};
    std::ranges::copy(*payload, to.begin());
    return {};
}

DecodingResult Reader::finish() const {
    if (!done()) return tl::unexpected{DecodingError::kUnexpectedListElements};
    return {};
}

ReaderResult read_list(ByteView input) {
    Reader top{input};
    auto items{top.list()};
    if (items && !top.done()) return tl::unexpected{DecodingError::kInputTooLong};
    return items;
}

}  // namespace snapjar::rlp
