// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <tl/expected.hpp>

#include <snapjar/core/common/bytes.hpp>
#include <snapjar/core/common/decoding_result.hpp>

#include "item.hpp"

namespace snapjar::rlp {

class Reader;

using ReaderResult = tl::expected<Reader, DecodingError>;

//! \brief Reader walks the items of an RLP list payload one after the other.
//! \details Every read consumes one item and rejects non-canonical encodings. The views handed out point into
//! the original input, which must outlive them.
class Reader {
  public:
    explicit Reader(ByteView payload) : payload_{payload} {}

    //! Consume the next item as a list, returning a reader over its payload
    ReaderResult list();

    //! Consume the next item as a string, returning its payload
    tl::expected<ByteView, DecodingError> string();

    DecodingResult read(Bytes& to);
    DecodingResult read(uint64_t& to);
    DecodingResult read(intx::uint256& to);
    DecodingResult read(bool& to);
    DecodingResult read(evmc::address& to) { return read_fixed(to.bytes); }
    DecodingResult read(evmc::bytes32& to) { return read_fixed(to.bytes); }

    template <size_t N>
    DecodingResult read(std::array<uint8_t, N>& to) {
        return read_fixed(to);
    }

    //! Consume a structure through its decode(Reader&, T&) overload, found by argument-dependent lookup
    template <typename T>
        requires requires(Reader& reader, T& value) {
            { decode(reader, value) } -> std::same_as<DecodingResult>;
        }
    DecodingResult read(T& to) {
        return decode(*this, to);
    }

    //! Consume a list whose items all have the same type
    template <typename T>
    DecodingResult read(std::vector<T>& to) {
        auto items = list();
        if (!items) return tl::unexpected{items.error()};
        to.clear();
        while (!items->done()) {
            if (auto res = items->read(to.emplace_back()); !res) return res;
        }
        return {};
    }

    //! Consume the next item if any is left, otherwise reset the value: used by fields appended in later forks
    template <typename T>
    DecodingResult read(std::optional<T>& to) {
        if (done()) {
            to.reset();
            return {};
        }
        return read(to.emplace());
    }

    //! Consume one item per field, stopping at the first failure
    template <typename... Fields>
        requires(sizeof...(Fields) > 1)
    DecodingResult read(Fields&... fields) {
        DecodingResult res;
        ((res = read(fields)) && ...);
        return res;
    }

    //! True when all the items have been consumed
    bool done() const { return payload_.empty(); }

    //! Fail with kUnexpectedListElements if any item is left
    DecodingResult finish() const;

    //! Bytes not consumed yet
    ByteView remaining() const { return payload_; }

  private:
    DecodingResult read_fixed(std::span<uint8_t> to);

    ByteView payload_;
};

//! \brief Reader over the payload of the list spanning the whole input
//! \details Fails with kInputTooLong if anything follows the list
ReaderResult read_list(ByteView input);

}  // namespace snapjar::rlp
