// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <snapjar/core/common/bytes.hpp>

#include "item.hpp"

namespace snapjar::rlp {

//! \brief Writer appends RLP items to a buffer.
//! \details List headers depend on the payload size, so a list is opened with begin_list and its header is
//! inserted in front of the payload by the matching end_list.
class Writer {
  public:
    Writer& add(ByteView string);
    Writer& add(const intx::uint256& value);
    Writer& add(const evmc::address& value) { return add(ByteView{value.bytes}); }
    Writer& add(const evmc::bytes32& value) { return add(ByteView{value.bytes}); }

    template <std::unsigned_integral T>
    Writer& add(T value) {
        return add(intx::uint256{static_cast<uint64_t>(value)});
    }

    template <size_t N>
    Writer& add(const std::array<uint8_t, N>& value) {
        return add(ByteView{value});
    }

    //! Write a structure through its encode(Writer&, const T&) overload, found by argument-dependent lookup
    template <typename T>
        requires requires(Writer& writer, const T& value) { encode(writer, value); }
    Writer& add(const T& value) {
        encode(*this, value);
        return *this;
    }

    //! Write a list of items of the same type
    template <typename T>
    Writer& add(const std::vector<T>& items) {
        begin_list();
        for (const auto& item : items) {
            add(item);
        }
        return end_list();
    }

    //! Write the value only if present: used by fields appended in later forks
    template <typename T>
    Writer& add(const std::optional<T>& value) {
        if (value) add(*value);
        return *this;
    }

    //! Append bytes as they are, outside of any RLP framing
    Writer& add_raw(ByteView bytes);

    Writer& begin_list();
    Writer& end_list();

    //! The encoded bytes, all lists must be closed
    Bytes release() &&;

  private:
    Bytes out_;
    std::vector<size_t> open_lists_;
};

}  // namespace snapjar::rlp
