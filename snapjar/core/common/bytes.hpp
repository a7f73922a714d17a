// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include <evmc/bytes.hpp>

namespace snapjar {

using Bytes = evmc::bytes;

//! Non-owning view over contiguous bytes, implicitly built from any owner of them in this code base
class ByteView : public evmc::bytes_view {
  public:
    constexpr ByteView() noexcept = default;
    constexpr ByteView(const uint8_t* data, size_t size) noexcept : evmc::bytes_view{data, size} {}
    constexpr ByteView(evmc::bytes_view view) noexcept : evmc::bytes_view{view} {}  // NOLINT(*-explicit-*)
    ByteView(const Bytes& bytes) noexcept : evmc::bytes_view{bytes} {}             // NOLINT(*-explicit-*)

    template <size_t N>
    constexpr ByteView(const uint8_t (&array)[N]) noexcept : evmc::bytes_view{array, N} {}  // NOLINT(*-explicit-*)

    template <size_t N>
    constexpr ByteView(const std::array<uint8_t, N>& array) noexcept  // NOLINT(*-explicit-*)
        : evmc::bytes_view{array.data(), N} {}

    template <size_t Extent>
    constexpr ByteView(std::span<const uint8_t, Extent> span) noexcept  // NOLINT(*-explicit-*)
        : evmc::bytes_view{span.data(), span.size()} {}
};

}  // namespace snapjar
