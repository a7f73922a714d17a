// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "reader.hpp"

#include <string_view>

#include <catch2/catch_test_macros.hpp>

#include <snapjar/core/common/util.hpp>

namespace snapjar::rlp {

//! Decode the single item encoded in hex, which must span the whole input
template <typename T>
static tl::expected<T, DecodingError> read_one(std::string_view hex) {
    const Bytes bytes{*from_hex(hex)};
    Reader reader{bytes};
    T value{};
    if (auto res{reader.read(value)}; !res) return tl::unexpected{res.error()};
    if (!reader.done()) return tl::unexpected{DecodingError::kInputTooLong};
    return value;
}

TEST_CASE("Reader strings", "[snapjar][core][rlp]") {
    CHECK(read_one<Bytes>("00") == Bytes{0x00});
    CHECK(read_one<Bytes>("80") == Bytes{});
    CHECK(read_one<Bytes>("83646f67") == Bytes{'d', 'o', 'g'});
    CHECK(read_one<Bytes>("8D6F62636465666768696A6B6C6D")->size() == 13);

    CHECK(read_one<Bytes>("8D6F62636465666768696A6B6C6Daa").error() == DecodingError::kInputTooLong);
    CHECK(read_one<Bytes>("8D6F6263") == tl::unexpected{DecodingError::kInputTooShort});
    CHECK(read_one<Bytes>("C0") == tl::unexpected{DecodingError::kUnexpectedList});
    CHECK(read_one<Bytes>("8105") == tl::unexpected{DecodingError::kNonCanonicalSize});
    CHECK(read_one<Bytes>("B8020004") == tl::unexpected{DecodingError::kNonCanonicalSize});
    CHECK(read_one<Bytes>("B900380000") == tl::unexpected{DecodingError::kLeadingZero});
    CHECK(read_one<Bytes>("") == tl::unexpected{DecodingError::kInputTooShort});
}

TEST_CASE("Reader integers", "[snapjar][core][rlp]") {
    CHECK(read_one<uint64_t>("09") == 9u);
    CHECK(read_one<uint64_t>("80") == 0u);
    CHECK(read_one<uint64_t>("820505") == 0x0505u);
    CHECK(read_one<uint64_t>("85CE05050505") == 0xCE05050505u);
    CHECK(read_one<uint64_t>("00") == tl::unexpected{DecodingError::kLeadingZero});
    CHECK(read_one<uint64_t>("8200F4") == tl::unexpected{DecodingError::kLeadingZero});
    CHECK(read_one<uint64_t>("89FFFFFFFFFFFFFFFFFF") == tl::unexpected{DecodingError::kOverflow});

    CHECK(read_one<intx::uint256>("8AFFFFFFFFFFFFFFFFFF7C") == intx::from_string<intx::uint256>("0xFFFFFFFFFFFFFFFFFF7C"));
    CHECK(read_one<intx::uint256>("8BFFFFFFFFFFFFFFFFFF7C") == tl::unexpected{DecodingError::kInputTooShort});
    CHECK(read_one<intx::uint256>("A1010000000000000000000000000000000000000000000000000000000000000000") ==
          tl::unexpected{DecodingError::kOverflow});

    CHECK(read_one<bool>("01") == true);
    CHECK(read_one<bool>("80") == false);
    CHECK(read_one<bool>("02") == tl::unexpected{DecodingError::kOverflow});
}

TEST_CASE("Reader fixed size fields", "[snapjar][core][rlp]") {
    const auto address{read_one<evmc::address>("94811a752c8cd697e3cb27279c330ed1ada745a8d7")};
    REQUIRE(address);
    CHECK(to_hex(ByteView{address->bytes}) == "811a752c8cd697e3cb27279c330ed1ada745a8d7");

    CHECK(read_one<evmc::address>("93811a752c8cd697e3cb27279c330ed1ada745a8") ==
          tl::unexpected{DecodingError::kUnexpectedLength});
    CHECK(read_one<std::array<uint8_t, 2>>("820102") == std::array<uint8_t, 2>{1, 2});
}

TEST_CASE("Reader lists", "[snapjar][core][rlp]") {
    CHECK(read_one<std::vector<uint64_t>>("C0")->empty());
    CHECK(read_one<std::vector<uint64_t>>("C883BBCCB583FFC0B5") == std::vector<uint64_t>{0xBBCCB5, 0xFFC0B5});
    CHECK(read_one<std::vector<uint64_t>>("C883BBCCB583FFC0") == tl::unexpected{DecodingError::kInputTooShort});
    CHECK(read_one<std::vector<uint64_t>>("83BBCCB5") == tl::unexpected{DecodingError::kUnexpectedString});

    SECTION("fields in sequence") {
        const Bytes bytes{*from_hex("C6820505098180")};
        auto items{read_list(bytes)};
        REQUIRE(items);
        uint64_t first{0}, second{0};
        Bytes third;
        REQUIRE(items->read(first, second, third));
        CHECK(first == 0x0505);
        CHECK(second == 9);
        CHECK(third == Bytes{0x80});
        CHECK(items->finish());
    }

    SECTION("optional trailing fields") {
        const Bytes bytes{*from_hex("C109")};
        auto items{read_list(bytes)};
        REQUIRE(items);
        std::optional<uint64_t> present, missing{7};
        REQUIRE(items->read(present, missing));
        CHECK(present == 9u);
        CHECK_FALSE(missing);
    }

    SECTION("items left over") {
        const Bytes bytes{*from_hex("C20909")};
        auto items{read_list(bytes)};
        REQUIRE(items);
        uint64_t value{0};
        REQUIRE(items->read(value));
        CHECK(items->finish() == tl::unexpected{DecodingError::kUnexpectedListElements});
    }

    SECTION("bytes after the list") {
        const Bytes bytes{*from_hex("C10909")};
        CHECK(read_list(bytes).error() == DecodingError::kInputTooLong);
    }
}

}  // namespace snapjar::rlp
