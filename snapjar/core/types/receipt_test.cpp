// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "receipt.hpp"

#include <catch2/catch_test_macros.hpp>

#include <snapjar/core/common/util.hpp>

namespace snapjar {

using namespace evmc::literals;

static Receipt sample_receipt(TransactionType type) {
    Receipt receipt;
    receipt.type = type;
    receipt.success = true;
    receipt.cumulative_gas_used = 56'000;
    receipt.logs = {
        Log{
            .address = 0x811a752c8cd697e3cb27279c330ed1ada745a8d7_address,
            .topics = {0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef_bytes32},
            .data = *from_hex("0x0000000000000000000000000000000000000000000000000de0b6b3a7640000"),
        },
    };
    receipt.bloom = logs_bloom(receipt.logs);
    return receipt;
}

TEST_CASE("Receipt envelope", "[snapjar][core][types]") {
    SECTION("legacy receipt is a plain RLP list") {
        const Receipt receipt{sample_receipt(TransactionType::kLegacy)};
        const Bytes encoded{encode_receipt(receipt)};
        CHECK(encoded[0] >= rlp::kListOffset);
        CHECK(decode_receipt(encoded) == receipt);
    }

    SECTION("typed receipt is prefixed by its type") {
        const Receipt receipt{sample_receipt(TransactionType::kDynamicFee)};
        const Bytes encoded{encode_receipt(receipt)};
        CHECK(encoded[0] == static_cast<uint8_t>(TransactionType::kDynamicFee));
        CHECK(decode_receipt(encoded) == receipt);
    }

    SECTION("failed receipt without logs") {
        Receipt receipt;
        receipt.type = TransactionType::kAccessList;
        receipt.cumulative_gas_used = 21'000;
        const auto decoded{decode_receipt(encode_receipt(receipt))};
        REQUIRE(decoded);
        CHECK(*decoded == receipt);
        CHECK_FALSE(decoded->success);
    }

    SECTION("bloom of the wrong size") {
        rlp::Writer writer;
        writer.begin_list().add(true).add(uint64_t{21'000}).add(ByteView{}).add(std::vector<Log>{}).end_list();
        CHECK(decode_receipt(std::move(writer).release()) == tl::unexpected{DecodingError::kUnexpectedLength});
    }

    SECTION("unsupported type") {
        CHECK(decode_receipt(*from_hex("05c0")) == tl::unexpected{DecodingError::kUnsupportedTransactionType});
    }

    SECTION("empty input") {
        CHECK(decode_receipt(ByteView{}) == tl::unexpected{DecodingError::kInputTooShort});
    }
}

TEST_CASE("Logs bloom", "[snapjar][core][types]") {
    CHECK(logs_bloom({}) == Bloom{});

    const Receipt receipt{sample_receipt(TransactionType::kLegacy)};
    Bloom expected{};
    add_to_bloom(expected, ByteView{receipt.logs[0].address.bytes});
    add_to_bloom(expected, ByteView{receipt.logs[0].topics[0].bytes});
    CHECK(receipt.bloom == expected);

    size_t bits_set{0};
    for (const uint8_t byte : expected) {
        for (uint8_t b{byte}; b != 0; b &= static_cast<uint8_t>(b - 1)) ++bits_set;
    }
    CHECK(bits_set > 0);
    CHECK(bits_set <= 6);

    // Adding the same item twice sets no new bit
    Bloom again{expected};
    add_to_bloom(again, ByteView{receipt.logs[0].address.bytes});
    CHECK(again == expected);
}

}  // namespace snapjar
