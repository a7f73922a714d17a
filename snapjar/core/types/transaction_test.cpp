// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "transaction.hpp"

#include <catch2/catch_test_macros.hpp>

#include <snapjar/core/common/util.hpp>

namespace snapjar {

using namespace evmc::literals;

static constexpr uint64_t kGiga{1'000'000'000};
static constexpr uint64_t kSepoliaChainId{11155111};

static const std::vector<AccessListEntry> kAccessList{
    {0xde0b295669a9fd93d5f28d9ec85e40f4cb697bae_address,
     {
         0x0000000000000000000000000000000000000000000000000000000000000003_bytes32,
         0x0000000000000000000000000000000000000000000000000000000000000007_bytes32,
     }},
    {0xbb9bc244d798123fde783fcc1c72d3bb8c189413_address, {}},
};

static Transaction typed_transaction(TransactionType type) {
    Transaction txn;
    txn.type = type;
    txn.chain_id = kSepoliaChainId;
    txn.nonce = 7;
    txn.max_priority_fee_per_gas = type == TransactionType::kDynamicFee ? 10 * kGiga : 30 * kGiga;
    txn.max_fee_per_gas = 30 * kGiga;
    txn.gas_limit = 5748100;
    txn.to = 0x811a752c8cd697e3cb27279c330ed1ada745a8d7_address;
    txn.value = 2 * intx::uint256{kGiga} * kGiga;
    txn.data = *from_hex("6ebaf477f83e051589c1188bcc6ddccd");
    txn.access_list = kAccessList;
    txn.r = intx::from_string<intx::uint256>("0x36b241b061a36a32ab7fe86c7aa9eb592dd59018cd0443adc0903590c16b02b0");
    txn.s = intx::from_string<intx::uint256>("0x5edcc541b4741c5cc6dd347c5ed9577ef293a62787b4510465fadbfe39ee4094");
    return txn;
}

TEST_CASE("Legacy transaction envelope", "[snapjar][core][types]") {
    Transaction txn;
    txn.chain_id = 1;
    txn.nonce = 12;
    txn.max_priority_fee_per_gas = 20 * kGiga;
    txn.max_fee_per_gas = 20 * kGiga;
    txn.gas_limit = 21000;
    txn.to = 0x727fc6a68321b754475c668a6abfb6e9e71c169a_address;
    txn.value = 10 * intx::uint256{kGiga} * kGiga;
    txn.data = *from_hex(
        "a9059cbb000000000213ed0f886efd100b67c7e4ec0a85a7d20dc9716000000000000000000"
        "00015af1d78b58c4000");
    txn.odd_y_parity = true;
    txn.r = intx::from_string<intx::uint256>("0xbe67e0a07db67da8d446f76add590e54b6e92cb6b8f9835aeb67540579a27717");
    txn.s = intx::from_string<intx::uint256>("0x2d690516512020171c1ec870f6ff45398cc8609250326be89915fb538e7bd718");

    const Bytes encoded{encode_transaction(txn)};
    CHECK(encoded[0] >= rlp::kListOffset);

    const auto decoded{decode_transaction(encoded)};
    REQUIRE(decoded);
    CHECK(*decoded == txn);
    CHECK(decoded->v() == 38);
    CHECK(decoded->max_priority_fee_per_gas == decoded->max_fee_per_gas);

    SECTION("trailing bytes") {
        Bytes longer{encoded};
        longer.push_back(0x00);
        CHECK(decode_transaction(longer) == tl::unexpected{DecodingError::kInputTooLong});
    }

    SECTION("v below 27") {
        Transaction bad_v{txn};
        bad_v.chain_id.reset();
        const Bytes bad_encoded{encode_transaction(bad_v)};
        // v is the item right before the 32-byte r, rewrite 27 or 28 into 26
        const size_t v_offset{bad_encoded.size() - 2 * (kHashLength + 1) - 1};
        REQUIRE((bad_encoded[v_offset] == 27 || bad_encoded[v_offset] == 28));
        Bytes patched{bad_encoded};
        patched[v_offset] = 26;
        CHECK(decode_transaction(patched) == tl::unexpected{DecodingError::kInvalidVInSignature});
    }
}

TEST_CASE("Signature v", "[snapjar][core][types]") {
    Transaction txn;
    CHECK(txn.set_v(28));
    CHECK(txn.odd_y_parity);
    CHECK_FALSE(txn.chain_id);
    CHECK(txn.v() == 28);

    CHECK(txn.set_v(2 * 5 + 35));
    CHECK_FALSE(txn.odd_y_parity);
    CHECK(txn.chain_id == 5);
    CHECK(txn.v() == 45);

    CHECK_FALSE(txn.set_v(29));
    CHECK_FALSE(txn.set_v(0));
}

TEST_CASE("Typed transaction envelope", "[snapjar][core][types]") {
    SECTION("EIP-2930") {
        const Transaction txn{typed_transaction(TransactionType::kAccessList)};
        const Bytes encoded{encode_transaction(txn)};
        CHECK(encoded[0] == static_cast<uint8_t>(TransactionType::kAccessList));
        const auto decoded{decode_transaction(encoded)};
        REQUIRE(decoded);
        CHECK(*decoded == txn);
    }

    SECTION("EIP-1559") {
        const Transaction txn{typed_transaction(TransactionType::kDynamicFee)};
        const Bytes encoded{encode_transaction(txn)};
        CHECK(encoded[0] == static_cast<uint8_t>(TransactionType::kDynamicFee));
        const auto decoded{decode_transaction(encoded)};
        REQUIRE(decoded);
        CHECK(*decoded == txn);
        CHECK(decoded->access_list == kAccessList);
    }

    SECTION("contract creation") {
        Transaction txn{typed_transaction(TransactionType::kDynamicFee)};
        txn.to.reset();
        const auto decoded{decode_transaction(encode_transaction(txn))};
        REQUIRE(decoded);
        CHECK_FALSE(decoded->to);
    }

    SECTION("wrapped into an RLP string") {
        const Bytes raw{encode_transaction(typed_transaction(TransactionType::kDynamicFee))};
        rlp::Writer writer;
        writer.add(ByteView{raw});
        const Bytes wrapped{std::move(writer).release()};
        CHECK_FALSE(decode_transaction(wrapped));
    }

    SECTION("unsupported type") {
        CHECK(decode_transaction(*from_hex("05c0")) == tl::unexpected{DecodingError::kUnsupportedTransactionType});
        CHECK(decode_transaction(Bytes{}) == tl::unexpected{DecodingError::kInputTooShort});
    }

    SECTION("missing signature") {
        Bytes encoded{encode_transaction(typed_transaction(TransactionType::kAccessList))};
        rlp::Writer writer;
        writer.add_raw(ByteView{encoded.data(), 1}).begin_list().add(uint64_t{1}).end_list();
        CHECK(decode_transaction(std::move(writer).release()) == tl::unexpected{DecodingError::kInputTooShort});
    }
}

TEST_CASE("Sender recovery", "[snapjar][core][types]") {
    SECTION("mainnet block 46147") {
        Transaction txn;
        txn.nonce = 0;
        txn.max_priority_fee_per_gas = 50'000 * kGiga;
        txn.max_fee_per_gas = 50'000 * kGiga;
        txn.gas_limit = 21'000;
        txn.to = 0x5df9b87991262f6ba471f09758cde1c0fc1de734_address;
        txn.value = 31337;
        txn.odd_y_parity = true;
        txn.r = intx::from_string<intx::uint256>("0x88ff6cf0fefd94db46111149ae4bfc179e9b94721fffd821d38d16464b3f71d0");
        txn.s = intx::from_string<intx::uint256>("0x45e0aff800961cfce805daef7016b9b675c137a6a41a548f7b60a3484c06a33a");

        CHECK(txn.sender() == 0xa1e4380a3b1f749673e270229993ee55f35663b4_address);
        CHECK(compute_hash(txn) == 0x5c504ed432cb51138bcf09aa5e8a410dd4a1e204ef84bfed1be16dfba1b22060_bytes32);

        const TransactionWithHash txn_with_hash{with_hash(txn)};
        CHECK(txn_with_hash.transaction == txn);
        CHECK(txn_with_hash.hash == compute_hash(txn));
    }

    SECTION("mainnet block 46214") {
        Transaction txn;
        txn.nonce = 1;
        txn.max_priority_fee_per_gas = 50'000 * kGiga;
        txn.max_fee_per_gas = 50'000 * kGiga;
        txn.gas_limit = 21'750;
        txn.to = 0xc9d4035f4a9226d50f79b73aafb5d874a1b6537e_address;
        txn.value = 31337;
        txn.data = *from_hex("0x74796d3474406469676978");
        txn.odd_y_parity = true;
        txn.r = intx::from_string<intx::uint256>("0x1c48defe76d367bb92b4fc0628aca42a4d8037062865635d955673e57eddfbfa");
        txn.s = intx::from_string<intx::uint256>("0x65f766849f97b15f01d0877636fbed0fa4e39f8834896c0354f56ac44dcb50a6");

        CHECK(txn.sender() == 0xa1e4380a3b1f749673e270229993ee55f35663b4_address);
        CHECK(compute_hash(txn) == 0xe17d4d0c4596ea7d5166ad5da600a6fdc49e26e0680135a2f7300eedfd0d8314_bytes32);

        txn.s = 0;
        CHECK_FALSE(txn.sender());
    }
}

}  // namespace snapjar
