// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "segment_cursor.hpp"

#include <stdexcept>

#include <catch2/catch_test_macros.hpp>

#include <snapjar/core/common/util.hpp>
#include <snapjar/db/test_util/sample_chain.hpp>
#include <snapjar/db/test_util/segment_builder.hpp>
#include <snapjar/infra/common/decoding_exception.hpp>
#include <snapjar/infra/common/directories.hpp>
#include <snapjar/infra/common/log.hpp>
#include <snapjar/infra/test_util/log.hpp>

namespace snapjar::snapshots {

using test_util::SampleChain;
using test_util::SegmentBuilder;
using test_util::SetLogVerbosityGuard;
using test_util::TemporarySegmentFile;

TEST_CASE("SegmentCursor on headers", "[snapjar][db][snapshots][segment_cursor]") {
    SetLogVerbosityGuard guard{log::Level::kNone};
    TemporaryDirectory tmp_dir;
    const auto chain{SampleChain::make(/*first_block_num=*/1'000, /*block_count=*/3, /*first_txn_id=*/0, /*txns_per_block=*/0)};
    TemporarySegmentFile file{SegmentPath::from(tmp_dir.path(), kSegmentV1, 1'000, 2'000, SegmentKind::headers),
                              chain.headers_segment()};
    const Segment segment{file.path()};
    SegmentCursor cursor{segment};

    SECTION("get_one by row key") {
        const auto header = cursor.get_one<HeaderMask<HeaderColumn>>(RowKey{1'001});
        REQUIRE(header);
        CHECK(*header == chain.headers[1]);
        CHECK(cursor.number() == 1'001);

        const auto td = cursor.get_one<HeaderMask<TotalDifficultyColumn>>(RowKey{1'002});
        REQUIRE(td);
        CHECK(*td == chain.total_difficulties[2]);
        CHECK(cursor.number() == 1'002);
    }

    SECTION("find_two by hash") {
        const Hash hash{chain.headers[2].hash()};
        const auto header_and_hash = cursor.find_two<HeaderMask<HeaderColumn, BlockHashColumn>>(
            hash, [](const auto&) { return true; });
        REQUIRE(header_and_hash);
        CHECK(header_and_hash->first == chain.headers[2]);
        CHECK(header_and_hash->second == hash);
        CHECK(cursor.number() == 1'002);
    }

    SECTION("find_one rejected by the caller") {
        const Hash hash{chain.headers[1].hash()};
        size_t calls{0};
        const auto rejected = cursor.find_one<HeaderMask<BlockHashColumn>>(hash, [&](const Hash&) {
            ++calls;
            return false;
        });
        CHECK_FALSE(rejected);
        CHECK(calls == 1);
    }

    SECTION("not found keeps last row key") {
        REQUIRE(cursor.get_one<HeaderMask<BlockHashColumn>>(RowKey{1'000}));
        CHECK_FALSE(cursor.get_one<HeaderMask<BlockHashColumn>>(RowKey{999}));
        CHECK_FALSE(cursor.get_one<HeaderMask<BlockHashColumn>>(RowKey{1'003}));
        CHECK_FALSE(cursor.find_one<HeaderMask<BlockHashColumn>>(Hash{}, [](const Hash&) { return true; }));
        CHECK(cursor.number() == 1'000);
    }

    SECTION("mask of another kind") {
        CHECK_THROWS_AS(cursor.get_one<ReceiptMask<ReceiptColumn>>(RowKey{1'000}), std::logic_error);
        CHECK_THROWS_AS(cursor.get_one<TransactionMask<TransactionColumn>>(RowKey{1'000}), std::logic_error);
    }
}

TEST_CASE("SegmentCursor missing cells", "[snapjar][db][snapshots][segment_cursor]") {
    SetLogVerbosityGuard guard{log::Level::kNone};
    TemporaryDirectory tmp_dir;
    const auto chain{SampleChain::make(/*first_block_num=*/0, /*block_count=*/1, /*first_txn_id=*/0, /*txns_per_block=*/0)};
    SegmentBuilder builder{SegmentKind::headers, 0};
    builder.add_row({encode_block_header(chain.headers[0]), Bytes{}, Bytes{}});
    TemporarySegmentFile file{SegmentPath::from(tmp_dir.path(), kSegmentV1, 0, 1'000, SegmentKind::headers), builder.build()};
    const Segment segment{file.path()};
    SegmentCursor cursor{segment};

    CHECK(cursor.get_one<HeaderMask<HeaderColumn>>(RowKey{0}) == chain.headers[0]);
    CHECK_FALSE(cursor.get_one<HeaderMask<BlockHashColumn>>(RowKey{0}));
    CHECK_FALSE(cursor.get_two<HeaderMask<HeaderColumn, BlockHashColumn>>(RowKey{0}));
}

TEST_CASE("SegmentCursor malformed cells", "[snapjar][db][snapshots][segment_cursor]") {
    SetLogVerbosityGuard guard{log::Level::kNone};
    TemporaryDirectory tmp_dir;

    SECTION("header") {
        SegmentBuilder builder{SegmentKind::headers, 0};
        builder.add_row({*from_hex("c0"), *from_hex("8203"), *from_hex("0011")});
        TemporarySegmentFile file{SegmentPath::from(tmp_dir.path(), kSegmentV1, 0, 1'000, SegmentKind::headers), builder.build()};
        const Segment segment{file.path()};
        SegmentCursor cursor{segment};
        CHECK_THROWS_AS(cursor.get_one<HeaderMask<HeaderColumn>>(RowKey{0}), DecodingException);
        CHECK_THROWS_AS(cursor.get_one<HeaderMask<TotalDifficultyColumn>>(RowKey{0}), DecodingException);
        CHECK_THROWS_AS(cursor.get_one<HeaderMask<BlockHashColumn>>(RowKey{0}), DecodingException);
    }

    SECTION("transaction") {
        SegmentBuilder builder{SegmentKind::transactions, 0};
        builder.add_row({*from_hex("05c0")});
        TemporarySegmentFile file{SegmentPath::from(tmp_dir.path(), kSegmentV1, 0, 1'000, SegmentKind::transactions), builder.build()};
        const Segment segment{file.path()};
        SegmentCursor cursor{segment};
        CHECK_THROWS_AS(cursor.get_one<TransactionMask<TransactionColumn>>(RowKey{0}), DecodingException);
    }
}

}  // namespace snapjar::snapshots
