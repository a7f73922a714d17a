// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "sender_recovery.hpp"

#include <catch2/catch_test_macros.hpp>

#include <snapjar/db/test_util/sample_chain.hpp>
#include <snapjar/infra/common/log.hpp>
#include <snapjar/infra/test_util/log.hpp>

namespace snapjar::db::chain {

using test_util::SampleChain;
using test_util::SetLogVerbosityGuard;

TEST_CASE("recover_senders", "[snapjar][db][chain][sender_recovery]") {
    SetLogVerbosityGuard guard{log::Level::kNone};
    const auto chain{SampleChain::make(/*first_block_num=*/100, /*block_count=*/2, /*first_txn_id=*/1'000, /*txns_per_block=*/3)};

    SECTION("empty batch") {
        const auto senders = recover_senders({}, 0);
        REQUIRE(senders);
        CHECK(senders->empty());
    }

    SECTION("all senders in order") {
        const auto senders = recover_senders(chain.transactions, chain.transactions.size());
        REQUIRE(senders);
        CHECK(*senders == chain.senders);
    }

    SECTION("batch size mismatch") {
        CHECK_FALSE(recover_senders(chain.transactions, chain.transactions.size() + 1));
    }

    SECTION("one invalid signature fails the whole batch") {
        auto transactions{chain.transactions};
        transactions[2].r = 0;
        CHECK_FALSE(recover_senders(transactions, transactions.size()));
    }
}

TEST_CASE("recover_senders on worker pool", "[snapjar][db][chain][sender_recovery]") {
    SetLogVerbosityGuard guard{log::Level::kNone};
    const size_t txn_count{kSenderRecoveryChunkSize * 2 + 7};
    const auto chain{SampleChain::make(/*first_block_num=*/0, /*block_count=*/1, /*first_txn_id=*/0, txn_count)};
    WorkerPool workers{2};

    SECTION("all senders in order") {
        const auto senders = recover_senders(chain.transactions, txn_count, &workers);
        REQUIRE(senders);
        CHECK(*senders == chain.senders);
    }

    SECTION("invalid signature in last chunk fails the whole batch") {
        auto transactions{chain.transactions};
        transactions.back().s = 0;
        CHECK_FALSE(recover_senders(transactions, txn_count, &workers));
    }

    workers.join();
}

}  // namespace snapjar::db::chain
