// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "sender_recovery.hpp"

#include <algorithm>
#include <future>

#include <boost/asio/post.hpp>
#include <boost/asio/use_future.hpp>

#include <snapjar/infra/common/log.hpp>

namespace snapjar::db::chain {

std::optional<std::vector<evmc::address>> recover_senders(std::span<const Transaction> txns,
                                                          size_t expected_count,
                                                          WorkerPool* workers) {
    if (txns.size() != expected_count) {
        SNAP_WARN << "recover_senders: batch size " << txns.size() << " does not match expected " << expected_count;
        return std::nullopt;
    }

    std::vector<evmc::address> senders(txns.size());

    // Each chunk writes only its own slots in senders
    const auto recover_chunk = [&](size_t begin, size_t end) -> bool {
        for (size_t i{begin}; i < end; ++i) {
            const auto sender{txns[i].sender()};
            if (!sender) {
                SNAP_WARN << "recover_senders: cannot recover sender of transaction #" << i << " in batch";
                return false;
            }
            senders[i] = *sender;
        }
        return true;
    };

    bool recovered{true};
    if (!workers || txns.size() <= kSenderRecoveryChunkSize) {
        recovered = recover_chunk(0, txns.size());
    } else {
        std::vector<std::future<bool>> results;
        results.reserve(txns.size() / kSenderRecoveryChunkSize + 1);
        for (size_t begin{0}; begin < txns.size(); begin += kSenderRecoveryChunkSize) {
            const size_t end{std::min(begin + kSenderRecoveryChunkSize, txns.size())};
            results.emplace_back(boost::asio::post(*workers, boost::asio::use_future([&recover_chunk, begin, end]() {
                return recover_chunk(begin, end);
            })));
        }
        // All tasks must complete before leaving this scope
        for (auto& result : results) {
            result.wait();
        }
        for (auto& result : results) {
            recovered = result.get() && recovered;
        }
    }

    if (!recovered) {
        return std::nullopt;
    }
    return senders;
}

}  // namespace snapjar::db::chain
