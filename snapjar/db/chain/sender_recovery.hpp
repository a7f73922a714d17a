// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include <evmc/evmc.hpp>

#include <snapjar/core/types/transaction.hpp>
#include <snapjar/infra/concurrency/worker_pool.hpp>

namespace snapjar::db::chain {

//! Minimum number of transactions handled by a single worker task
inline constexpr size_t kSenderRecoveryChunkSize{512};

//! \brief Recover the senders of a batch of transactions, all or nothing
//! \param txns the batch of transactions
//! \param expected_count the number of senders the caller expects, i.e. the batch size
//! \param workers optional worker pool used to split big batches in chunks recovered concurrently
//! \return the senders in the same order as the input transactions or std::nullopt if the batch size does not match
//! the expected count or if at least one sender cannot be recovered
std::optional<std::vector<evmc::address>> recover_senders(std::span<const Transaction> txns,
                                                          size_t expected_count,
                                                          WorkerPool* workers = nullptr);

}  // namespace snapjar::db::chain
