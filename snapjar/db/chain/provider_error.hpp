// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>

namespace snapjar::db::chain {

//! Failures of a chain data provider
enum class ProviderError {
    kUnsupportedProvider,  // the query cannot be answered by this kind of provider, ask the live database
};

//! Failures detected while validating blocks and transactions
enum class ValidationError {
    kSenderRecoveryError,  // at least one sender in a batch cannot be recovered
};

class ProviderException : public std::runtime_error {
  public:
    explicit ProviderException(ProviderError err, const std::string& message = "");

    ProviderError err() const noexcept { return err_; }

  private:
    ProviderError err_;
};

class ExecutionException : public std::runtime_error {
  public:
    explicit ExecutionException(ValidationError err, const std::string& message = "");

    ValidationError err() const noexcept { return err_; }

  private:
    ValidationError err_;
};

}  // namespace snapjar::db::chain
