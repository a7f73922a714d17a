// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "provider_error.hpp"

#include <string>

#include <catch2/catch_test_macros.hpp>

namespace snapjar::db::chain {

TEST_CASE("ProviderException", "[snapjar][db][chain][provider_error]") {
    const ProviderException ex{ProviderError::kUnsupportedProvider, "chain_info"};
    CHECK(ex.err() == ProviderError::kUnsupportedProvider);
    CHECK(std::string{ex.what()} == "chain_info : kUnsupportedProvider");

    const ProviderException ex_no_message{ProviderError::kUnsupportedProvider};
    CHECK(std::string{ex_no_message.what()} == "Provider error : kUnsupportedProvider");
}

TEST_CASE("ExecutionException", "[snapjar][db][chain][provider_error]") {
    const ExecutionException ex{ValidationError::kSenderRecoveryError};
    CHECK(ex.err() == ValidationError::kSenderRecoveryError);
    CHECK(std::string{ex.what()} == "Validation error : kSenderRecoveryError");
}

}  // namespace snapjar::db::chain
