// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "ensure.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_exception.hpp>

namespace snapjar {

using Catch::Matchers::Message;

TEST_CASE("ensure", "[snapjar][infra][common][ensure]") {
    CHECK_NOTHROW(ensure(true, "ignored"));
    CHECK_THROWS_MATCHES(ensure(false, "condition violation"), std::logic_error, Message("condition violation"));

    bool built{false};
    ensure(true, [&]() { built = true; return std::string{"ignored"}; });
    CHECK_FALSE(built);
    CHECK_THROWS_MATCHES(ensure(false, []() { return "row " + std::to_string(42); }), std::logic_error, Message("row 42"));
}

TEST_CASE("ensure_pre_condition", "[snapjar][infra][common][ensure]") {
    CHECK_NOTHROW(ensure_pre_condition(true, "ignored"));
    CHECK_THROWS_MATCHES(ensure_pre_condition(false, "x"), std::invalid_argument, Message("Pre-condition violation: x"));
    CHECK_THROWS_MATCHES(ensure_pre_condition(false, []() { return "x " + std::to_string(42); }),
                         std::invalid_argument, Message("Pre-condition violation: x 42"));
}

}  // namespace snapjar
