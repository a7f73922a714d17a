// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <CLI/CLI.hpp>

#include <snapjar/db/snapshots/segment_settings.hpp>
#include <snapjar/infra/common/log.hpp>

namespace snapjar::cmd::common {

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Set up options to populate segment settings after cli.parse()
void add_segment_options(CLI::App& cli, snapshots::SegmentSettings& segment_settings);

//! CLI11 validator for a 32-byte hash in hex form
struct HashValidator : public CLI::Validator {
    explicit HashValidator();
};

//! CLI11 validator for a block or transaction number
struct NumberValidator : public CLI::Validator {
    explicit NumberValidator();
};

}  // namespace snapjar::cmd::common
