// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "common.hpp"

#include <charconv>
#include <map>
#include <string>

#include <snapjar/core/types/hash.hpp>

namespace snapjar::cmd::common {

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    std::map<std::string, log::Level> level_mapping{
        {"critical", log::Level::kCritical},
        {"error", log::Level::kError},
        {"warning", log::Level::kWarning},
        {"info", log::Level::kInfo},
        {"debug", log::Level::kDebug},
        {"trace", log::Level::kTrace},
    };
    auto& log_opts = *cli.add_option_group("Log", "Logging options");
    log_opts.add_option("--log.verbosity", log_settings.log_verbosity, "Sets log verbosity")
        ->capture_default_str()
        ->check(CLI::Range(log::Level::kCritical, log::Level::kTrace))
        ->transform(CLI::Transformer(level_mapping, CLI::ignore_case))
        ->default_val(log_settings.log_verbosity);
    log_opts.add_flag("--log.stdout", log_settings.log_std_out, "Outputs to std::out instead of std::err");
    log_opts.add_flag("--log.nocolor", log_settings.log_nocolor, "Disable colors on log lines");
    log_opts.add_flag("--log.utc", log_settings.log_utc, "Prints log timings in UTC");
    log_opts.add_flag("--log.threads", log_settings.log_threads, "Prints thread ids");
    log_opts.add_option("--log.file", log_settings.log_file, "Tee all log lines to given file name");
}

void add_segment_options(CLI::App& cli, snapshots::SegmentSettings& segment_settings) {
    cli.add_option("--segment_dir", segment_settings.repository_dir, "Path to segment repository")
        ->capture_default_str()
        ->check(CLI::ExistingDirectory);
    cli.add_flag("--print", segment_settings.print_items, "Flag indicating if items returned by range queries are printed")
        ->capture_default_str();
}

HashValidator::HashValidator() {
    func_ = [](const std::string& value) -> std::string {
        const auto hash{Hash::from_hex(value)};
        if (!hash) return "Value " + value + " is not a valid 32-byte hash";
        return {};
    };
}

NumberValidator::NumberValidator() {
    func_ = [](const std::string& value) -> std::string {
        uint64_t number{0};
        const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), number);
        if (ec != std::errc{} || ptr != value.data() + value.size()) {
            return "Value " + value + " is not a valid number";
        }
        return {};
    };
}

}  // namespace snapjar::cmd::common
