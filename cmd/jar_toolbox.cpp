// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include <chrono>
#include <filesystem>
#include <iostream>
#include <array>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <CLI/CLI.hpp>
#include <intx/intx.hpp>
#include <magic_enum.hpp>

#include <snapjar/core/common/util.hpp>
#include <snapjar/db/chain/range.hpp>
#include <snapjar/db/snapshots/segment.hpp>
#include <snapjar/db/snapshots/segment_path.hpp>
#include <snapjar/db/snapshots/segment_provider.hpp>
#include <snapjar/infra/common/ensure.hpp>
#include <snapjar/infra/common/log.hpp>
#include <snapjar/infra/concurrency/worker_pool.hpp>

#include "common/common.hpp"

using namespace snapjar;
using namespace snapjar::cmd::common;
using namespace snapjar::snapshots;

//! The settings for querying segments customized for this tool
struct JarSettings : public SegmentSettings {
    std::optional<std::string> segment_file_name;
    std::optional<std::string> lookup_hash;
    std::optional<uint64_t> lookup_number;
    TxnId from_txn_id{0};
    std::optional<TxnId> to_txn_id;
    uint32_t num_workers{std::thread::hardware_concurrency()};
};

//! The available subcommands in jar toolbox
//! \warning reducing the enum base type size as suggested by clang-tidy breaks CLI11
enum class JarTool {  // NOLINT(performance-enum-size)
    info,
    lookup_header,
    lookup_txn,
    lookup_receipt,
    senders
};

//! The overall settings for the jar toolbox
struct JarToolboxSettings {
    log::Settings log_settings;
    JarSettings jar_settings;
};

//! Parse the command-line arguments into the jar toolbox settings
void parse_command_line(int argc, char* argv[], CLI::App& app, JarToolboxSettings& settings) {
    auto& jar_settings = settings.jar_settings;

    add_logging_options(app, settings.log_settings);
    add_segment_options(app, jar_settings);

    std::map<JarTool, CLI::App*> commands;
    for (auto& [tool, name] : magic_enum::enum_entries<JarTool>()) {
        commands[tool] = app.add_subcommand(std::string{name});
    }
    app.require_subcommand(1);

    commands[JarTool::info]
        ->add_option("segment_file", jar_settings.segment_file_name, "Name of the segment file, all segments if missing");
    for (auto& cmd : {commands[JarTool::lookup_header],
                      commands[JarTool::lookup_txn],
                      commands[JarTool::lookup_receipt]}) {
        auto* number_option = cmd->add_option("--number", jar_settings.lookup_number, "Block or transaction number to lookup in segment files")
                                  ->check(NumberValidator{});
        cmd->add_option("--hash", jar_settings.lookup_hash, "Hash to lookup in segment files")
            ->check(HashValidator{})
            ->excludes(number_option);
    }
    commands[JarTool::senders]
        ->add_option("--from", jar_settings.from_txn_id, "First transaction number of the range")
        ->capture_default_str();
    commands[JarTool::senders]
        ->add_option("--to", jar_settings.to_txn_id, "Transaction number ending the range (excluded), unbounded if missing");
    commands[JarTool::senders]
        ->add_option("--workers", jar_settings.num_workers, "Number of worker threads recovering senders")
        ->capture_default_str()
        ->check(CLI::Range(1u, 1024u));

    app.parse(argc, argv);
}

static std::vector<SegmentPath> segments_of_kind(const JarSettings& settings, SegmentKind kind) {
    std::vector<SegmentPath> segment_paths;
    for (auto& path : list_segments(settings.repository_dir)) {
        if (path.kind() == kind) {
            segment_paths.push_back(std::move(path));
        }
    }
    return segment_paths;
}

static std::string hex(ByteView bytes) { return to_hex(bytes, /*with_prefix=*/true); }
static std::string hex(const evmc::bytes32& value) { return hex(ByteView{value.bytes}); }
static std::string hex(const evmc::address& value) { return hex(ByteView{value.bytes}); }

template <size_t N>
static std::string hex(const std::array<uint8_t, N>& value) {
    return hex(ByteView{value.data(), N});
}

static void print_header(const BlockHeader& header, const intx::uint256& td, const std::string& segment_filename) {
    std::cout << "Header found in: " << segment_filename << "\n"
              << "hash=" << hex(header.hash()) << "\n"
              << "parent_hash=" << hex(header.parent_hash) << "\n"
              << "number=" << header.number << "\n"
              << "beneficiary=" << hex(header.beneficiary) << "\n"
              << "ommers_hash=" << hex(header.ommers_hash) << "\n"
              << "state_root=" << hex(header.state_root) << "\n"
              << "transactions_root=" << hex(header.transactions_root) << "\n"
              << "receipts_root=" << hex(header.receipts_root) << "\n"
              << "withdrawals_root=" << (header.withdrawals_root ? hex(*header.withdrawals_root) : "") << "\n"
              << "timestamp=" << header.timestamp << "\n"
              << "nonce=" << hex(header.nonce) << "\n"
              << "mix_hash=" << hex(header.mix_hash) << "\n"
              << "base_fee_per_gas=" << (header.base_fee_per_gas ? intx::to_string(*header.base_fee_per_gas) : "") << "\n"
              << "difficulty=" << intx::to_string(header.difficulty) << "\n"
              << "total_difficulty=" << intx::to_string(td) << "\n"
              << "gas_limit=" << header.gas_limit << "\n"
              << "gas_used=" << header.gas_used << "\n"
              << "logs_bloom=" << hex(header.logs_bloom) << "\n"
              << "extra_data=" << hex(header.extra_data) << "\n";
}

static void print_txn(const TransactionWithHash& txn_with_hash, TxnId txn_id, const std::string& segment_filename) {
    const auto& txn{txn_with_hash.transaction};
    const auto sender{txn.sender()};
    std::cout << "Transaction found in: " << segment_filename << "\n"
              << "id=" << txn_id << "\n"
              << "hash=" << hex(txn_with_hash.hash) << "\n"
              << "type=" << magic_enum::enum_name(txn.type) << "\n"
              << "from=" << (sender ? hex(*sender) : "") << "\n"
              << "to=" << (txn.to ? hex(*txn.to) : "") << "\n"
              << "chain_id=" << (txn.chain_id ? intx::to_string(*txn.chain_id) : "") << "\n"
              << "nonce=" << txn.nonce << "\n"
              << "value=" << intx::to_string(txn.value) << "\n"
              << "gas_limit=" << txn.gas_limit << "\n"
              << "max_fee_per_gas=" << intx::to_string(txn.max_fee_per_gas) << "\n"
              << "max_priority_fee_per_gas=" << intx::to_string(txn.max_priority_fee_per_gas) << "\n"
              << "odd_y_parity=" << txn.odd_y_parity << "\n"
              << "v=" << intx::to_string(txn.v()) << "\n"
              << "r=" << intx::to_string(txn.r) << "\n"
              << "s=" << intx::to_string(txn.s) << "\n"
              << "data=" << hex(txn.data) << "\n"
              << "access_list_size=" << txn.access_list.size() << "\n";
}

static void print_receipt(const Receipt& receipt, TxnId txn_id, const std::string& segment_filename) {
    std::cout << "Receipt found in: " << segment_filename << "\n"
              << "id=" << txn_id << "\n"
              << "type=" << magic_enum::enum_name(receipt.type) << "\n"
              << "success=" << receipt.success << "\n"
              << "cumulative_gas_used=" << receipt.cumulative_gas_used << "\n"
              << "logs=" << receipt.logs.size() << "\n"
              << "bloom=" << hex(receipt.bloom) << "\n";
}

void info(const JarSettings& settings) {
    std::vector<SegmentPath> segment_paths;
    if (settings.segment_file_name) {
        auto segment_path{SegmentPath::parse(settings.repository_dir / *settings.segment_file_name)};
        ensure(segment_path.has_value(), [&]() { return "info: invalid segment file name " + *settings.segment_file_name; });
        segment_paths.push_back(std::move(*segment_path));
    } else {
        segment_paths = list_segments(settings.repository_dir);
    }
    SNAP_INFO << "Segment repository: " << settings.repository_dir.string() << " segments: " << segment_paths.size();
    for (const auto& path : segment_paths) {
        const Segment segment{path};
        SNAP_INFO_M("Segment", {"file", path.filename(),
                                "kind", std::string{to_string(segment.kind())},
                                "rows", segment.row_key_range().to_string(),
                                "index_entries", std::to_string(segment.index_entry_count())});
    }
}

void lookup_header(const JarSettings& settings) {
    ensure(settings.lookup_hash || settings.lookup_number, "lookup_header: either --hash or --number must be specified");
    std::chrono::time_point start{std::chrono::steady_clock::now()};

    bool found{false};
    for (const auto& path : segments_of_kind(settings, SegmentKind::headers)) {
        const Segment segment{path};
        const SegmentProvider provider{segment};
        std::optional<BlockNum> block_num{settings.lookup_number};
        if (settings.lookup_hash) {
            block_num = provider.block_number(*Hash::from_hex(*settings.lookup_hash));
        }
        if (!block_num || !segment.row_key_range().contains(*block_num)) continue;

        const auto sealed_header{provider.sealed_header(*block_num)};
        if (!sealed_header) continue;
        found = true;
        SNAP_INFO << "Lookup header: " << *block_num << " found in: " << path.filename();
        if (settings.print_items) {
            print_header(sealed_header->header, provider.header_td_by_number(*block_num).value_or(0), path.filename());
        }
        break;
    }
    if (!found) {
        SNAP_WARN << "Lookup header: " << settings.lookup_hash.value_or(std::to_string(settings.lookup_number.value_or(0))) << " NOT found";
    }

    std::chrono::duration elapsed{std::chrono::steady_clock::now() - start};
    SNAP_INFO << "Lookup header elapsed: " << std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() << " msec";
}

void lookup_txn(const JarSettings& settings) {
    ensure(settings.lookup_hash || settings.lookup_number, "lookup_txn: either --hash or --number must be specified");
    std::chrono::time_point start{std::chrono::steady_clock::now()};

    bool found{false};
    for (const auto& path : segments_of_kind(settings, SegmentKind::transactions)) {
        const Segment segment{path};
        const SegmentProvider provider{segment};
        std::optional<TxnId> txn_id{settings.lookup_number};
        if (settings.lookup_hash) {
            txn_id = provider.transaction_id(*Hash::from_hex(*settings.lookup_hash));
        }
        if (!txn_id || !segment.row_key_range().contains(*txn_id)) continue;

        const auto txn{provider.transaction_by_id(*txn_id)};
        if (!txn) continue;
        found = true;
        SNAP_INFO << "Lookup txn: " << *txn_id << " found in: " << path.filename();
        if (settings.print_items) {
            print_txn(*txn, *txn_id, path.filename());
        }
        break;
    }
    if (!found) {
        SNAP_WARN << "Lookup txn: " << settings.lookup_hash.value_or(std::to_string(settings.lookup_number.value_or(0))) << " NOT found";
    }

    std::chrono::duration elapsed{std::chrono::steady_clock::now() - start};
    SNAP_INFO << "Lookup txn elapsed: " << std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() << " msec";
}

void lookup_receipt(const JarSettings& settings) {
    ensure(settings.lookup_hash || settings.lookup_number, "lookup_receipt: either --hash or --number must be specified");
    std::chrono::time_point start{std::chrono::steady_clock::now()};

    bool found{false};
    for (const auto& path : segments_of_kind(settings, SegmentKind::receipts)) {
        const Segment segment{path};

        // Transaction hashes are resolved through the transaction segment covering the same blocks
        std::optional<Segment> transactions_segment;
        const auto transactions_path{path.related_path(SegmentKind::transactions)};
        if (settings.lookup_hash && transactions_path.exists()) {
            transactions_segment.emplace(transactions_path);
        }
        SegmentProvider provider{segment};
        if (transactions_segment) {
            provider.with_auxiliary(SegmentProvider{*transactions_segment});
        }

        std::optional<TxnId> txn_id{settings.lookup_number};
        if (settings.lookup_hash) {
            txn_id = provider.auxiliary() ? provider.auxiliary()->transaction_id(*Hash::from_hex(*settings.lookup_hash))
                                          : std::nullopt;
        }
        if (!txn_id || !segment.row_key_range().contains(*txn_id)) continue;

        const auto receipt{provider.receipt(*txn_id)};
        if (!receipt) continue;
        found = true;
        SNAP_INFO << "Lookup receipt: " << *txn_id << " found in: " << path.filename();
        if (settings.print_items) {
            print_receipt(*receipt, *txn_id, path.filename());
        }
        break;
    }
    if (!found) {
        SNAP_WARN << "Lookup receipt: " << settings.lookup_hash.value_or(std::to_string(settings.lookup_number.value_or(0))) << " NOT found";
    }

    std::chrono::duration elapsed{std::chrono::steady_clock::now() - start};
    SNAP_INFO << "Lookup receipt elapsed: " << std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() << " msec";
}

void senders(const JarSettings& settings) {
    const db::chain::RangeBounds range{
        db::chain::Bound::included(settings.from_txn_id),
        settings.to_txn_id ? db::chain::Bound::excluded(*settings.to_txn_id) : db::chain::Bound::unbounded()};
    std::chrono::time_point start{std::chrono::steady_clock::now()};

    WorkerPool workers{settings.num_workers};
    size_t recovered{0};
    for (const auto& path : segments_of_kind(settings, SegmentKind::transactions)) {
        const Segment segment{path};
        const SegmentProvider provider{segment, &workers};
        const auto senders{provider.senders_by_tx_range(range)};
        SNAP_INFO << "Senders recovered: " << senders.size() << " from: " << path.filename();
        if (settings.print_items) {
            for (const auto& sender : senders) {
                std::cout << hex(sender) << "\n";
            }
        }
        recovered += senders.size();
    }
    workers.join();

    std::chrono::duration elapsed{std::chrono::steady_clock::now() - start};
    SNAP_INFO << "Senders recovered: " << recovered << " elapsed: " << std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() << " msec";
}

int main(int argc, char* argv[]) {
    CLI::App app{"Jar toolbox"};

    try {
        JarToolboxSettings settings;
        parse_command_line(argc, argv, app, settings);

        // Initialize logging with custom settings
        log::init(settings.log_settings);

        auto command_name = app.get_subcommands().front()->get_name();
        auto tool = magic_enum::enum_cast<JarTool>(command_name).value();

        switch (tool) {
            case JarTool::info:
                info(settings.jar_settings);
                break;
            case JarTool::lookup_header:
                lookup_header(settings.jar_settings);
                break;
            case JarTool::lookup_txn:
                lookup_txn(settings.jar_settings);
                break;
            case JarTool::lookup_receipt:
                lookup_receipt(settings.jar_settings);
                break;
            case JarTool::senders:
                senders(settings.jar_settings);
                break;
        }

        return 0;
    } catch (const CLI::ParseError& pe) {
        return app.exit(pe);
    } catch (const std::exception& e) {
        SNAP_CRIT << "Jar toolbox exiting due to exception: " << e.what();
        return -2;
    } catch (...) {
        SNAP_CRIT << "Jar toolbox exiting due to unexpected exception";
        return -3;
    }
}
