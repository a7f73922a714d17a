// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include <evmc/evmc.hpp>
#include <tl/expected.hpp>

#include <snapjar/core/common/bytes.hpp>
#include <snapjar/core/common/decoding_result.hpp>
#include <snapjar/core/rlp/reader.hpp>
#include <snapjar/core/rlp/writer.hpp>
#include <snapjar/core/types/transaction.hpp>

namespace snapjar {

inline constexpr size_t kBloomByteLength{256};

//! 2048-bit filter over log addresses and topics, see Yellow Paper section 4.3.1
using Bloom = std::array<uint8_t, kBloomByteLength>;

struct Log {
    evmc::address address;
    std::vector<evmc::bytes32> topics;
    Bytes data;

    friend bool operator==(const Log&, const Log&) = default;
};

struct Receipt {
    TransactionType type{TransactionType::kLegacy};
    bool success{false};
    uint64_t cumulative_gas_used{0};
    Bloom bloom{};
    std::vector<Log> logs;

    friend bool operator==(const Receipt&, const Receipt&) = default;
};

//! Set the three bloom bits selected by the Keccak-256 of the item
void add_to_bloom(Bloom& bloom, ByteView item);

Bloom logs_bloom(const std::vector<Log>& logs);

//! Raw EIP-2718 envelope, the same shape as the one of the transaction it belongs to
Bytes encode_receipt(const Receipt& receipt);

tl::expected<Receipt, DecodingError> decode_receipt(ByteView envelope);

namespace rlp {
    void encode(Writer& writer, const Log& log);
    DecodingResult decode(Reader& reader, Log& log);
}  // namespace rlp

}  // namespace snapjar
