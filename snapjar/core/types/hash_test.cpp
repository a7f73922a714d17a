// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "hash.hpp"

#include <catch2/catch_test_macros.hpp>

#include <snapjar/core/common/util.hpp>

namespace snapjar {

using namespace evmc::literals;

TEST_CASE("Hash hex form", "[snapjar][core][types]") {
    const Hash hash{0xe17d4d0c4596ea7d5166ad5da600a6fdc49e26e0680135a2f7300eedfd0d8314_bytes32};
    CHECK(hash.to_hex() == "0xe17d4d0c4596ea7d5166ad5da600a6fdc49e26e0680135a2f7300eedfd0d8314");
    CHECK(Hash::from_hex(hash.to_hex()) == hash);
    CHECK(Hash::from_hex("e17d4d0c4596ea7d5166ad5da600a6fdc49e26e0680135a2f7300eedfd0d8314") == hash);

    CHECK_FALSE(Hash::from_hex("foo"));
    CHECK_FALSE(Hash::from_hex("0xe17d4d0c4596ea7d"));
}

TEST_CASE("Hash from bytes", "[snapjar][core][types]") {
    const Hash hash{0x5c504ed432cb51138bcf09aa5e8a410dd4a1e204ef84bfed1be16dfba1b22060_bytes32};
    CHECK(Hash::from_bytes(hash.view()) == hash);
    CHECK_FALSE(Hash::from_bytes(hash.view().substr(1)));
    CHECK_FALSE(Hash::from_bytes(ByteView{}));
}

TEST_CASE("Hash fingerprint", "[snapjar][core][types]") {
    const Hash hash{0x5c504ed432cb51138bcf09aa5e8a410dd4a1e204ef84bfed1be16dfba1b22060_bytes32};
    CHECK(hash.prefix_u64() == 0x5c504ed432cb5113);
    CHECK(Hash{}.prefix_u64() == 0);

    // Only the first 8 bytes contribute
    Hash twin{hash};
    twin.bytes[kHashLength - 1] ^= 0xff;
    CHECK(twin != hash);
    CHECK(twin.prefix_u64() == hash.prefix_u64());
}

TEST_CASE("keccak256", "[snapjar][core][types]") {
    CHECK(keccak256(ByteView{}) == 0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470_bytes32);
    CHECK(keccak256(*from_hex("c0")) == 0x1dcc4de8dec75d7aab85b567b6ccd41ad312451b948a7413f0a142fd40d49347_bytes32);
}

}  // namespace snapjar
