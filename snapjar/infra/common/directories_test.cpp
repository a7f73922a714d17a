// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "directories.hpp"

#include <stdexcept>

#include <catch2/catch_test_macros.hpp>

namespace snapjar {

TEST_CASE("TemporaryDirectory", "[snapjar][infra][common][directories]") {
    std::filesystem::path tmp_path;
    {
        const TemporaryDirectory tmp_dir;
        tmp_path = tmp_dir.path();
        REQUIRE(std::filesystem::is_directory(tmp_path));

        const TemporaryDirectory nested_dir{tmp_path};
        CHECK(nested_dir.path().parent_path() == tmp_path);

        const TemporaryDirectory sibling_dir{tmp_path};
        CHECK(sibling_dir.path() != nested_dir.path());
    }
    CHECK_FALSE(std::filesystem::exists(tmp_path));
}

TEST_CASE("TemporaryDirectory invalid base path", "[snapjar][infra][common][directories]") {
    CHECK_THROWS_AS(TemporaryDirectory{std::filesystem::path{}}, std::invalid_argument);

    const TemporaryDirectory tmp_dir;
    CHECK_THROWS_AS(TemporaryDirectory{tmp_dir.path() / "nonexistent"}, std::invalid_argument);
    const auto file{tmp_dir.add_file("plain.jar")};
    CHECK_THROWS_AS(TemporaryDirectory{file}, std::invalid_argument);
}

TEST_CASE("TemporaryDirectory::add_file", "[snapjar][infra][common][directories]") {
    const TemporaryDirectory tmp_dir;
    const uint8_t content[]{0x01, 0x02, 0x03};

    const auto path{tmp_dir.add_file("v1-000000-000500-headers.jar", ByteView{content})};
    CHECK(path.parent_path() == tmp_dir.path());
    CHECK(std::filesystem::file_size(path) == 3);

    // Rewriting truncates
    tmp_dir.add_file("v1-000000-000500-headers.jar");
    CHECK(std::filesystem::file_size(path) == 0);
}

}  // namespace snapjar
