// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "memory_mapped_file.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

#include <catch2/catch_test_macros.hpp>

#include <snapjar/infra/common/directories.hpp>

namespace snapjar {

static std::filesystem::path write_file(const std::filesystem::path& dir, const std::string& content) {
    const auto path{dir / "content.jar"};
    std::ofstream{path, std::ios::binary} << content;
    return path;
}

TEST_CASE("MemoryMappedFile::map", "[snapjar][infra][common][memory_mapped_file]") {
    TemporaryDirectory tmp_dir;

    SECTION("missing file") {
        CHECK_THROWS_AS(MemoryMappedFile::map(tmp_dir.path() / "missing.jar"), std::logic_error);
    }

    SECTION("empty file") {
        CHECK_THROWS_AS(MemoryMappedFile::map(write_file(tmp_dir.path(), "")), std::logic_error);
    }

    SECTION("directory") {
        CHECK_THROWS_AS(MemoryMappedFile::map(tmp_dir.path()), std::logic_error);
    }

    SECTION("content and ownership") {
        const auto path{write_file(tmp_dir.path(), "\x01\x02\x03")};
        MemoryMappedFile file{MemoryMappedFile::map(path)};
        CHECK(file.path() == path);
        CHECK(file.owns_mapping());
        REQUIRE(file.size() == 3);
        CHECK(file.region()[0] == 0x01);
        CHECK(file.region()[2] == 0x03);
        CHECK_NOTHROW(file.advise_random());

        const MemoryMappedFile moved{std::move(file)};
        CHECK(moved.owns_mapping());
        CHECK(moved.region()[1] == 0x02);
    }
}

TEST_CASE("MemoryMappedFile::borrow", "[snapjar][infra][common][memory_mapped_file]") {
    TemporaryDirectory tmp_dir;
    const auto path{write_file(tmp_dir.path(), "\x01\x02\x03")};

    CHECK_THROWS_AS(MemoryMappedFile::borrow(path, MemoryMappedRegion{}), std::invalid_argument);
    const uint8_t byte{0};
    CHECK_THROWS_AS(MemoryMappedFile::borrow(path, MemoryMappedRegion{&byte, 0}), std::invalid_argument);

    const MemoryMappedFile owner{MemoryMappedFile::map(path)};
    {
        const MemoryMappedFile borrowed{MemoryMappedFile::borrow(path, owner.region())};
        CHECK_FALSE(borrowed.owns_mapping());
        CHECK(borrowed.region().data() == owner.region().data());
        CHECK_NOTHROW(borrowed.advise_random());
    }
    // The owner mapping survives the borrower
    CHECK(owner.region()[0] == 0x01);
}

}  // namespace snapjar
