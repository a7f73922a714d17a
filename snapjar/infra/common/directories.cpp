// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "directories.hpp"

#include <fstream>
#include <random>
#include <stdexcept>
#include <system_error>

#include <absl/strings/str_format.h>

namespace snapjar {

namespace fs = std::filesystem;

// Attempts at picking a name not taken yet
static constexpr int kMaxNameAttempts{100};

TemporaryDirectory::TemporaryDirectory(const fs::path& base_path) {
    if (base_path.empty() || !fs::is_directory(base_path)) {
        throw std::invalid_argument{"TemporaryDirectory: " + base_path.string() + " is not a directory"};
    }
    thread_local std::mt19937_64 generator{std::random_device{}()};
    const auto absolute_base_path{fs::absolute(base_path)};
    for (int attempt{0}; attempt < kMaxNameAttempts; ++attempt) {
        // create_directory returns false when the name is already taken
        auto candidate{absolute_base_path / absl::StrFormat("snapjar-%016x", generator())};
        if (fs::create_directory(candidate)) {
            path_ = std::move(candidate);
            return;
        }
    }
    throw std::runtime_error{"TemporaryDirectory: no free name under " + absolute_base_path.string()};
}

TemporaryDirectory::~TemporaryDirectory() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

fs::path TemporaryDirectory::add_file(const std::string& name, ByteView content) const {
    const fs::path file_path{path_ / name};
    std::ofstream stream{file_path, std::ios::binary | std::ios::trunc};
    stream.exceptions(std::ios::failbit | std::ios::badbit);
    stream.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
    return file_path;
}

}  // namespace snapjar
