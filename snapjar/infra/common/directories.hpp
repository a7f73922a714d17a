// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <string>

#include <snapjar/core/common/bytes.hpp>

namespace snapjar {

//! \brief Uniquely named directory removed with all its content on destruction
class TemporaryDirectory final {
  public:
    //! \brief Create the directory under base_path, which must exist
    //! \throws std::invalid_argument if base_path is not a directory
    explicit TemporaryDirectory(const std::filesystem::path& base_path = std::filesystem::temp_directory_path());
    ~TemporaryDirectory();

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }

    //! Write a file in this directory, replacing any existing one, and return its path
    std::filesystem::path add_file(const std::string& name, ByteView content = {}) const;

  private:
    std::filesystem::path path_;
};

}  // namespace snapjar
