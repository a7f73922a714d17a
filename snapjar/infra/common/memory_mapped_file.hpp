// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>

namespace snapjar {

using MemoryMappedRegion = std::span<const uint8_t>;

//! \brief Read-only view of a whole file, either mapped by this instance or borrowed from an existing mapping.
//! Only a mapping created by map() is released on destruction.
class MemoryMappedFile {
  public:
    //! \brief Map the file read-only
    //! \throws std::logic_error if the file is missing or empty, std::system_error if mapping fails
    static MemoryMappedFile map(const std::filesystem::path& path);

    //! \brief Adopt a region mapped elsewhere, throws std::invalid_argument if it is null or empty
    static MemoryMappedFile borrow(const std::filesystem::path& path, MemoryMappedRegion region);

    const std::filesystem::path& path() const { return path_; }
    MemoryMappedRegion region() const { return region_; }
    size_t size() const { return region_.size(); }

    bool owns_mapping() const { return mapping_ != nullptr; }

    //! Hint the kernel that pages are read in no particular order, no-op on a borrowed region
    void advise_random() const;

  private:
    struct Unmap {
        std::filesystem::path path;
        size_t size{0};
        void operator()(const uint8_t* address) const noexcept;
    };
    using Mapping = std::unique_ptr<const uint8_t, Unmap>;

    MemoryMappedFile(std::filesystem::path path, MemoryMappedRegion region, Mapping mapping);

    std::filesystem::path path_;
    MemoryMappedRegion region_;
    Mapping mapping_;
};

}  // namespace snapjar
