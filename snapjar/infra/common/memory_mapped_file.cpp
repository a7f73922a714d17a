// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "memory_mapped_file.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <string>
#include <system_error>
#include <utility>

#include <gsl/util>
#include <sys/mman.h>

#include "ensure.hpp"
#include "log.hpp"

namespace snapjar {

namespace fs = std::filesystem;

static std::system_error last_system_error(const std::string& what, const fs::path& path) {
    return std::system_error{errno, std::generic_category(), what + " " + path.string()};
}

MemoryMappedFile::MemoryMappedFile(fs::path path, MemoryMappedRegion region, Mapping mapping)
    : path_{std::move(path)}, region_{region}, mapping_{std::move(mapping)} {}

MemoryMappedFile MemoryMappedFile::map(const fs::path& path) {
    ensure(fs::is_regular_file(path), [&]() { return "MemoryMappedFile: " + path.string() + " is not a regular file"; });
    const auto size{fs::file_size(path)};
    ensure(size > 0, [&]() { return "MemoryMappedFile: " + path.string() + " is empty"; });

    const int fd{::open(path.c_str(), O_RDONLY)};
    if (fd == -1) {
        throw last_system_error("open", path);
    }
    [[maybe_unused]] auto close_fd = gsl::finally([fd]() { ::close(fd); });

    void* address{::mmap(nullptr, size, PROT_READ, MAP_SHARED, fd, 0)};
    if (address == MAP_FAILED) {
        throw last_system_error("mmap", path);
    }
    const auto* data{static_cast<const uint8_t*>(address)};
    return MemoryMappedFile{path, {data, size}, Mapping{data, Unmap{path, size}}};
}

MemoryMappedFile MemoryMappedFile::borrow(const fs::path& path, MemoryMappedRegion region) {
    ensure_pre_condition(region.data() != nullptr, "MemoryMappedFile: region address is null");
    ensure_pre_condition(!region.empty(), "MemoryMappedFile: region is empty");
    return MemoryMappedFile{path, region, Mapping{nullptr, Unmap{}}};
}

void MemoryMappedFile::Unmap::operator()(const uint8_t* address) const noexcept {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
    if (::munmap(const_cast<uint8_t*>(address), size) == -1) {
        SNAP_WARN << "munmap failed for " << path.string() << ": " << std::generic_category().message(errno);
    }
}

void MemoryMappedFile::advise_random() const {
    if (!mapping_) return;
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
    if (::madvise(const_cast<uint8_t*>(region_.data()), region_.size(), MADV_RANDOM) == -1 && errno != ENOSYS) {
        throw last_system_error("madvise", path_);
    }
}

}  // namespace snapjar
