#pragma once

#include <string>
#include <vector>

#include "cop/core/buffer.hpp"
#include "cop/core/errors.hpp"
#include "cop/core/types.hpp"

namespace cop::store {
    using u32 = cop::core::u32;

    // mkdir -p with the given mode for every created component.
    cop::core::Status create_directories(const std::string& dir, u32 mode) noexcept;

    // NotFound when the file is missing; Io (errno in aux) otherwise.
    cop::core::Status read_file(const std::string& path, cop::core::Bytes* out) noexcept;

    // Writes to a sibling temp file, fsyncs and renames over path.
    // With exclusive set an existing path is a Conflict.
    cop::core::Status write_file(const std::string& path,
        cop::core::BufferView data,
        u32 mode,
        bool exclusive) noexcept;

    // Regular-file names in dir ending with suffix, suffix stripped, sorted.
    cop::core::Status list_files(const std::string& dir,
        const std::string& suffix,
        std::vector<std::string>* stems) noexcept;

} // namespace cop::store
