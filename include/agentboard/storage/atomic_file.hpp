#pragma once

#include "agentboard/core/error.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace agentboard {

// Replaces `path` with `contents` so that a reader sees either the old file
// or the new one, never a mix: write a sibling temp file, fsync, rename,
// fsync the directory. The temp file is removed on any failure.
[[nodiscard]] auto write_file_atomic(const std::filesystem::path& path,
                                     std::string_view contents) -> Result<void>;

// nullopt when the file does not exist.
[[nodiscard]] auto read_file(const std::filesystem::path& path)
    -> Result<std::optional<std::string>>;

[[nodiscard]] auto temp_path_for(const std::filesystem::path& path)
    -> std::filesystem::path;

// True for names produced by temp_path_for(live).
[[nodiscard]] auto is_temp_file_for(const std::filesystem::path& live,
                                    const std::filesystem::path& candidate)
    -> bool;

[[nodiscard]] auto fsync_directory(const std::filesystem::path& dir)
    -> Result<void>;

}  // namespace agentboard
