// src/extensions/metadata.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include "../infra/error_handler/error.hpp"

namespace rescuecp::extensions {

/// Timestamps and the read-only flag of `src` are applied to `dst`.
[[nodiscard]] auto copy_metadata(const std::filesystem::path& src,
                                 const std::filesystem::path& dst)
    -> std::expected<void, infra::Error>;

/// `photo.jpg` -> `photo.bad-8192-bytes.jpg`. A marker already present in
/// the name is replaced, not stacked.
[[nodiscard]] auto marked_path(const std::filesystem::path& path, std::uint64_t bad_bytes)
    -> std::filesystem::path;

/// Drops the bad-bytes marker from a name produced by marked_path.
[[nodiscard]] auto unmarked_path(const std::filesystem::path& path) -> std::filesystem::path;

} // namespace rescuecp::extensions
