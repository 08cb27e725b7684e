// metadata.cpp
#include <filesystem>
#include <expected>
#include <regex>
#include <fmt/core.h>
#include "metadata.hpp"
#include "../adapters/fs.hpp"

namespace rescuecp::extensions {

namespace {

const std::regex& marker_pattern() {
    static const std::regex pattern{R"(^(.+)\.bad-[0-9]+-bytes(\.[^.]*)?$)"};
    return pattern;
}

} // namespace

auto copy_metadata(const std::filesystem::path& src,
                   const std::filesystem::path& dst)
    -> std::expected<void, infra::Error>
{
    auto read_only = adapters::fs::is_read_only(src);
    if (!read_only) {
        return std::unexpected(std::move(read_only.error()));
    }

    // Временные метки
    auto times = adapters::fs::copy_timestamps(src, dst);
    if (!times) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
                             fmt::format("Metadata copy failed: {}", times.error().message)));
    }

    // Права: переносим только признак "только чтение", последним
    auto flag = adapters::fs::set_read_only(dst, *read_only);
    if (!flag) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
                             fmt::format("Metadata copy failed: {}", flag.error().message)));
    }
    return {};
}

auto marked_path(const std::filesystem::path& path, std::uint64_t bad_bytes)
    -> std::filesystem::path
{
    const auto clean = unmarked_path(path);
    auto name = fmt::format("{}.bad-{}-bytes{}",
                            clean.stem().string(), bad_bytes, clean.extension().string());
    return clean.parent_path() / name;
}

auto unmarked_path(const std::filesystem::path& path) -> std::filesystem::path {
    const auto name = path.filename().string();
    std::smatch match;
    if (!std::regex_match(name, match, marker_pattern())) {
        return path;
    }
    return path.parent_path() / (match[1].str() + match[2].str());
}

} // namespace rescuecp::extensions
