#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>
#include "../../infra/error_handler/error.hpp"

namespace rescuecp::core {

/// A byte range that could not be read within the retry budget.
struct Block {
    std::uint64_t offset = 0;
    std::uint32_t size = 0;

    [[nodiscard]] auto end() const -> std::uint64_t { return offset + size; }
    [[nodiscard]] auto contains(std::uint64_t position) const -> bool {
        return offset <= position && position < end();
    }

    friend bool operator==(const Block&, const Block&) = default;
};

/// Bad blocks of one file, in the order they were discovered.
/// Overlaps and out-of-order entries are kept as they are: lookups take the
/// first covering block and nothing is sorted or merged.
class Ledger {
public:
    Ledger() = default;
    explicit Ledger(std::vector<Block> blocks, std::optional<std::uint32_t> block_size = std::nullopt)
        : blocks_(std::move(blocks)), block_size_(block_size) {}

    void append(Block block) { blocks_.push_back(block); }

    /// Appends every block of `other`. No deduplication.
    void absorb(const Ledger& other);

    /// First block covering `position`, if any.
    [[nodiscard]] auto find(std::uint64_t position) const -> const Block*;
    [[nodiscard]] auto covers(std::uint64_t position) const -> bool { return find(position) != nullptr; }

    [[nodiscard]] auto blocks() const -> const std::vector<Block>& { return blocks_; }
    [[nodiscard]] auto empty() const -> bool { return blocks_.empty(); }
    [[nodiscard]] auto size() const -> std::size_t { return blocks_.size(); }
    [[nodiscard]] auto total_bytes() const -> std::uint64_t;

    /// Block size the ledger was recorded with. Ledgers written without it
    /// report the average block size instead; empty ones report nothing.
    [[nodiscard]] auto block_size() const -> std::optional<std::uint32_t>;
    void set_block_size(std::uint32_t size) { block_size_ = size; }

private:
    std::vector<Block> blocks_;
    std::optional<std::uint32_t> block_size_;
};

/// `<file>.badblocks`
[[nodiscard]] auto ledger_path_for(const std::filesystem::path& file) -> std::filesystem::path;

/// Loads the ledger stored at `path`.
/// std::nullopt means no ledger file exists; a malformed file is an error.
[[nodiscard]] auto load_ledger(const std::filesystem::path& path)
    -> infra::Result<std::optional<Ledger>>;

/// Writes the whole ledger to a temporary sibling and renames it over `path`.
[[nodiscard]] auto save_ledger(const Ledger& ledger, const std::filesystem::path& path)
    -> infra::VoidResult;

/// Removes the ledger at `path`. A missing file is not an error.
[[nodiscard]] auto remove_ledger(const std::filesystem::path& path) -> infra::VoidResult;

} // namespace rescuecp::core
