// ledger.cpp
#include "ledger.hpp"

#include <fstream>
#include <numeric>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace rescuecp::core {

namespace {

constexpr int kLedgerVersion = 1;
constexpr const char* kLedgerSuffix = ".badblocks";

} // namespace

void Ledger::absorb(const Ledger& other) {
    blocks_.insert(blocks_.end(), other.blocks_.begin(), other.blocks_.end());
    if (!block_size_) block_size_ = other.block_size_;
}

auto Ledger::find(std::uint64_t position) const -> const Block* {
    for (const auto& block : blocks_) {
        if (block.contains(position)) {
            return &block;
        }
    }
    return nullptr;
}

auto Ledger::total_bytes() const -> std::uint64_t {
    return std::accumulate(blocks_.begin(), blocks_.end(), std::uint64_t{0},
        [](std::uint64_t sum, const Block& b) { return sum + b.size; });
}

auto Ledger::block_size() const -> std::optional<std::uint32_t> {
    if (block_size_) return block_size_;
    if (blocks_.empty()) return std::nullopt;
    return static_cast<std::uint32_t>(total_bytes() / blocks_.size());
}

auto ledger_path_for(const std::filesystem::path& file) -> std::filesystem::path {
    auto path = file;
    path += kLedgerSuffix;
    return path;
}

auto load_ledger(const std::filesystem::path& path)
    -> infra::Result<std::optional<Ledger>>
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            return std::unexpected(infra::make_error(infra::ErrorCode::LedgerCorrupt,
                fmt::format("Cannot check ledger {}: {}", path.string(), ec.message())));
        }
        return std::optional<Ledger>{};
    }

    try {
        YAML::Node node = YAML::LoadFile(path.string());

        std::vector<Block> blocks;
        if (node["blocks"]) {
            for (const auto& entry : node["blocks"]) {
                blocks.push_back(Block{
                    .offset = entry["offset"].as<std::uint64_t>(),
                    .size = entry["size"].as<std::uint32_t>()
                });
            }
        }

        std::optional<std::uint32_t> block_size;
        if (node["block_size"]) {
            block_size = node["block_size"].as<std::uint32_t>();
        }

        spdlog::debug("Loaded {} bad blocks from {}", blocks.size(), path.string());
        return std::optional<Ledger>{Ledger(std::move(blocks), block_size)};
    } catch (const YAML::Exception& e) {
        return std::unexpected(infra::make_error(infra::ErrorCode::LedgerCorrupt,
            fmt::format("Cannot parse ledger {}: {}", path.string(), e.what())));
    }
}

auto save_ledger(const Ledger& ledger, const std::filesystem::path& path)
    -> infra::VoidResult
{
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "version" << YAML::Value << kLedgerVersion;
    if (auto size = ledger.block_size()) {
        out << YAML::Key << "block_size" << YAML::Value << *size;
    }
    out << YAML::Key << "bad_bytes" << YAML::Value << ledger.total_bytes();
    out << YAML::Key << "blocks" << YAML::Value << YAML::BeginSeq;
    for (const auto& block : ledger.blocks()) {
        out << YAML::Flow << YAML::BeginMap
            << YAML::Key << "offset" << YAML::Value << block.offset
            << YAML::Key << "size" << YAML::Value << block.size
            << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            return std::unexpected(infra::make_error(infra::ErrorCode::StreamFailure,
                fmt::format("Cannot create {}", tmp.string())));
        }
        ofs << out.c_str() << '\n';
        ofs.flush();
        if (!ofs) {
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            return std::unexpected(infra::make_error(infra::ErrorCode::StreamFailure,
                fmt::format("Cannot write {}", tmp.string())));
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        return std::unexpected(infra::make_error(infra::ErrorCode::StreamFailure,
            fmt::format("Cannot move ledger into place at {}: {}", path.string(), ec.message())));
    }
    return {};
}

auto remove_ledger(const std::filesystem::path& path) -> infra::VoidResult {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::StreamFailure,
            fmt::format("Cannot remove ledger {}: {}", path.string(), ec.message())));
    }
    return {};
}

} // namespace rescuecp::core
