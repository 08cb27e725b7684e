#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <expected>
#include <filesystem>

namespace rescuecp::args_parser{
    struct CLIArgs;
}

namespace rescuecp::infra {

inline constexpr std::uint32_t kDefaultBlockSize = 4096;
inline constexpr std::uint32_t kMinBlockSize = 512;
inline constexpr std::uint32_t kMaxBlockSize = 64u * 1024u * 1024u;

struct Config {
    // I/O
    std::optional<std::uint32_t> block_size;   // bytes
    std::optional<int> max_retries;
    std::optional<std::uint32_t> retry_delay_ms;
    std::optional<double> retry_backoff;

    // Запрошенный диапазон байт (поддерживается только весь файл)
    std::optional<std::uint64_t> range_offset;
    std::optional<std::uint64_t> range_length;

    // Behavior
    bool overwrite = false;
    bool delete_source = false;
    bool progress = true;
    bool quiet = false;
    std::optional<std::string> log_level;

    [[nodiscard]] auto effective_block_size() const -> std::uint32_t {
        return block_size.value_or(kDefaultBlockSize);
    }
    [[nodiscard]] auto effective_max_retries() const -> int {
        return max_retries.value_or(0);
    }

    // Слияние с другим Config (например, из CLI)
    void merge_with(const Config& other);
};

/// Загружает конфигурацию из файла YAML.
/// Ищет файл в порядке:
///   1. ./.rescuecp.yaml
///   2. $XDG_CONFIG_HOME/rescuecp/config.yaml
///   3. ~/.config/rescuecp/config.yaml
/// Возвращает пустой Config, если файл не найден.
[[nodiscard]] auto load_config_from_file() -> std::expected<Config, std::string>;

/// Parses one YAML config file. Missing keys stay unset.
[[nodiscard]] auto load_config_from_path(const std::filesystem::path& path)
    -> std::expected<Config, std::string>;

/// Создаёт Config из CLI аргументов (структура из args_parser)
[[nodiscard]] auto config_from_cli(const struct rescuecp::args_parser::CLIArgs& args) -> Config;

/// Range checks on the merged configuration.
[[nodiscard]] auto validate(const Config& config) -> std::expected<void, std::string>;

} // namespace rescuecp::infra
