#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cstdlib>

#include <unistd.h>
#include <pwd.h>

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"

namespace rescuecp::infra {
    void Config::merge_with(const Config& other) {
        if (other.block_size) block_size = other.block_size;
        if (other.max_retries) max_retries = other.max_retries;
        if (other.retry_delay_ms) retry_delay_ms = other.retry_delay_ms;
        if (other.retry_backoff) retry_backoff = other.retry_backoff;
        if (other.range_offset) range_offset = other.range_offset;
        if (other.range_length) range_length = other.range_length;
        if (other.log_level) log_level = other.log_level;
        if (other.overwrite) overwrite = true;
        if (other.delete_source) delete_source = true;
        if (!other.progress) progress = false; // CLI может отключить
        if (other.quiet) quiet = true;
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальный файл
        paths.push_back(".rescuecp.yaml");

        // 2. Глобальный файл
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "rescuecp" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (!home) {
                if (const passwd* pw = ::getpwuid(::getuid())) {
                    home = pw->pw_dir;
                }
            }
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "rescuecp" / "config.yaml");
            }
        }

        return paths;
    }

    auto load_config_from_path(const std::filesystem::path& path)
        -> std::expected<Config, std::string>
    {
        try {
            YAML::Node config = YAML::LoadFile(path.string());
            Config cfg{};

            if (config["block_size"]) cfg.block_size = config["block_size"].as<std::uint32_t>();
            if (config["max_retries"]) cfg.max_retries = config["max_retries"].as<int>();
            if (config["retry_delay_ms"]) cfg.retry_delay_ms = config["retry_delay_ms"].as<std::uint32_t>();
            if (config["retry_backoff"]) cfg.retry_backoff = config["retry_backoff"].as<double>();

            if (config["progress"]) cfg.progress = config["progress"].as<bool>();
            if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();
            if (config["log_level"]) cfg.log_level = config["log_level"].as<std::string>();

            spdlog::debug("Loaded config from {}", path.string());
            return cfg;

        } catch (const std::exception& e) {
            return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
        }
    }

    auto load_config_from_file() -> std::expected<Config, std::string> {
        for (const auto& path : get_config_paths()) {
            if (!std::filesystem::exists(path)) continue;
            return load_config_from_path(path);
        }

        // Файл не найден: пустой конфиг, это не ошибка
        return Config{};
    }

    [[nodiscard]]
    auto config_from_cli(const args_parser::CLIArgs& args) -> Config {
        Config cfg{};
        cfg.block_size = args.block_size;
        cfg.max_retries = args.max_retries;
        cfg.retry_delay_ms = args.retry_delay_ms;
        cfg.range_offset = args.range_offset;
        cfg.range_length = args.range_length;
        cfg.overwrite = args.overwrite;
        cfg.delete_source = args.delete_source;
        cfg.progress = args.progress;
        cfg.quiet = args.quiet;
        cfg.log_level = args.log_level;
        return cfg;
    }

    auto validate(const Config& config) -> std::expected<void, std::string> {
        const auto block_size = config.effective_block_size();
        if (block_size < kMinBlockSize || block_size > kMaxBlockSize) {
            return std::unexpected(fmt::format("block size {} is outside [{}, {}]",
                                               block_size, kMinBlockSize, kMaxBlockSize));
        }
        if (config.effective_max_retries() < 0) {
            return std::unexpected(fmt::format("retry count must not be negative (got {})",
                                               config.effective_max_retries()));
        }
        if (config.retry_backoff && *config.retry_backoff < 1.0) {
            return std::unexpected(fmt::format("retry backoff must be >= 1.0 (got {})",
                                               *config.retry_backoff));
        }
        if (config.log_level &&
            spdlog::level::from_str(*config.log_level) == spdlog::level::off &&
            *config.log_level != "off") {
            return std::unexpected(fmt::format("unknown log level '{}'", *config.log_level));
        }
        return {};
    }

} // namespace rescuecp::infra
