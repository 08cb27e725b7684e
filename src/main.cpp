#include <fmt/core.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "core/copy_orchestrator/copy_orchestrator.hpp"
#include <build_info.hpp>
#include <spdlog/spdlog.h>
#include <chrono>

using ARGS = rescuecp::args_parser::CLIArgs;

constexpr auto load_from_cli = rescuecp::infra::config_from_cli;
constexpr auto load_config_file = rescuecp::infra::load_config_from_file;
constexpr auto args_parser = rescuecp::args_parser::parse_args;
constexpr auto build = rescuecp::build_info::get_build_info();

static auto
__out_args_verse(const ARGS& args, const rescuecp::infra::Config& config)
-> void {
    spdlog::debug("rescuecp {} ({}{})", build.version, build.commit_short, build.dirty ? ", dirty" : "");
    spdlog::debug("Source: {}", args.source);
    spdlog::debug("Destination: {}", args.destination);
    spdlog::debug("Auxiliary: {}", args.auxiliary.value_or("none"));
    spdlog::debug("Block size: {}", config.effective_block_size());
    spdlog::debug("Retries: {}", config.effective_max_retries());
    spdlog::debug("Overwrite: {}", config.overwrite ? "yes" : "no");
    spdlog::debug("Delete source: {}", config.delete_source ? "yes" : "no");
}

int main(int argc, char** argv)
{
    namespace infra = rescuecp::infra;
    namespace core = rescuecp::core;

    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        rescuecp::args_parser::ParseExit parse_exit{};
        auto args_opt = args_parser(argc, argv, &parse_exit);
        if (!args_opt) {
            return parse_exit.exit_code; // --help, --version или ошибка
        }
        const auto& args = *args_opt;

        // 1. Загрузить из файла
        auto config_res = load_config_file();
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error());
            return infra::exit_code::Precondition;
        }
        auto config = config_res.value();

        // 2. Переопределить из CLI
        config.merge_with(load_from_cli(args)); // CLI имеет приоритет

        if (auto valid = infra::validate(config); !valid) {
            spdlog::error("Invalid configuration: {}", valid.error());
            return infra::exit_code::Precondition;
        }

        if (config.log_level) {
            spdlog::set_level(spdlog::level::from_str(*config.log_level));
        } else if (config.quiet) {
            spdlog::set_level(spdlog::level::warn);
        }

        __out_args_verse(args, config);

        infra::ProgressMonitor monitor(config.progress, config.quiet);
        core::CopyOrchestrator orchestrator(config, monitor);

        core::CopyJob job{
            .source = args.source,
            .destination = args.destination,
            .auxiliary = args.auxiliary
                ? std::optional<std::filesystem::path>(*args.auxiliary)
                : std::nullopt
        };

        auto start_time = std::chrono::steady_clock::now();
        auto result = orchestrator.run(job);
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        if (!result) {
            auto err = infra::log_and_return(std::move(result.error()));
            return err.to_exit_code();
        }

        const auto& report = *result;
        spdlog::info("Finished {} in {:.2f} s: {} bytes from source, {} from partial copy, "
                     "{} left as is, {} bad",
                     report.final_path.string(), duration.count() / 1000.0,
                     report.bytes_from_source, report.bytes_from_partial,
                     report.bytes_skipped, report.bad_bytes());

        if (report.bytes_from_source > 0 && duration.count() > 0) {
            double speed_mbps = (report.bytes_from_source / 1024.0 / 1024.0) / (duration.count() / 1000.0);
            spdlog::info("Average speed: {:.2f} MB/s", speed_mbps);
        }

        return report.exit_code();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return infra::exit_code::IoFailure;
    }
}
