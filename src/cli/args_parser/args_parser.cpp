#include "args_parser.hpp"

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <build_info.hpp>

#include "../../infra/error_handler/error.hpp"

namespace rescuecp::args_parser {

namespace {

auto version_string() -> std::string {
    constexpr auto info = build_info::get_build_info();
    return fmt::format("rescuecp {} ({}{})", info.version, info.commit_short,
                       info.dirty ? ", dirty" : "");
}

} // namespace

std::optional<CLIArgs> parse_args(int argc, char const* const* argv, ParseExit* exit)
{
    CLIArgs args{};

    CLI::App app{"Copy a file from failing media. Unreadable blocks are zero-filled "
                 "and recorded in a <file>.badblocks ledger for a later repair pass."};
    app.name("rescuecp");
    app.set_version_flag("-V,--version", version_string());

    app.add_option("source", args.source, "File to copy")->required();
    app.add_option("destination", args.destination, "Where the copy is written")->required();
    app.add_option("auxiliary", args.auxiliary,
                   "With --overwrite: an earlier copy to repair in place. "
                   "Without: a partial copy to merge good blocks from");

    app.add_option("-b,--block-size", args.block_size, "Transfer block size in bytes (default 4096)");
    app.add_option("-r,--retries", args.max_retries, "Extra read attempts per failing block (default 0)");
    app.add_option("--retry-delay", args.retry_delay_ms, "Delay before the first retry, in ms");
    app.add_option("--offset", args.range_offset, "First byte to copy (only 0 is supported)");
    app.add_option("--length", args.range_length, "Bytes to copy (only the whole file is supported)");

    app.add_flag("-o,--overwrite", args.overwrite,
                 "Repair an existing destination using its bad-block ledger");
    app.add_flag("--delete-source", args.delete_source,
                 "Remove the source after a copy without bad blocks");
    app.add_flag("--progress,!--no-progress", args.progress, "Show a progress line");
    app.add_flag("-q,--quiet", args.quiet, "Only report warnings and errors");
    app.add_option("--log-level", args.log_level, "trace, debug, info, warn, error, critical or off")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "warning", "error", "err",
                               "critical", "off"}));

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        const int code = app.exit(e);
        if (exit) {
            exit->exit_code = code == static_cast<int>(CLI::ExitCodes::Success)
                ? infra::exit_code::Clean
                : infra::exit_code::Precondition;
        }
        return std::nullopt;
    }

    return args;
}

} // namespace rescuecp::args_parser
