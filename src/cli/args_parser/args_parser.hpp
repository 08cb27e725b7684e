#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>



namespace rescuecp::args_parser {
    struct CLIArgs
{
    std::string source;                          // первый позиционный аргумент
    std::string destination;                     // второй позиционный аргумент
    std::optional<std::string> auxiliary;        // существующая копия или частичная копия
    std::optional<std::uint32_t> block_size;     // -b, --block-size=SIZE
    std::optional<int> max_retries;              // -r, --retries=N
    std::optional<std::uint32_t> retry_delay_ms; // --retry-delay=MS
    std::optional<std::uint64_t> range_offset;   // --offset=POS
    std::optional<std::uint64_t> range_length;   // --length=SIZE
    bool overwrite{false};                       // -o, --overwrite
    bool delete_source{false};                   // --delete-source
    bool progress{true};                         // --progress / --no-progress
    bool quiet{false};                           // -q, --quiet
    std::optional<std::string> log_level;        // --log-level=LEVEL
};

/// Result of a parse that did not produce arguments to run with:
/// `--help`, `--version` or a usage error. `exit_code` is what main returns.
struct ParseExit {
    int exit_code = 0;
};

/// Parses command-line arguments and returns a CLIArgs struct.
/// Returns std::nullopt and fills `exit` when the program should stop
/// (help was printed, or the arguments were rejected).
std::optional<CLIArgs> parse_args(int argc, char const* const* argv, ParseExit* exit = nullptr);

} // namespace rescuecp::args_parser

using __CLI = rescuecp::args_parser::CLIArgs;
