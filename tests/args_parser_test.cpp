#include <gtest/gtest.h>

#include <vector>

#include "cli/args_parser/args_parser.hpp"
#include "infra/error_handler/error.hpp"

namespace ap = rescuecp::args_parser;

namespace {

auto parse(std::vector<const char*> argv, ap::ParseExit* exit = nullptr) -> std::optional<ap::CLIArgs> {
    argv.insert(argv.begin(), "rescuecp");
    return ap::parse_args(static_cast<int>(argv.size()), argv.data(), exit);
}

} // namespace

TEST(ArgsParserTest, PositionalsAndDefaults)
{
    auto args = parse({"/dev/sdb1", "disk.img"});
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(args->source, "/dev/sdb1");
    EXPECT_EQ(args->destination, "disk.img");
    EXPECT_FALSE(args->auxiliary.has_value());
    EXPECT_FALSE(args->block_size.has_value());
    EXPECT_FALSE(args->max_retries.has_value());
    EXPECT_FALSE(args->overwrite);
    EXPECT_TRUE(args->progress);
}

TEST(ArgsParserTest, AllOptions)
{
    auto args = parse({"-b", "65536", "-r", "3", "--retry-delay", "100", "--overwrite",
                       "--delete-source", "--no-progress", "-q", "--log-level", "debug",
                       "--offset", "0", "--length", "1024",
                       "src.bin", "dst.bin", "old.bad-4096-bytes.bin"});
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(args->auxiliary.value_or(""), "old.bad-4096-bytes.bin");
    EXPECT_EQ(args->block_size.value_or(0), 65536u);
    EXPECT_EQ(args->max_retries.value_or(0), 3);
    EXPECT_EQ(args->retry_delay_ms.value_or(0), 100u);
    EXPECT_EQ(args->range_offset.value_or(1), 0u);
    EXPECT_EQ(args->range_length.value_or(0), 1024u);
    EXPECT_TRUE(args->overwrite);
    EXPECT_TRUE(args->delete_source);
    EXPECT_FALSE(args->progress);
    EXPECT_TRUE(args->quiet);
    EXPECT_EQ(args->log_level.value_or(""), "debug");
}

TEST(ArgsParserTest, MissingDestinationIsUsageError)
{
    ap::ParseExit exit{};
    EXPECT_FALSE(parse({"src.bin"}, &exit).has_value());
    EXPECT_EQ(exit.exit_code, rescuecp::infra::exit_code::Precondition);
}

TEST(ArgsParserTest, UnknownLogLevelIsRejected)
{
    ap::ParseExit exit{};
    EXPECT_FALSE(parse({"--log-level", "loud", "a", "b"}, &exit).has_value());
    EXPECT_EQ(exit.exit_code, rescuecp::infra::exit_code::Precondition);
}

TEST(ArgsParserTest, NonNumericBlockSizeIsRejected)
{
    ap::ParseExit exit{};
    EXPECT_FALSE(parse({"-b", "big", "a", "b"}, &exit).has_value());
    EXPECT_EQ(exit.exit_code, rescuecp::infra::exit_code::Precondition);
}

TEST(ArgsParserTest, HelpAndVersionExitCleanly)
{
    ap::ParseExit help{.exit_code = -1};
    EXPECT_FALSE(parse({"--help"}, &help).has_value());
    EXPECT_EQ(help.exit_code, 0);

    ap::ParseExit version{.exit_code = -1};
    EXPECT_FALSE(parse({"--version"}, &version).has_value());
    EXPECT_EQ(version.exit_code, 0);
}
