#include <gtest/gtest.h>

#include <chrono>

#include "extensions/metadata.hpp"
#include "test_support.hpp"

namespace ext = rescuecp::extensions;
namespace fs = rescuecp::adapters::fs;
namespace ts = rescuecp::test_support;

TEST(MetadataTest, MarkedPathKeepsExtension)
{
    EXPECT_EQ(ext::marked_path("/out/photo.jpg", 8192).string(), "/out/photo.bad-8192-bytes.jpg");
    EXPECT_EQ(ext::marked_path("/out/disk", 512).string(), "/out/disk.bad-512-bytes");
    EXPECT_EQ(ext::marked_path("/out/archive.tar.gz", 100).string(), "/out/archive.tar.bad-100-bytes.gz");
}

TEST(MetadataTest, MarkerIsReplacedNotStacked)
{
    EXPECT_EQ(ext::marked_path("/out/photo.bad-8192-bytes.jpg", 4096).string(),
              "/out/photo.bad-4096-bytes.jpg");
}

TEST(MetadataTest, UnmarkedPathRestoresName)
{
    EXPECT_EQ(ext::unmarked_path("/out/photo.bad-8192-bytes.jpg").string(), "/out/photo.jpg");
    EXPECT_EQ(ext::unmarked_path("/out/disk.bad-512-bytes").string(), "/out/disk");
    EXPECT_EQ(ext::unmarked_path("/out/photo.jpg").string(), "/out/photo.jpg");
    EXPECT_EQ(ext::unmarked_path("/out/photo.bad-x-bytes.jpg").string(), "/out/photo.bad-x-bytes.jpg");
}

TEST(MetadataTest, CopiesTimestampsAndReadOnlyFlag)
{
    ts::TempDir dir;
    const auto src = dir / "src";
    const auto dst = dir / "dst";
    ts::write_file(src, ts::pattern_bytes(16));
    ts::write_file(dst, ts::pattern_bytes(16, 2));

    const auto stamp = std::filesystem::file_time_type::clock::now() - std::chrono::hours(24 * 30);
    std::filesystem::last_write_time(src, stamp);
    ASSERT_TRUE(fs::set_read_only(src, true).has_value());

    ASSERT_TRUE(ext::copy_metadata(src, dst).has_value());

    EXPECT_TRUE(std::filesystem::last_write_time(dst) == std::filesystem::last_write_time(src));
    auto read_only = fs::is_read_only(dst);
    ASSERT_TRUE(read_only.has_value());
    EXPECT_TRUE(*read_only);
}

TEST(MetadataTest, WritableSourceLeavesCopyWritable)
{
    ts::TempDir dir;
    const auto src = dir / "src";
    const auto dst = dir / "dst";
    ts::write_file(src, ts::pattern_bytes(16));
    ts::write_file(dst, ts::pattern_bytes(16, 2));
    ASSERT_TRUE(fs::set_read_only(dst, true).has_value());

    ASSERT_TRUE(ext::copy_metadata(src, dst).has_value());

    auto read_only = fs::is_read_only(dst);
    ASSERT_TRUE(read_only.has_value());
    EXPECT_FALSE(*read_only);
}

TEST(MetadataTest, MissingSourceIsReported)
{
    ts::TempDir dir;
    ts::write_file(dir / "dst", {});
    EXPECT_FALSE(ext::copy_metadata(dir / "absent", dir / "dst").has_value());
}
