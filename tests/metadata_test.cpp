#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "extensions/metadata.hpp"
#include "test_helpers.hpp"

using dircopy::test::write_file;

class MetadataTest : public dircopy::test::TempDirTest {};

TEST_F(MetadataTest, CopiesMtimeAndPermissions)
{
    const auto src = root_ / "src.txt";
    const auto dst = root_ / "dst.txt";
    write_file(src, "data");
    write_file(dst, "data");

    const auto mtime = std::filesystem::last_write_time(src) - std::chrono::hours(48);
    std::filesystem::last_write_time(src, mtime);
    std::filesystem::permissions(src, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write |
                                      std::filesystem::perms::group_read);

    const auto res = dircopy::extensions::copy_metadata(src, dst);
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(std::filesystem::last_write_time(dst), mtime);
    EXPECT_EQ(std::filesystem::status(dst).permissions(), std::filesystem::status(src).permissions());
}

TEST_F(MetadataTest, MissingDestinationReportsBothFailures)
{
    write_file(root_ / "src.txt", "data");
    const auto res = dircopy::extensions::copy_metadata(root_ / "src.txt", root_ / "missing.txt");
    ASSERT_FALSE(res.has_value());
    EXPECT_NE(res.error().message.find("Metadata copy failed for"), std::string::npos);
    EXPECT_NE(res.error().message.find("mtime"), std::string::npos);
    EXPECT_NE(res.error().message.find("permissions"), std::string::npos);
}
