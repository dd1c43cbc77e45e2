#include <gtest/gtest.h>

#include <chrono>
#include "extensions/metadata.hpp"
#include "test_helpers.hpp"

using mtcopy::testing::TempDir;
using mtcopy::testing::write_file;

namespace fs = std::filesystem;

TEST(MetadataTest, CopiesPermissionsAndMtime)
{
    TempDir tmp;
    write_file(tmp / "src", "x");
    write_file(tmp / "dst", "x");
    fs::permissions(tmp / "src", fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read);
    const auto stamp = fs::file_time_type::clock::now() - std::chrono::hours(48);
    fs::last_write_time(tmp / "src", stamp);

    ASSERT_TRUE(mtcopy::extensions::copy_metadata(tmp / "src", tmp / "dst"));

    EXPECT_EQ(fs::status(tmp / "dst").permissions(), fs::status(tmp / "src").permissions());
    EXPECT_EQ(fs::last_write_time(tmp / "dst"), fs::last_write_time(tmp / "src"));
}

TEST(MetadataTest, SymlinkTimesDoNotTouchTarget)
{
    TempDir tmp;
    write_file(tmp / "target", "t");
    fs::create_symlink("target", tmp / "src_link");
    fs::create_symlink("target", tmp / "dst_link");
    fs::last_write_time(tmp / "target", fs::file_time_type::clock::now() - std::chrono::hours(48));
    const auto target_mtime = fs::last_write_time(tmp / "target");

    ASSERT_TRUE(mtcopy::extensions::copy_metadata(tmp / "src_link", tmp / "dst_link"));
    EXPECT_EQ(fs::last_write_time(tmp / "target"), target_mtime);
}

TEST(MetadataTest, MissingSourceIsAnError)
{
    TempDir tmp;
    write_file(tmp / "dst", "x");

    auto res = mtcopy::extensions::copy_metadata(tmp / "missing", tmp / "dst");
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, mtcopy::infra::ErrorCode::NotFound);
}
