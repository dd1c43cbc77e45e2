#include <gtest/gtest.h>

#include "infra/hash/xxhash_verifier.hpp"
#include "test_helpers.hpp"

using mtcopy::infra::XXHashVerifier;
using mtcopy::testing::TempDir;
using mtcopy::testing::make_content;
using mtcopy::testing::write_file;

TEST(XXHashVerifierTest, MatchesLibraryOneShotHash)
{
    TempDir tmp;
    const auto data = make_content(3 * 1024 * 1024 + 17, 7);
    write_file(tmp / "f", data);

    auto hash = XXHashVerifier::hash_file(tmp / "f");
    ASSERT_TRUE(hash);
    EXPECT_EQ(*hash, XXH64(data.data(), data.size(), 0));
}

TEST(XXHashVerifierTest, EqualFilesVerify)
{
    TempDir tmp;
    write_file(tmp / "a", "same content");
    write_file(tmp / "b", "same content");

    auto res = XXHashVerifier::verify_files(tmp / "a", tmp / "b");
    ASSERT_TRUE(res);
    EXPECT_TRUE(*res);
}

TEST(XXHashVerifierTest, DifferentFilesDoNotVerify)
{
    TempDir tmp;
    write_file(tmp / "a", "content A");
    write_file(tmp / "b", "content B");

    auto res = XXHashVerifier::verify_files(tmp / "a", tmp / "b");
    ASSERT_TRUE(res);
    EXPECT_FALSE(*res);
}

TEST(XXHashVerifierTest, MissingFileIsAnError)
{
    TempDir tmp;
    auto res = XXHashVerifier::hash_file(tmp / "missing");
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, mtcopy::infra::ErrorCode::NotFound);
}

TEST(XXHashVerifierTest, SizeMismatchSkipsHashing)
{
    TempDir tmp;
    write_file(tmp / "a", "short");
    write_file(tmp / "b", "much longer");

    auto res = XXHashVerifier::verify_files(tmp / "a", tmp / "b");
    ASSERT_TRUE(res);
    EXPECT_FALSE(*res);
}

TEST(XXHashVerifierTest, VerifyCopyReportsChecksumMismatch)
{
    TempDir tmp;
    write_file(tmp / "a", "aaaa");
    write_file(tmp / "b", "aaab");

    auto res = XXHashVerifier::verify_copy(tmp / "a", tmp / "b");
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, mtcopy::infra::ErrorCode::ChecksumMismatch);

    write_file(tmp / "c", "aaaa");
    EXPECT_TRUE(XXHashVerifier::verify_copy(tmp / "a", tmp / "c"));
}
