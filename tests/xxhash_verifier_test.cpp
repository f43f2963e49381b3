#include <gtest/gtest.h>

#include "infra/hash/xxhash_verifier.hpp"
#include "test_utils.hpp"

using treecp::infra::ErrorCode;
using treecp::infra::XXHashVerifier;
using treecp::test::TempDir;
using treecp::test::write_file;

TEST(XXHashVerifierTest, EqualContentHashesEqual)
{
    TempDir tmp;
    write_file(tmp / "a", std::string(3 * 1024 * 1024 + 17, 'q'));
    write_file(tmp / "b", std::string(3 * 1024 * 1024 + 17, 'q'));

    auto a = XXHashVerifier::hash_file(tmp / "a");
    auto b = XXHashVerifier::hash_file(tmp / "b");
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*a, *b);
    EXPECT_TRUE(XXHashVerifier::verify_files(tmp / "a", tmp / "b").has_value());
}

TEST(XXHashVerifierTest, DifferentContentIsChecksumMismatch)
{
    TempDir tmp;
    write_file(tmp / "a", "alpha");
    write_file(tmp / "b", "alphb");

    auto res = XXHashVerifier::verify_files(tmp / "a", tmp / "b");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::ChecksumMismatch);
}

TEST(XXHashVerifierTest, MissingFileIsError)
{
    TempDir tmp;
    auto res = XXHashVerifier::hash_file(tmp / "missing");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::SourceOpenError);
}
