#include "remote/not_found_classifier.hpp"

#include <gtest/gtest.h>

namespace BuildCacheS3::Remote
{

TEST(NotFoundClassifierTest, NoSuchKeyIsNotFound)
{
    EXPECT_TRUE(IsObjectNotFound("NoSuchKey", "The specified key does not exist."));
    EXPECT_TRUE(IsObjectNotFound("NoSuchKey", ""));
}

TEST(NotFoundClassifierTest, AccessDeniedCountsAsNotFound)
{
    // Buckets without ListBucket permission answer AccessDenied for absent keys.
    EXPECT_TRUE(IsObjectNotFound("AccessDenied", "Access Denied"));
}

TEST(NotFoundClassifierTest, SignatureProblemsAreRealErrors)
{
    EXPECT_FALSE(IsObjectNotFound(
        "AccessDenied", "SignatureDoesNotMatch: The request signature we calculated does not match"
    ));
}

TEST(NotFoundClassifierTest, OtherCodesAreErrors)
{
    EXPECT_FALSE(IsObjectNotFound("InternalError", "We encountered an internal error."));
    EXPECT_FALSE(IsObjectNotFound("NoSuchBucket", "The specified bucket does not exist"));
    EXPECT_FALSE(IsObjectNotFound("", ""));
}

}  // namespace BuildCacheS3::Remote
