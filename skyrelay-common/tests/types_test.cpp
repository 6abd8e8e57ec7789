#include "skyrelay/common/types.h"

#include <gtest/gtest.h>

#include <sstream>

namespace skyrelay {

TEST(TypesTest, ParseRegionTag) {
    auto parts = ParseRegionTag("aws:us-east-1");
    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ(parts->provider, "aws");
    EXPECT_EQ(parts->region, "us-east-1");

    // Only the first delimiter splits.
    parts = ParseRegionTag("gcp:us-central1:a");
    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ(parts->provider, "gcp");
    EXPECT_EQ(parts->region, "us-central1:a");
}

TEST(TypesTest, ParseRegionTagRejectsMalformed) {
    for (const auto& tag : {"", "aws", ":us-east-1", "aws:", "us-east-1"}) {
        auto parts = ParseRegionTag(tag);
        ASSERT_FALSE(parts.has_value()) << tag;
        EXPECT_EQ(parts.error(), ErrorCode::INVALID_REGION_TAG) << tag;
    }
}

TEST(TypesTest, MakeRegionTag) {
    EXPECT_EQ(MakeRegionTag("azure", "eastus"), "azure:eastus");
}

TEST(TypesTest, ErrorCodeToString) {
    EXPECT_EQ(toString(ErrorCode::PRECONDITION_VIOLATED),
              "PRECONDITION_VIOLATED");
    EXPECT_EQ(toString(ErrorCode::NOT_IMPLEMENTED), "NOT_IMPLEMENTED");
    EXPECT_EQ(toString(fromInt(12345)), "UNKNOWN_ERROR");
    EXPECT_EQ(toInt(ErrorCode::BUCKET_NOT_FOUND), -1200);

    std::ostringstream os;
    os << ErrorCode::OBJECT_NOT_FOUND;
    EXPECT_EQ(os.str(), "OBJECT_NOT_FOUND");
}

TEST(TypesTest, EndpointEquality) {
    ObjectStoreEndpoint a{"aws:us-east-1", "bucket-a"};
    ObjectStoreEndpoint b{"aws:us-east-1", "bucket-a"};
    ObjectStoreEndpoint c{"aws:us-west-2", "bucket-a"};
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);

    std::ostringstream os;
    os << c;
    EXPECT_EQ(os.str(), "aws:us-west-2/bucket-a");
}

}  // namespace skyrelay

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
