#include "timebox/utils/hash_utils.hpp"

#include <gtest/gtest.h>

using timebox::utils::HashUtils;

TEST(HashUtilsTest, KnownDigests) {
    EXPECT_EQ(HashUtils::ComputeSHA256(std::string("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(HashUtils::ComputeSHA256(std::string()),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(HashUtilsTest, ShortDigest) {
    auto digest = HashUtils::ComputeSHA256(std::string("abc"));
    EXPECT_EQ(HashUtils::ShortDigest(digest), "ba7816bf8f01");
    EXPECT_EQ(HashUtils::ShortDigest(digest, 4), "ba78");
}
