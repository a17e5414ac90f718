#include <gtest/gtest.h>

#include "snipbox/utils/hash_utils.hpp"

using snipbox::utils::HashUtils;

TEST(HashUtils, ComputeSHA256KnownVectors) {
    EXPECT_EQ("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
              HashUtils::ComputeSHA256(""));
    EXPECT_EQ("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
              HashUtils::ComputeSHA256("abc"));
}

TEST(HashUtils, FingerprintIsDigestPrefix) {
    EXPECT_EQ("ba7816bf8f01", HashUtils::Fingerprint("abc"));
    EXPECT_EQ("ba78", HashUtils::Fingerprint("abc", 4));
    EXPECT_NE(HashUtils::Fingerprint("result = 1"), HashUtils::Fingerprint("result = 2"));
}
