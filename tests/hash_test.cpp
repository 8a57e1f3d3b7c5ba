#include "upload_guard/common/hash.hpp"
#include "test_fixtures.hpp"
#include <gtest/gtest.h>

using namespace upload_guard;

TEST(HashTest, KnownVectors) {
    EXPECT_EQ(*common::sha256Hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(*common::sha256Hex("hello world"),
              "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
    EXPECT_EQ(*common::sha256Hex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(HashTest, OneMebibyteFixtureIsStable) {
    std::string data(1048576, '\0');
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<char>(i % 251);
    }

    auto first = common::sha256Hex(data);
    auto second = common::sha256Hex(data);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, "631b84027d6b9e52b539c4e8373622d23032dfadc64d60af87339c9037e4f769");
    EXPECT_EQ(first, second);
}

TEST(HashTest, ToHexIsLowerCase) {
    const uint8_t raw[] = {0x00, 0x0f, 0xa0, 0xff};
    EXPECT_EQ(common::toHex(raw, sizeof(raw)), "000fa0ff");
}
