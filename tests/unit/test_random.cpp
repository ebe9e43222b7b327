#include <gtest/gtest.h>
#include "postrelay/crypto/random.hpp"
#include <array>
#include <cctype>
#include <set>

using namespace postrelay::crypto;

class SecureRandomTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(SecureRandom::initialize());
    }
};

TEST_F(SecureRandomTest, UuidIsVersionFour) {
    auto uuid = SecureRandom::generate_uuid();

    ASSERT_EQ(uuid.size(), 36u);
    EXPECT_EQ(uuid[8], '-');
    EXPECT_EQ(uuid[13], '-');
    EXPECT_EQ(uuid[18], '-');
    EXPECT_EQ(uuid[23], '-');
    EXPECT_EQ(uuid[14], '4');
    EXPECT_NE(std::string("89ab").find(uuid[19]), std::string::npos);
    for (char c : uuid) {
        EXPECT_TRUE(c == '-' || std::isxdigit(static_cast<unsigned char>(c)));
        EXPECT_FALSE(std::isupper(static_cast<unsigned char>(c)));
    }
}

TEST_F(SecureRandomTest, UuidsDoNotRepeat) {
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        seen.insert(SecureRandom::generate_uuid());
    }
    EXPECT_EQ(seen.size(), 1000u);
}

TEST_F(SecureRandomTest, HexLength) {
    EXPECT_EQ(SecureRandom::generate_hex(16).size(), 32u);
    EXPECT_TRUE(SecureRandom::generate_hex(0).empty());
}

TEST_F(SecureRandomTest, FillsBuffer) {
    std::array<std::uint8_t, 64> a{};
    std::array<std::uint8_t, 64> b{};
    SecureRandom::generate_bytes(a);
    SecureRandom::generate_bytes(b);
    EXPECT_NE(a, b);
}
