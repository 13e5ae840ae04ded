#include <gtest/gtest.h>
#include "peerdrop/crypto/random.hpp"
#include <algorithm>
#include <cctype>
#include <set>

using namespace peerdrop::crypto;

class SecureRandomTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(SecureRandom::initialize());
    }
};

TEST_F(SecureRandomTest, GenerateBytes) {
    auto first = SecureRandom::generate_bytes(32);
    auto second = SecureRandom::generate_bytes(32);
    
    EXPECT_EQ(first.size(), 32u);
    EXPECT_NE(first, second);
    
    std::vector<std::uint8_t> empty;
    EXPECT_FALSE(SecureRandom::generate_bytes(std::span<std::uint8_t>(empty)).success());
}

TEST_F(SecureRandomTest, UuidFormat) {
    auto uuid = SecureRandom::generate_uuid();
    
    ASSERT_EQ(uuid.size(), 36u);
    EXPECT_EQ(uuid[8], '-');
    EXPECT_EQ(uuid[13], '-');
    EXPECT_EQ(uuid[18], '-');
    EXPECT_EQ(uuid[23], '-');
    EXPECT_EQ(uuid[14], '4');
    EXPECT_NE(std::string("89ab").find(uuid[19]), std::string::npos);
    
    auto hex = uuid;
    hex.erase(std::remove(hex.begin(), hex.end(), '-'), hex.end());
    EXPECT_TRUE(std::all_of(hex.begin(), hex.end(), [](unsigned char c) {
        return std::isxdigit(c) && !std::isupper(c);
    }));
}

TEST_F(SecureRandomTest, FileIdsFitChunkHeader) {
    EXPECT_EQ(SecureRandom::generate_file_id().size(), 36u);
}

TEST_F(SecureRandomTest, SessionIdsAreShortAndDistinct) {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        auto id = SecureRandom::generate_session_id();
        EXPECT_EQ(id.size(), 8u);
        ids.insert(id);
    }
    EXPECT_GT(ids.size(), 95u);
}
