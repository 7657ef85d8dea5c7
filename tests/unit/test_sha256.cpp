#include <gtest/gtest.h>
#include "SHA256.h"
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace NetLink;
namespace fs = std::filesystem;

TEST(SHA256Test, StringHash) {
    EXPECT_EQ(SHA256::hash("hello"),
              "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");
    EXPECT_EQ(SHA256::hash(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256Test, BytesHash) {
    std::vector<uint8_t> data = {0x01, 0x02, 0x03};
    EXPECT_EQ(SHA256::hashBytes(data),
              "039058c6f2c0cb492c533b0a4d14ef77cc0f78abccced5287d84a1a2011cfb81");
}

TEST(SHA256Test, FileDigestMatchesStringDigest) {
    const fs::path file = fs::temp_directory_path() / "netlink_test_sha.bin";
    {
        std::ofstream out(file, std::ios::binary);
        out << "hello";
    }

    SHA256::Digest digest{};
    ASSERT_TRUE(SHA256::hashFile(file.string(), digest));
    EXPECT_EQ(SHA256::toHex(digest), SHA256::hash("hello"));

    fs::remove(file);
    EXPECT_FALSE(SHA256::hashFile(file.string(), digest));
}
