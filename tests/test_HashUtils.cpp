#include "TestTree.hpp"
#include "common/hash_utils.hpp"

class HashUtilsTest : public TestTree {
protected:
    std::string digestOf(const std::string& name, const std::string& content) {
        writeFile(scratch / name, content);
        auto digest = HashUtils::computeFileDigest((scratch / name).string());
        EXPECT_TRUE(digest.success) << digest.message;
        return digest.data;
    }
};

TEST_F(HashUtilsTest, KnownDigests) {
    EXPECT_EQ(digestOf("hello.txt", "hello"), "5d41402abc4b2a76b9719d911017c592");
    EXPECT_EQ(digestOf("empty", ""), "d41d8cd98f00b204e9800998ecf8427e");
}

TEST_F(HashUtilsTest, FileLargerThanReadBuffer) {
    std::string data(300 * 1024 + 17, '\0');
    for (size_t i = 0; i < data.size(); ++i) data[i] = static_cast<char>((i * 31) & 0xFF);

    std::string first = digestOf("big1.bin", data);
    EXPECT_EQ(first.size(), 32u);
    EXPECT_EQ(digestOf("big2.bin", data), first);

    // a change past the first read buffer must still show up
    data[data.size() - 1] ^= 0x01;
    EXPECT_NE(digestOf("big3.bin", data), first);
}

TEST_F(HashUtilsTest, MissingFileIsAnError) {
    auto missing = (scratch / "nope.txt").string();
    auto digest = HashUtils::computeFileDigest(missing);
    EXPECT_FALSE(digest.success);
    EXPECT_NE(digest.message.find(missing), std::string::npos);
    EXPECT_TRUE(digest.data.empty());
}

TEST_F(HashUtilsTest, ToHex) {
    const unsigned char bytes[] = {0x00, 0x0f, 0xa0, 0xff};
    EXPECT_EQ(HashUtils::toHex(bytes, sizeof(bytes)), "000fa0ff");
}
