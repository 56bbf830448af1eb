#include <gtest/gtest.h>

#include "diagpack/crypto/sha256.hpp"
#include "testing.hpp"

#include <string>

namespace diagpack {
namespace {

TEST(Sha256Test, FileDigest) {
    testutil::TemporaryDirectory tmp;
    const std::string p = tmp.Path() + "/abc.txt";
    testutil::WriteTextFile(p, "abc");

    std::string hex;
    auto r = Sha256HexFile(p, hex);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(hex,
              "ba7816bf8f01cfea414140de5dae2223"
              "b00361a396177a9cb410ff61f20015ad");
}

TEST(Sha256Test, EmptyFileDigest) {
    testutil::TemporaryDirectory tmp;
    const std::string p = tmp.Path() + "/empty.zip";
    testutil::WriteTextFile(p, "");

    std::string hex;
    ASSERT_TRUE(Sha256HexFile(p, hex).ok);
    EXPECT_EQ(hex,
              "e3b0c44298fc1c149afbf4c8996fb924"
              "27ae41e4649b934ca495991b7852b855");
}

TEST(Sha256Test, SpansSeveralReadChunks) {
    testutil::TemporaryDirectory tmp;
    const std::string p = tmp.Path() + "/big.bin";
    testutil::WriteTextFile(p, std::string(200000, 'a'));

    std::string hex;
    ASSERT_TRUE(Sha256HexFile(p, hex).ok);
    EXPECT_EQ(hex.size(), 64u);
    EXPECT_EQ(hex.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(Sha256Test, MissingFileFails) {
    std::string hex;
    EXPECT_FALSE(Sha256HexFile("/nonexistent/diagpack.zip", hex).ok);
    EXPECT_TRUE(hex.empty());
}

} // namespace
} // namespace diagpack
