#include "cadence/sha256.h"
#include <gtest/gtest.h>

using cadence::crypto::SHA256;

TEST(Sha256Test, EmptyInput)
{
    EXPECT_EQ(SHA256::hash(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Sha256Test, Abc)
{
    EXPECT_EQ(SHA256::hash("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Sha256Test, TwoBlockMessage)
{
    EXPECT_EQ(SHA256::hash("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(Sha256Test, IncrementalMatchesOneShot)
{
    SHA256 sha;
    sha.update("ab");
    sha.update("c", 1);
    EXPECT_EQ(sha.final(), SHA256::hash("abc"));
}

TEST(Sha256Test, FinalResetsState)
{
    SHA256 sha;
    sha.update("something else");
    sha.final();
    sha.update("abc");
    EXPECT_EQ(sha.final(), SHA256::hash("abc"));
}
