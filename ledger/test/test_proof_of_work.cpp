#include "ProofOfWork.h"
#include <gtest/gtest.h>

TEST(ProofOfWorkTest, ZeroDifficultyAcceptsAnything) {
    EXPECT_TRUE(pc::meetsDifficulty("ffff", 0));
    EXPECT_TRUE(pc::meetsDifficulty("", 0));
}

TEST(ProofOfWorkTest, CountsLeadingZeros) {
    EXPECT_TRUE(pc::meetsDifficulty("00ab", 2));
    EXPECT_TRUE(pc::meetsDifficulty("000b", 2));
    EXPECT_FALSE(pc::meetsDifficulty("0a0b", 2));
    EXPECT_FALSE(pc::meetsDifficulty("a00b", 1));
}

TEST(ProofOfWorkTest, ShortHashNeverMeetsLargerDifficulty) {
    EXPECT_FALSE(pc::meetsDifficulty("00", 3));
    EXPECT_TRUE(pc::meetsDifficulty("000", 3));
}

TEST(ProofOfWorkTest, MaxDifficultyIsDigestLength) {
    EXPECT_EQ(pc::MAX_DIFFICULTY, 64u);
    EXPECT_TRUE(pc::meetsDifficulty(std::string(64, '0'), pc::MAX_DIFFICULTY));
}

TEST(ProofOfWorkTest, DefaultControlIsUnbounded) {
    pc::MiningControl control;
    EXPECT_EQ(control.cancelFlag, nullptr);
    EXPECT_EQ(control.maxAttempts, 0u);
    EXPECT_GT(control.checkInterval, 0u);
    EXPECT_FALSE(static_cast<bool>(control.onProgress));
}
