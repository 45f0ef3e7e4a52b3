#include "RegisterFile.h"
#include <gtest/gtest.h>

static bool anyTagged(const RegisterFile &regs)
{
    for (int i = 0; i < regs.size(); ++i)
        if (regs.tag(i) != NO_TAG)
            return true;
    return false;
}

TEST(RegisterFileTest, StartsZeroAndReady)
{
    RegisterFile regs(8);
    EXPECT_EQ(regs.size(), 8);
    for (int i = 0; i < 8; ++i)
    {
        EXPECT_EQ(regs.read(i), 0);
        EXPECT_EQ(regs.tag(i), NO_TAG);
    }
    EXPECT_FALSE(anyTagged(regs));
}

TEST(RegisterFileTest, WritesWrapToSixteenBits)
{
    RegisterFile regs(8);
    regs.write(3, 0x12345);
    EXPECT_EQ(regs.read(3), 0x2345);
    regs.write(4, -1);
    EXPECT_EQ(regs.read(4), 0xFFFF);
}

TEST(RegisterFileTest, RegisterZeroIsHardWired)
{
    RegisterFile regs(8);
    regs.write(0, 99);
    regs.setTag(0, 3);
    EXPECT_EQ(regs.read(0), 0);
    EXPECT_EQ(regs.tag(0), NO_TAG);
}

TEST(RegisterFileTest, RegisterZeroWritableWhenNotReserved)
{
    RegisterFile regs(8, false);
    regs.write(0, 99);
    EXPECT_EQ(regs.read(0), 99);
}

TEST(RegisterFileTest, LastTagWins)
{
    RegisterFile regs(8);
    regs.setTag(2, 0);
    regs.setTag(2, 5);
    EXPECT_EQ(regs.tag(2), 5);
    EXPECT_TRUE(anyTagged(regs));
}

TEST(RegisterFileTest, ClearTagIfIgnoresOlderProducer)
{
    RegisterFile regs(8);
    regs.setTag(2, 0);
    regs.setTag(2, 5); // renamed by a younger issue

    EXPECT_FALSE(regs.clearTagIf(2, 0));
    EXPECT_EQ(regs.tag(2), 5);

    EXPECT_TRUE(regs.clearTagIf(2, 5));
    EXPECT_EQ(regs.tag(2), NO_TAG);
}

TEST(RegisterFileTest, ClearTagIgnoresOwner)
{
    RegisterFile regs(8);
    regs.setTag(3, 4);
    regs.clearTag(3);
    EXPECT_EQ(regs.tag(3), NO_TAG);
    regs.clearTag(42); // out of range, no effect
    EXPECT_FALSE(anyTagged(regs));
}

TEST(RegisterFileTest, ClearTagIfReleasesRegister)
{
    RegisterFile regs(8);
    regs.setTag(1, 1);
    regs.setTag(7, 2);
    EXPECT_TRUE(regs.clearTagIf(1, 1));
    EXPECT_EQ(regs.tag(1), NO_TAG);
    EXPECT_TRUE(anyTagged(regs));
    EXPECT_FALSE(regs.clearTagIf(7, NO_TAG));
    EXPECT_TRUE(regs.clearTagIf(7, 2));
    EXPECT_FALSE(anyTagged(regs));
}
