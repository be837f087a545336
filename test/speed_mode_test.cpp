#include "core/speed_mode.hpp"

#include <gtest/gtest.h>

using namespace usbspeed;

TEST(SpeedModeTest, LiteralsMatchControlCell)
{
    EXPECT_EQ(toLiteral(SpeedMode::High), 0);
    EXPECT_EQ(toLiteral(SpeedMode::Full), 1);
}

TEST(SpeedModeTest, FromLiteralAcceptsOnlyZeroAndOne)
{
    EXPECT_EQ(fromLiteral(0), SpeedMode::High);
    EXPECT_EQ(fromLiteral(1), SpeedMode::Full);
    EXPECT_FALSE(fromLiteral(2));
    EXPECT_FALSE(fromLiteral(-1));
}

TEST(SpeedModeTest, FromNameIsCaseSensitive)
{
    EXPECT_EQ(fromName("high"), SpeedMode::High);
    EXPECT_EQ(fromName("full"), SpeedMode::Full);
    EXPECT_FALSE(fromName("HIGH"));
    EXPECT_FALSE(fromName("low"));
    EXPECT_FALSE(fromName(""));
}

TEST(SpeedModeTest, NamesMatchCommandLine)
{
    EXPECT_STREQ(toName(SpeedMode::High), "high");
    EXPECT_STREQ(toName(SpeedMode::Full), "full");
}

TEST(SpeedModeTest, CellTextAcceptsSingleDigitLiteral)
{
    EXPECT_EQ(fromCellText("0"), SpeedMode::High);
    EXPECT_EQ(fromCellText("1"), SpeedMode::Full);
    EXPECT_FALSE(fromCellText("2"));
    EXPECT_FALSE(fromCellText("01"));
    EXPECT_FALSE(fromCellText(""));
    EXPECT_FALSE(fromCellText("high"));
}
