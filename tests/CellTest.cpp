#include <gtest/gtest.h>

#include "Cell.hpp"

using namespace mazegraph;

TEST(CellTest, StartsEmpty)
{
    const Cell cell;
    EXPECT_EQ(cell.getBits(), 0);
    for (const auto direction : DIRECTIONS)
    {
        EXPECT_FALSE(cell.hasWall(direction));
        EXPECT_FALSE(cell.isChecked(direction));
    }
}

TEST(CellTest, FlagsAreIndependent)
{
    for (const auto direction : DIRECTIONS)
    {
        Cell cell;
        cell.setWall(direction, true);
        for (const auto other : DIRECTIONS)
        {
            EXPECT_EQ(cell.hasWall(other), other == direction);
            EXPECT_FALSE(cell.isChecked(other));
        }

        cell.setChecked(direction, true);
        cell.setWall(direction, false);
        EXPECT_FALSE(cell.hasWall(direction));
        EXPECT_TRUE(cell.isChecked(direction));
    }
}

TEST(CellTest, PacksIntoOneByte)
{
    Cell cell;
    cell.setWall(Direction::EAST, true);
    EXPECT_EQ(cell.getBits(), 0x02);

    cell.setChecked(Direction::WEST, true);
    EXPECT_EQ(cell.getBits(), 0x82);

    const Cell copy{cell.getBits()};
    EXPECT_EQ(copy, cell);
    EXPECT_TRUE(copy.hasWall(Direction::EAST));
    EXPECT_TRUE(copy.isChecked(Direction::WEST));
}
