#include <gtest/gtest.h>

#include "Types.hpp"

using namespace mazegraph;

namespace
{
    constexpr int LAST = static_cast<int>(WIDTH) - 1;
}

TEST(Coord1DTest, HoldsValue)
{
    EXPECT_EQ(Coord1D{0}.getValue(), 0);
    EXPECT_EQ(Coord1D{LAST}.getValue(), LAST);
    EXPECT_EQ(Coord1D{3}, Coord1D{3});
    EXPECT_NE(Coord1D{3}, Coord1D{4});
}

TEST(Coord1DTest, RejectsOutOfRange)
{
    if constexpr (!RANGE_CHECKS)
    {
        GTEST_SKIP() << "range checks are compiled out";
    }

    try
    {
        Coord1D tooLarge{static_cast<int>(WIDTH)};
        FAIL() << "accepted " << static_cast<int>(tooLarge.getValue());
    }
    catch (const MazeError &e)
    {
        EXPECT_EQ(e.getKind(), MazeError::Kind::OUT_OF_RANGE);
    }

    EXPECT_THROW(Coord1D{-1}, MazeError);
    EXPECT_THROW((CoordXY{0, LAST + 1}), MazeError);
}

TEST(CoordXYTest, AddUnitVector)
{
    EXPECT_EQ(CoordXY(0, 0) + toVectorXY(Direction::NORTH), CoordXY(0, 1));
    EXPECT_EQ(CoordXY(0, 0) + toVectorXY(Direction::EAST), CoordXY(1, 0));
    EXPECT_EQ(CoordXY(2, 3) + VectorXY(3, -2), CoordXY(5, 1));
}

TEST(CoordXYTest, AddOverflowThrowsInEveryBuild)
{
    const auto expectOutOfRange = [](const CoordXY &coord, Direction direction)
    {
        try
        {
            static_cast<void>(coord + toVectorXY(direction));
            ADD_FAILURE() << "moving " << toChar(direction) << " did not fail";
        }
        catch (const MazeError &e)
        {
            EXPECT_EQ(e.getKind(), MazeError::Kind::OUT_OF_RANGE);
        }
    };

    expectOutOfRange(CoordXY{0, 0}, Direction::WEST);
    expectOutOfRange(CoordXY{0, 0}, Direction::SOUTH);
    expectOutOfRange(CoordXY{LAST, 0}, Direction::EAST);
    expectOutOfRange(CoordXY{0, LAST}, Direction::NORTH);
}

TEST(CoordXYTest, NeighborStopsAtBoundary)
{
    EXPECT_EQ(CoordXY(1, 1).neighbor(Direction::SOUTH), CoordXY(1, 0));
    EXPECT_EQ(CoordXY(1, 1).neighbor(Direction::WEST), CoordXY(0, 1));
    EXPECT_FALSE(CoordXY(0, 0).neighbor(Direction::WEST).has_value());
    EXPECT_FALSE(CoordXY(LAST, LAST).neighbor(Direction::NORTH).has_value());
    EXPECT_FALSE(CoordXY(LAST, LAST).neighbor(Direction::EAST).has_value());
}

TEST(CoordXYTest, SubtractGivesDisplacement)
{
    EXPECT_EQ(CoordXY(1, 0) - CoordXY(0, 0), VectorXY(1, 0));
    EXPECT_EQ(CoordXY(0, 1) - CoordXY(1, 0), VectorXY(-1, 1));
    EXPECT_EQ(CoordXY(0, 1) - CoordXY(LAST, 0), VectorXY(-LAST, 1));
    EXPECT_EQ(CoordXY(4, 4) - CoordXY(4, 4), VectorXY(0, 0));
}

TEST(DirectionTest, ToVectorXY)
{
    EXPECT_EQ(toVectorXY(Direction::NORTH), VectorXY(0, 1));
    EXPECT_EQ(toVectorXY(Direction::EAST), VectorXY(1, 0));
    EXPECT_EQ(toVectorXY(Direction::SOUTH), VectorXY(0, -1));
    EXPECT_EQ(toVectorXY(Direction::WEST), VectorXY(-1, 0));
}

TEST(DirectionTest, FromUnitVectorOnly)
{
    for (const auto direction : DIRECTIONS)
    {
        EXPECT_EQ(toDirection(toVectorXY(direction)), direction);
    }

    EXPECT_FALSE(tryToDirection(VectorXY(0, 0)).has_value());
    EXPECT_FALSE(tryToDirection(VectorXY(1, 1)).has_value());
    EXPECT_FALSE(tryToDirection(VectorXY(0, 2)).has_value());

    try
    {
        static_cast<void>(toDirection(VectorXY(-1, -1)));
        FAIL() << "diagonal accepted";
    }
    catch (const MazeError &e)
    {
        EXPECT_EQ(e.getKind(), MazeError::Kind::INVALID_VECTOR);
    }
}

TEST(DirectionTest, Inverted)
{
    EXPECT_EQ(inverted(Direction::NORTH), Direction::SOUTH);
    EXPECT_EQ(inverted(Direction::SOUTH), Direction::NORTH);
    EXPECT_EQ(inverted(Direction::EAST), Direction::WEST);
    EXPECT_EQ(inverted(Direction::WEST), Direction::EAST);
}

TEST(DirectionTest, FromCellLocalLocation)
{
    EXPECT_EQ(toDirection(CellLocalLocation::NORTH), Direction::NORTH);
    EXPECT_EQ(toDirection(CellLocalLocation::WEST), Direction::WEST);

    try
    {
        static_cast<void>(toDirection(CellLocalLocation::CENTER));
        FAIL() << "center accepted";
    }
    catch (const MazeError &e)
    {
        EXPECT_EQ(e.getKind(), MazeError::Kind::INVALID_DIRECTION);
    }
}
