#include "Types.hpp"

#include <string>

namespace mazegraph
{
    namespace
    {
        bool inGrid(int x, int y) noexcept
        {
            return x >= 0 && y >= 0 && x < static_cast<int>(WIDTH) && y < static_cast<int>(WIDTH);
        }
    }

    Direction inverted(Direction direction) noexcept
    {
        switch (direction)
        {
        case Direction::NORTH:
            return Direction::SOUTH;
        case Direction::EAST:
            return Direction::WEST;
        case Direction::SOUTH:
            return Direction::NORTH;
        case Direction::WEST:
            return Direction::EAST;
        }
        return direction;
    }

    VectorXY toVectorXY(Direction direction) noexcept
    {
        switch (direction)
        {
        case Direction::NORTH:
            return {0, 1};
        case Direction::EAST:
            return {1, 0};
        case Direction::SOUTH:
            return {0, -1};
        case Direction::WEST:
            return {-1, 0};
        }
        return {0, 0};
    }

    std::optional<Direction> tryToDirection(const VectorXY &vector) noexcept
    {
        for (const auto direction : DIRECTIONS)
        {
            if (toVectorXY(direction) == vector)
            {
                return direction;
            }
        }
        return std::nullopt;
    }

    Direction toDirection(const VectorXY &vector)
    {
        if (auto direction = tryToDirection(vector); direction.has_value())
        {
            return *direction;
        }
        throw MazeError(MazeError::Kind::INVALID_VECTOR,
                        "(" + std::to_string(vector.x) + ", " + std::to_string(vector.y) + ")");
    }

    Direction toDirection(CellLocalLocation location)
    {
        switch (location)
        {
        case CellLocalLocation::NORTH:
            return Direction::NORTH;
        case CellLocalLocation::EAST:
            return Direction::EAST;
        case CellLocalLocation::SOUTH:
            return Direction::SOUTH;
        case CellLocalLocation::WEST:
            return Direction::WEST;
        case CellLocalLocation::CENTER:
            break;
        }
        throw MazeError(MazeError::Kind::INVALID_DIRECTION, "cell center has no side");
    }

    char toChar(Direction direction) noexcept
    {
        switch (direction)
        {
        case Direction::NORTH:
            return 'N';
        case Direction::EAST:
            return 'E';
        case Direction::SOUTH:
            return 'S';
        case Direction::WEST:
            return 'W';
        }
        return '?';
    }

    std::optional<CoordXY> CoordXY::neighbor(Direction direction) const noexcept
    {
        const VectorXY step = toVectorXY(direction);
        const int x = static_cast<int>(mX.getValue()) + step.x;
        const int y = static_cast<int>(mY.getValue()) + step.y;
        if (!inGrid(x, y))
        {
            return std::nullopt;
        }
        return CoordXY{x, y};
    }

    CoordXY operator+(const CoordXY &coord, const VectorXY &vector)
    {
        const int x = static_cast<int>(coord.getX().getValue()) + vector.x;
        const int y = static_cast<int>(coord.getY().getValue()) + vector.y;
        if (!inGrid(x, y))
        {
            throw MazeError(MazeError::Kind::OUT_OF_RANGE,
                            "(" + std::to_string(x) + ", " + std::to_string(y) + ")");
        }
        return CoordXY{x, y};
    }

    VectorXY operator-(const CoordXY &lhs, const CoordXY &rhs) noexcept
    {
        return {static_cast<int>(lhs.getX().getValue()) - static_cast<int>(rhs.getX().getValue()),
                static_cast<int>(lhs.getY().getValue()) - static_cast<int>(rhs.getY().getValue())};
    }
}
