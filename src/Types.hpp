#ifndef TYPES_HPP
#define TYPES_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

#include <glm/glm.hpp>

#include "GridConfig.hpp"
#include "MazeError.hpp"

namespace mazegraph
{
    /// @brief Signed displacement between two cells, dx then dy
    using VectorXY = glm::ivec2;

    enum class Direction : unsigned int
    {
        NORTH = 0,
        EAST = 1,
        SOUTH = 2,
        WEST = 3
    };

    /// Canonical iteration order, also the order neighbors are reported in
    static constexpr std::array<Direction, 4> DIRECTIONS = {
        Direction::NORTH, Direction::EAST, Direction::SOUTH, Direction::WEST};

    [[nodiscard]] Direction inverted(Direction direction) noexcept;

    /// Unit vector for a direction, y grows towards north
    [[nodiscard]] VectorXY toVectorXY(Direction direction) noexcept;

    /// @brief Direction for a unit cardinal vector
    /// @throws MazeError INVALID_VECTOR for anything else
    [[nodiscard]] Direction toDirection(const VectorXY &vector);

    [[nodiscard]] std::optional<Direction> tryToDirection(const VectorXY &vector) noexcept;

    [[nodiscard]] char toChar(Direction direction) noexcept;

    /// @brief Position of the agent inside a cell
    enum class CellLocalLocation : unsigned int
    {
        CENTER = 0,
        NORTH = 1,
        EAST = 2,
        SOUTH = 3,
        WEST = 4
    };

    /// @throws MazeError INVALID_DIRECTION for CENTER, which has no side
    [[nodiscard]] Direction toDirection(CellLocalLocation location);

    /// @brief One axis of a cell coordinate, in [0, WIDTH - 1]
    /// @details Range is only validated when the library is built with MAZEGRAPH_DEBUG
    class Coord1D
    {
    public:
        Coord1D() = default;

        explicit Coord1D(int value)
            : mValue(static_cast<std::uint8_t>(value))
        {
            if constexpr (RANGE_CHECKS)
            {
                if (value < 0 || value >= static_cast<int>(WIDTH))
                {
                    throw MazeError(MazeError::Kind::OUT_OF_RANGE, "Coord1D");
                }
            }
        }

        [[nodiscard]] std::uint8_t getValue() const noexcept { return mValue; }

        friend bool operator==(const Coord1D &lhs, const Coord1D &rhs) noexcept { return lhs.mValue == rhs.mValue; }
        friend bool operator!=(const Coord1D &lhs, const Coord1D &rhs) noexcept { return lhs.mValue != rhs.mValue; }

    private:
        std::uint8_t mValue{0};
    };

    class CoordXY
    {
    public:
        CoordXY() = default;

        CoordXY(Coord1D x, Coord1D y) noexcept
            : mX(x), mY(y)
        {
        }

        CoordXY(int x, int y)
            : mX(x), mY(y)
        {
        }

        [[nodiscard]] Coord1D getX() const noexcept { return mX; }
        [[nodiscard]] Coord1D getY() const noexcept { return mY; }

        /// Row-major position of the cell, x + y * WIDTH
        [[nodiscard]] std::size_t toIndex() const noexcept
        {
            return static_cast<std::size_t>(mX.getValue()) + static_cast<std::size_t>(mY.getValue()) * WIDTH;
        }

        /// Adjacent cell in a direction, empty when it would leave the grid (always checked)
        [[nodiscard]] std::optional<CoordXY> neighbor(Direction direction) const noexcept;

        friend bool operator==(const CoordXY &lhs, const CoordXY &rhs) noexcept
        {
            return lhs.mX == rhs.mX && lhs.mY == rhs.mY;
        }

        friend bool operator!=(const CoordXY &lhs, const CoordXY &rhs) noexcept { return !(lhs == rhs); }

    private:
        Coord1D mX;
        Coord1D mY;
    };

    /// @brief Moves a coordinate by a displacement
    /// @throws MazeError OUT_OF_RANGE if the result leaves the grid, in every build
    [[nodiscard]] CoordXY operator+(const CoordXY &coord, const VectorXY &vector);

    /// Displacement that leads from rhs to lhs
    [[nodiscard]] VectorXY operator-(const CoordXY &lhs, const CoordXY &rhs) noexcept;

    /// @brief Physical pose of the agent correlated with a graph node
    struct AgentState
    {
        CoordXY location;
        CellLocalLocation localLocation{CellLocalLocation::CENTER};
        VectorXY headingVector{0, 0}; ///< Direction of arrival, zero when unknown

        friend bool operator==(const AgentState &lhs, const AgentState &rhs) noexcept
        {
            return lhs.location == rhs.location && lhs.localLocation == rhs.localLocation &&
                   lhs.headingVector == rhs.headingVector;
        }

        friend bool operator!=(const AgentState &lhs, const AgentState &rhs) noexcept { return !(lhs == rhs); }
    };
}

#endif // TYPES_HPP
