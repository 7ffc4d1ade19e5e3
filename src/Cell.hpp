#ifndef CELL_HPP
#define CELL_HPP

#include <cstdint>

#include "Types.hpp"

namespace mazegraph
{
    /// @brief One maze square packed in a byte
    /// @details Bits 0-3 hold the wall flags (north, east, south, west),
    /// bits 4-7 hold the checked flags in the same order.
    /// The checked flags are scratch state for a search running over the maze.
    class Cell
    {
    public:
        Cell() = default;

        explicit Cell(std::uint8_t bits) noexcept
            : mBits(bits)
        {
        }

        [[nodiscard]] bool hasWall(Direction direction) const noexcept { return (mBits & wallMask(direction)) != 0; }

        void setWall(Direction direction, bool value) noexcept { assign(wallMask(direction), value); }

        [[nodiscard]] bool isChecked(Direction direction) const noexcept { return (mBits & checkMask(direction)) != 0; }

        void setChecked(Direction direction, bool value) noexcept { assign(checkMask(direction), value); }

        [[nodiscard]] std::uint8_t getBits() const noexcept { return mBits; }

        friend bool operator==(const Cell &lhs, const Cell &rhs) noexcept { return lhs.mBits == rhs.mBits; }
        friend bool operator!=(const Cell &lhs, const Cell &rhs) noexcept { return lhs.mBits != rhs.mBits; }

    private:
        static constexpr std::uint8_t wallMask(Direction direction) noexcept
        {
            return static_cast<std::uint8_t>(1u << static_cast<unsigned int>(direction));
        }

        static constexpr std::uint8_t checkMask(Direction direction) noexcept
        {
            return static_cast<std::uint8_t>(1u << (static_cast<unsigned int>(direction) + 4u));
        }

        void assign(std::uint8_t mask, bool value) noexcept
        {
            mBits = value ? static_cast<std::uint8_t>(mBits | mask) : static_cast<std::uint8_t>(mBits & ~mask);
        }

    private:
        std::uint8_t mBits{0};
    };

    static_assert(sizeof(Cell) == 1, "Cell must stay packed in a single byte");
}

#endif // CELL_HPP
