#ifndef MAZE_HPP
#define MAZE_HPP

#include <array>
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "Cell.hpp"
#include "GridConfig.hpp"
#include "LoadOptions.hpp"
#include "Types.hpp"

namespace mazegraph
{
    /// @brief Fixed size WIDTH x WIDTH grid of cells plus start and goal
    /// @details The outer boundary is always walled and a wall between two cells
    /// is recorded identically on both sides. Both invariants are kept by setCellState,
    /// which is the only way to change a wall once the maze exists.
    class Maze
    {
    public:
        using Cells = std::array<Cell, CELL_COUNT>;

        /// Candidate widths of the text format, tried in this order
        static constexpr std::array<std::size_t, 5> TEXT_WIDTHS = {32, 16, 9, 8, 4};

    public:
        Maze(const CoordXY &start, const CoordXY &goal);

        /// @brief Parses the text format
        /// @param mazeStr Whole maze text, trailing newline included
        /// @param options Defaults for start and goal, log verbosity
        /// @throws std::runtime_error when the text does not describe a maze of a supported width
        static Maze fromString(std::string_view mazeStr, const LoadOptions &options = LoadOptions{});

        /// @brief Width of the text format whose total length is exactly textLength
        [[nodiscard]] static std::optional<std::size_t> inferWidth(std::size_t textLength) noexcept;

        /// Renders the whole grid in the text format read by fromString
        [[nodiscard]] std::string toString() const;

        [[nodiscard]] const Cell &getCell(const CoordXY &coord) const noexcept { return mCells[coord.toIndex()]; }
        [[nodiscard]] const Cells &getCells() const noexcept { return mCells; }

        /// @brief Sets or clears the wall on one side of a cell and the mirrored wall of its neighbor
        /// @details Clearing an outward facing boundary wall is refused
        void setCellState(const CoordXY &coord, Direction direction, bool value);

        void setCellChecked(const CoordXY &coord, Direction direction, bool value) noexcept;

        /// Resets every checked flag, walls are left alone
        void clearChecked() noexcept;

        [[nodiscard]] CoordXY getStart() const noexcept { return mStart; }
        void setStart(const CoordXY &start) noexcept { mStart = start; }

        [[nodiscard]] CoordXY getGoal() const noexcept { return mGoal; }
        void setGoal(const CoordXY &goal) noexcept { mGoal = goal; }

    private:
        Cell &cellAt(const CoordXY &coord) noexcept { return mCells[coord.toIndex()]; }

    private:
        Cells mCells{};
        CoordXY mStart;
        CoordXY mGoal;
    };

    std::ostream &operator<<(std::ostream &os, const Maze &maze);
}

#endif // MAZE_HPP
