#include "Maze.hpp"

#include <stdexcept>

#include <SDL3/SDL_log.h>

#include "Log.hpp"

namespace mazegraph
{
    namespace
    {
        [[noreturn]] void failLoad(const std::string &message)
        {
            SDL_LogCritical(log::CATEGORY, "Maze::fromString - %s", message.c_str());
            throw std::runtime_error("Maze::fromString - " + message);
        }
    }

    Maze::Maze(const CoordXY &start, const CoordXY &goal)
        : mStart(start), mGoal(goal)
    {
        for (std::size_t i = 0; i < WIDTH; ++i)
        {
            mCells[i].setWall(Direction::SOUTH, true);
            mCells[i + WIDTH * (WIDTH - 1)].setWall(Direction::NORTH, true);
            mCells[i * WIDTH].setWall(Direction::WEST, true);
            mCells[WIDTH - 1 + i * WIDTH].setWall(Direction::EAST, true);
        }
    }

    std::optional<std::size_t> Maze::inferWidth(std::size_t textLength) noexcept
    {
        for (const auto width : TEXT_WIDTHS)
        {
            if (textLength == (4 * width + 2) * (2 * width + 1))
            {
                return width;
            }
        }
        return std::nullopt;
    }

    Maze Maze::fromString(std::string_view mazeStr, const LoadOptions &options)
    {
        if (const auto priority = options.getLogPriority(); priority.has_value())
        {
            log::setPriority(*priority);
        }

        const auto inferred = inferWidth(mazeStr.size());
        if (!inferred.has_value())
        {
            failLoad("no supported width matches a text of " + std::to_string(mazeStr.size()) + " bytes");
        }

        const std::size_t width = *inferred;
        if (width > WIDTH)
        {
            failLoad("loaded data is too large: width " + std::to_string(width) + " exceeds " +
                     std::to_string(WIDTH));
        }

        SDL_LogDebug(log::CATEGORY, "Maze::fromString - width %d", static_cast<int>(width));

        Maze maze(options.getDefaultStart(), options.getDefaultGoal());

        const std::size_t lineLength = 4 * width + 1;
        std::size_t lineNo = 0;
        std::size_t pos = 0;

        while (pos < mazeStr.size())
        {
            const std::size_t end = mazeStr.find('\n', pos);
            if (end == std::string_view::npos)
            {
                failLoad("line " + std::to_string(lineNo) + " is not terminated");
            }

            const std::string_view line = mazeStr.substr(pos, end - pos);
            pos = end + 1;

            if (line.size() != lineLength)
            {
                failLoad("line " + std::to_string(lineNo) + " has " + std::to_string(line.size()) +
                         " characters, expected " + std::to_string(lineLength));
            }

            // Text runs top-down while y grows towards north
            const int y = static_cast<int>(width) - 1 - static_cast<int>(lineNo / 2);

            if (lineNo % 2 == 0)
            {
                for (std::size_t x = 0; x < width; ++x)
                {
                    if (line[2 + 4 * x] == '-')
                    {
                        maze.setCellState(CoordXY{static_cast<int>(x), y}, Direction::NORTH, true);
                    }
                }
            }
            else
            {
                for (std::size_t x = 0; x < width; ++x)
                {
                    const CoordXY coord{static_cast<int>(x), y};
                    if (line[4 * x] == '|')
                    {
                        maze.setCellState(coord, Direction::WEST, true);
                    }

                    const char mark = line[4 * x + 2];
                    if (mark == 'S')
                    {
                        maze.setStart(coord);
                        SDL_LogDebug(log::CATEGORY, "Maze::fromString - start at (%d, %d)", static_cast<int>(x), y);
                    }
                    else if (mark == 'G')
                    {
                        maze.setGoal(coord);
                        SDL_LogDebug(log::CATEGORY, "Maze::fromString - goal at (%d, %d)", static_cast<int>(x), y);
                    }

                    if (line[4 * x + 4] == '|')
                    {
                        maze.setCellState(coord, Direction::EAST, true);
                    }
                }

                if (y == 0)
                {
                    break;
                }
            }
            ++lineNo;
        }

        return maze;
    }

    std::string Maze::toString() const
    {
        std::string out;
        out.reserve((4 * WIDTH + 2) * (2 * WIDTH + 1));

        for (int y = static_cast<int>(WIDTH) - 1; y >= 0; --y)
        {
            for (std::size_t x = 0; x < WIDTH; ++x)
            {
                out += '+';
                out += getCell(CoordXY{static_cast<int>(x), y}).hasWall(Direction::NORTH) ? "---" : "   ";
            }
            out += "+\n";

            for (std::size_t x = 0; x < WIDTH; ++x)
            {
                const CoordXY coord{static_cast<int>(x), y};
                char mark = ' ';
                if (coord == mStart)
                {
                    mark = 'S';
                }
                else if (coord == mGoal)
                {
                    mark = 'G';
                }
                out += getCell(coord).hasWall(Direction::WEST) ? '|' : ' ';
                out += ' ';
                out += mark;
                out += ' ';
            }
            out += getCell(CoordXY{static_cast<int>(WIDTH) - 1, y}).hasWall(Direction::EAST) ? '|' : ' ';
            out += '\n';
        }

        for (std::size_t x = 0; x < WIDTH; ++x)
        {
            out += '+';
            out += getCell(CoordXY{static_cast<int>(x), 0}).hasWall(Direction::SOUTH) ? "---" : "   ";
        }
        out += "+\n";

        return out;
    }

    void Maze::setCellState(const CoordXY &coord, Direction direction, bool value)
    {
        const auto next = coord.neighbor(direction);

        if (!next.has_value())
        {
            if (value)
            {
                cellAt(coord).setWall(direction, true);
            }
            else
            {
                SDL_LogWarn(log::CATEGORY, "Maze::setCellState - boundary wall %c of (%d, %d) stays set",
                            toChar(direction), coord.getX().getValue(), coord.getY().getValue());
            }
            return;
        }

        cellAt(coord).setWall(direction, value);
        cellAt(*next).setWall(inverted(direction), value);
    }

    void Maze::setCellChecked(const CoordXY &coord, Direction direction, bool value) noexcept
    {
        cellAt(coord).setChecked(direction, value);
    }

    void Maze::clearChecked() noexcept
    {
        for (auto &cell : mCells)
        {
            for (const auto direction : DIRECTIONS)
            {
                cell.setChecked(direction, false);
            }
        }
    }

    std::ostream &operator<<(std::ostream &os, const Maze &maze)
    {
        return os << maze.toString();
    }
}
