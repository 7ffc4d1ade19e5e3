#ifndef GRID_CONFIG_HPP
#define GRID_CONFIG_HPP

#include <cstddef>

// MAZEGRAPH_GRID_WIDTH and MAZEGRAPH_DEBUG come from the build files
#if !defined(MAZEGRAPH_GRID_WIDTH)
#error "Define MAZEGRAPH_GRID_WIDTH as one of 8, 16 or 32"
#endif

namespace mazegraph
{
    /// @brief Number of cells along one side of the maze, fixed for the whole build
    static constexpr std::size_t WIDTH = MAZEGRAPH_GRID_WIDTH;

    static_assert(WIDTH == 8 || WIDTH == 16 || WIDTH == 32, "Grid width must be 8, 16 or 32");

    static constexpr std::size_t CELL_COUNT = WIDTH * WIDTH;

#if defined(MAZEGRAPH_DEBUG)
    static constexpr bool RANGE_CHECKS = true;
#else
    static constexpr bool RANGE_CHECKS = false;
#endif
}

#endif // GRID_CONFIG_HPP
