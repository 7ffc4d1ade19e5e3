#ifndef FOUR_WAY_GRID_HPP
#define FOUR_WAY_GRID_HPP

#include <optional>

#include "Cell.hpp"
#include "Graph.hpp"
#include "GridConfig.hpp"
#include "Maze.hpp"
#include "Types.hpp"

namespace mazegraph
{
    /// @brief Graph over the cell centers of a maze, moves go north, east, south or west
    /// @details Node index of cell (x, y) is x + y * WIDTH. Every move costs 1,
    /// so the Manhattan distance is both the exact and the optimistic distance.
    class FourWayGrid
    {
    public:
        static constexpr NodeIndexValue MAX_NODE_INDEX = static_cast<NodeIndexValue>(WIDTH * WIDTH - 1);

        using Index = NodeIndex<FourWayGrid>;
        using EdgeType = Edge<FourWayGrid>;

    public:
        explicit FourWayGrid(const Maze &maze);

        [[nodiscard]] const Maze &getMaze() const noexcept { return mMaze; }
        [[nodiscard]] Maze &getMaze() noexcept { return mMaze; }

        [[nodiscard]] static Cost distance(Index from, Index to);
        [[nodiscard]] static Cost optimisticDistance(Index from, Index to);

        [[nodiscard]] static AgentState agentStateByNodeIndex(Index index, std::optional<Index> fromIndex);

        /// @throws MazeError INVALID_LOCATION unless the agent sits at a cell center
        [[nodiscard]] static Index nodeIndexByAgentState(const AgentState &agentState);

        /// Edge towards an adjacent cell not separated by a wall
        [[nodiscard]] std::optional<EdgeType> edge(Index from, Index to) const;

        /// Open moves out of a cell in the order north, east, south, west
        [[nodiscard]] Neighbors<FourWayGrid> neighbors(Index from) const;

        // Index and coordinate mapping

        [[nodiscard]] static CoordXY coordXYByNodeIndex(Index index);
        [[nodiscard]] static Index nodeIndexByCoordXY(const CoordXY &coord);
        [[nodiscard]] static VectorXY vectorXYByNodeIndexPair(Index from, Index to);
        [[nodiscard]] static NodeIndexValue nodeIndexDiffByVectorXY(const VectorXY &vector) noexcept;

    private:
        [[nodiscard]] std::optional<EdgeType> edgeImpl(Index from, Direction direction) const;

    private:
        Maze mMaze;
    };

    static_assert(is_graph_v<FourWayGrid>, "FourWayGrid must satisfy the graph contract");
}

#endif // FOUR_WAY_GRID_HPP
