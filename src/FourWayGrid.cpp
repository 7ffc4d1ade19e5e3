#include "FourWayGrid.hpp"

#include <glm/glm.hpp>

namespace mazegraph
{
    FourWayGrid::FourWayGrid(const Maze &maze)
        : mMaze(maze)
    {
    }

    CoordXY FourWayGrid::coordXYByNodeIndex(Index index)
    {
        const int value = index.getValue();
        return CoordXY{value % static_cast<int>(WIDTH), value / static_cast<int>(WIDTH)};
    }

    FourWayGrid::Index FourWayGrid::nodeIndexByCoordXY(const CoordXY &coord)
    {
        return Index{static_cast<NodeIndexValue>(coord.toIndex())};
    }

    VectorXY FourWayGrid::vectorXYByNodeIndexPair(Index from, Index to)
    {
        return coordXYByNodeIndex(to) - coordXYByNodeIndex(from);
    }

    NodeIndexValue FourWayGrid::nodeIndexDiffByVectorXY(const VectorXY &vector) noexcept
    {
        return static_cast<NodeIndexValue>(vector.x + vector.y * static_cast<int>(WIDTH));
    }

    Cost FourWayGrid::distance(Index from, Index to)
    {
        return optimisticDistance(from, to);
    }

    Cost FourWayGrid::optimisticDistance(Index from, Index to)
    {
        const VectorXY delta = glm::abs(vectorXYByNodeIndexPair(from, to));
        return static_cast<Cost>(delta.x + delta.y);
    }

    AgentState FourWayGrid::agentStateByNodeIndex(Index index, std::optional<Index> fromIndex)
    {
        AgentState state;
        state.location = coordXYByNodeIndex(index);
        state.localLocation = CellLocalLocation::CENTER;
        if (fromIndex.has_value())
        {
            state.headingVector = vectorXYByNodeIndexPair(*fromIndex, index);
        }
        return state;
    }

    FourWayGrid::Index FourWayGrid::nodeIndexByAgentState(const AgentState &agentState)
    {
        if (agentState.localLocation != CellLocalLocation::CENTER)
        {
            throw MazeError(MazeError::Kind::INVALID_LOCATION, "four way grid only holds cell centers");
        }
        return nodeIndexByCoordXY(agentState.location);
    }

    std::optional<FourWayGrid::EdgeType> FourWayGrid::edgeImpl(Index from, Direction direction) const
    {
        const CoordXY coord = coordXYByNodeIndex(from);
        if (mMaze.getCell(coord).hasWall(direction))
        {
            return std::nullopt;
        }

        // Boundary cells are walled, this only guards a maze built around the invariant
        const auto next = coord.neighbor(direction);
        if (!next.has_value())
        {
            return std::nullopt;
        }

        return EdgeType{from, Index{static_cast<NodeIndexValue>(from.getValue() + nodeIndexDiffByVectorXY(toVectorXY(direction)))}};
    }

    std::optional<FourWayGrid::EdgeType> FourWayGrid::edge(Index from, Index to) const
    {
        const auto direction = tryToDirection(vectorXYByNodeIndexPair(from, to));
        if (!direction.has_value())
        {
            return std::nullopt;
        }
        return edgeImpl(from, *direction);
    }

    Neighbors<FourWayGrid> FourWayGrid::neighbors(Index from) const
    {
        Neighbors<FourWayGrid> result;
        for (const auto direction : DIRECTIONS)
        {
            if (auto found = edgeImpl(from, direction); found.has_value())
            {
                result.push_back(*found);
            }
        }
        return result;
    }
}
