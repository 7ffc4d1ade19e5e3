#ifndef GRAPH_HPP
#define GRAPH_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include "FixedVector.hpp"
#include "GridConfig.hpp"
#include "MazeError.hpp"
#include "Types.hpp"

// Graph side of the maze: values an external search works with.
//
// A graph variant G is a class providing
//   static constexpr NodeIndexValue MAX_NODE_INDEX
//   static Cost distance(NodeIndex<G> from, NodeIndex<G> to)
//   static Cost optimisticDistance(NodeIndex<G> from, NodeIndex<G> to)   never above distance
//   static AgentState agentStateByNodeIndex(NodeIndex<G> index, std::optional<NodeIndex<G>> from)
//   static NodeIndex<G> nodeIndexByAgentState(const AgentState &state)    throws INVALID_LOCATION
//   std::optional<Edge<G>> edge(NodeIndex<G> from, NodeIndex<G> to) const
//   Neighbors<G> neighbors(NodeIndex<G> from) const
//
// G doubles as the tag of its node indices, so indices of two variants never mix.

namespace mazegraph
{
    using NodeIndexValue = std::int16_t;
    using Cost = std::int32_t;

    /// Room reserved for the moves of any variant, a four way grid fills at most 4
    static constexpr std::size_t MAX_NEIGHBORS = 8;

    template <typename Graph>
    class NodeIndex
    {
    public:
        NodeIndex() = default;

        /// @throws MazeError OUT_OF_RANGE outside [0, Graph::MAX_NODE_INDEX] when built with MAZEGRAPH_DEBUG
        explicit NodeIndex(NodeIndexValue value)
            : mValue(value)
        {
            if constexpr (RANGE_CHECKS)
            {
                if (value < 0 || value > Graph::MAX_NODE_INDEX)
                {
                    throw MazeError(MazeError::Kind::OUT_OF_RANGE, "NodeIndex " + std::to_string(value));
                }
            }
        }

        [[nodiscard]] NodeIndexValue getValue() const noexcept { return mValue; }

        /// Pose of the agent at this node, heading taken from the predecessor when given
        [[nodiscard]] AgentState toAgentState(std::optional<NodeIndex> from = std::nullopt) const
        {
            return Graph::agentStateByNodeIndex(*this, from);
        }

        // Only the value takes part in comparisons
        friend bool operator==(const NodeIndex &lhs, const NodeIndex &rhs) noexcept { return lhs.mValue == rhs.mValue; }
        friend bool operator!=(const NodeIndex &lhs, const NodeIndex &rhs) noexcept { return lhs.mValue != rhs.mValue; }
        friend bool operator<(const NodeIndex &lhs, const NodeIndex &rhs) noexcept { return lhs.mValue < rhs.mValue; }
        friend bool operator<=(const NodeIndex &lhs, const NodeIndex &rhs) noexcept { return lhs.mValue <= rhs.mValue; }
        friend bool operator>(const NodeIndex &lhs, const NodeIndex &rhs) noexcept { return lhs.mValue > rhs.mValue; }
        friend bool operator>=(const NodeIndex &lhs, const NodeIndex &rhs) noexcept { return lhs.mValue >= rhs.mValue; }

    private:
        NodeIndexValue mValue{0};
    };

    /// @brief Directed move between two nodes, cost fixed by Graph::distance on construction
    template <typename Graph>
    class Edge
    {
    public:
        Edge() = default;

        Edge(NodeIndex<Graph> from, NodeIndex<Graph> to)
            : mFrom(from), mTo(to), mCost(Graph::distance(from, to))
        {
        }

        [[nodiscard]] NodeIndex<Graph> getFrom() const noexcept { return mFrom; }
        [[nodiscard]] NodeIndex<Graph> getTo() const noexcept { return mTo; }
        [[nodiscard]] Cost getCost() const noexcept { return mCost; }

        [[nodiscard]] AgentState agentStateAtFrom() const { return mFrom.toAgentState(); }
        [[nodiscard]] AgentState agentStateAtTo() const { return mTo.toAgentState(mFrom); }

        friend bool operator==(const Edge &lhs, const Edge &rhs) noexcept
        {
            return lhs.mFrom == rhs.mFrom && lhs.mTo == rhs.mTo && lhs.mCost == rhs.mCost;
        }

        friend bool operator!=(const Edge &lhs, const Edge &rhs) noexcept { return !(lhs == rhs); }

    private:
        NodeIndex<Graph> mFrom;
        NodeIndex<Graph> mTo;
        Cost mCost{0};
    };

    template <typename Graph>
    using Neighbors = FixedVector<Edge<Graph>, MAX_NEIGHBORS>;

    /// @brief Chain of nodes joined edge by edge, with the sum of the edge costs
    template <typename Graph>
    class Route
    {
    public:
        using Nodes = FixedVector<NodeIndex<Graph>, static_cast<std::size_t>(Graph::MAX_NODE_INDEX) + 1>;

    public:
        Route() = default;

        explicit Route(NodeIndex<Graph> origin)
        {
            mNodes.push_back(origin);
        }

        /// @throws MazeError INVALID_ROUTE if the edge does not leave the last node or the route is full
        void append(const Edge<Graph> &edge)
        {
            if (mNodes.empty())
            {
                mNodes.push_back(edge.getFrom());
            }
            else if (mNodes.back() != edge.getFrom())
            {
                throw MazeError(MazeError::Kind::INVALID_ROUTE,
                                "edge starts at " + std::to_string(edge.getFrom().getValue()) +
                                    ", route ends at " + std::to_string(mNodes.back().getValue()));
            }

            if (mNodes.size() == Nodes::capacity())
            {
                throw MazeError(MazeError::Kind::INVALID_ROUTE, "route is full");
            }

            mNodes.push_back(edge.getTo());
            mCost += edge.getCost();
        }

        [[nodiscard]] const Nodes &getNodes() const noexcept { return mNodes; }
        [[nodiscard]] Cost getCost() const noexcept { return mCost; }

        friend bool operator==(const Route &lhs, const Route &rhs)
        {
            return lhs.mCost == rhs.mCost && lhs.mNodes == rhs.mNodes;
        }

        friend bool operator!=(const Route &lhs, const Route &rhs) { return !(lhs == rhs); }

    private:
        Nodes mNodes;
        Cost mCost{0};
    };

    template <typename Graph, typename = void>
    struct is_graph : std::false_type
    {
    };

    template <typename Graph>
    struct is_graph<Graph, std::void_t<
                               decltype(Graph::MAX_NODE_INDEX),
                               decltype(Graph::distance(std::declval<NodeIndex<Graph>>(), std::declval<NodeIndex<Graph>>())),
                               decltype(Graph::optimisticDistance(std::declval<NodeIndex<Graph>>(), std::declval<NodeIndex<Graph>>())),
                               decltype(Graph::agentStateByNodeIndex(std::declval<NodeIndex<Graph>>(),
                                                                     std::declval<std::optional<NodeIndex<Graph>>>())),
                               decltype(Graph::nodeIndexByAgentState(std::declval<const AgentState &>())),
                               decltype(std::declval<const Graph &>().edge(std::declval<NodeIndex<Graph>>(), std::declval<NodeIndex<Graph>>())),
                               decltype(std::declval<const Graph &>().neighbors(std::declval<NodeIndex<Graph>>()))>>
        : std::bool_constant<
              std::is_convertible_v<decltype(Graph::MAX_NODE_INDEX), NodeIndexValue> &&
              std::is_same_v<decltype(Graph::distance(std::declval<NodeIndex<Graph>>(), std::declval<NodeIndex<Graph>>())), Cost> &&
              std::is_same_v<decltype(Graph::optimisticDistance(std::declval<NodeIndex<Graph>>(), std::declval<NodeIndex<Graph>>())), Cost> &&
              std::is_same_v<decltype(Graph::nodeIndexByAgentState(std::declval<const AgentState &>())), NodeIndex<Graph>> &&
              std::is_same_v<decltype(std::declval<const Graph &>().edge(std::declval<NodeIndex<Graph>>(), std::declval<NodeIndex<Graph>>())),
                             std::optional<Edge<Graph>>> &&
              std::is_same_v<decltype(std::declval<const Graph &>().neighbors(std::declval<NodeIndex<Graph>>())), Neighbors<Graph>>>
    {
    };

    template <typename Graph>
    inline constexpr bool is_graph_v = is_graph<Graph>::value;
}

#endif // GRAPH_HPP
