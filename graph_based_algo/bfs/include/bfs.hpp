#ifndef HOPGRAPH_BFS_HPP
#define HOPGRAPH_BFS_HPP

#include <queue>
#include <vector>
#include <iostream>

#include "graph.hpp"


namespace hopgraph {


enum class TraversalState {
    Idle,
    Completed
};


/// @brief Single-source hop-count search over a Graph.
///
/// Keys passed to run(), min_dist() and is_visited() go through the graph's
/// own IdentifierIndex, so querying an unknown key mints an id for it (and can
/// throw CapacityExceeded when the graph is full). Edge weights are ignored.
///
/// The instance is reusable but every run() must start from the Idle state:
/// call clear() between sources.
class BreadthFirstSearch {
public:

    explicit BreadthFirstSearch(Graph& graph);

    ~BreadthFirstSearch() = default;

    /// @brief Forget the previous run: all nodes unvisited, all distances -1
    void clear();

    /// @brief Explore everything reachable from source
    /// @throws StaleTraversalState if the previous run was not cleared
    void run(const NodeKey& source);

    /// @brief Hop distance from the last source, -1 if not reached
    int min_dist(const NodeKey& target);

    bool is_visited(const NodeKey& target);

    TraversalState state() const { return state_; }

private:
    Graph& graph_;

    std::vector<bool> visited_{};
    std::vector<int> distance_{};

    TraversalState state_{TraversalState::Idle};
};


}  // namespace hopgraph


#endif  // HOPGRAPH_BFS_HPP
