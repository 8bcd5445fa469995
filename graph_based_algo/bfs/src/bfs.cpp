#include <bfs.hpp>


namespace hopgraph {


BreadthFirstSearch::BreadthFirstSearch(Graph& graph) : graph_(graph) {
    std::cout << "BFS Algorithm initialization" << std::endl;
    this->clear();
    std::cout << "Loaded graph with capacity: " << graph_.capacity() << std::endl;
}


void BreadthFirstSearch::clear() {
    visited_.assign(graph_.capacity(), false);
    distance_.assign(graph_.capacity(), -1);
    state_ = TraversalState::Idle;
}


void BreadthFirstSearch::run(const NodeKey& source) {
    if (state_ != TraversalState::Idle) {
        std::cerr << "BFS from " << source << " requested without clear() after the previous run" << std::endl;
        throw StaleTraversalState("BreadthFirstSearch::run called without clear() after a previous run");
    }

    const DenseId start = graph_.resolve(source);

    std::queue<DenseId> graph_queue{};

    // Add start node
    visited_[start] = true;
    distance_[start] = 0;
    graph_queue.push(start);

    // Loop
    while (!graph_queue.empty()) {
        const auto current_node = graph_queue.front();
        graph_queue.pop();

        for (const auto& edge : graph_.neighbors(current_node)) {
            const auto next_node = edge.to;

            if (visited_[next_node]) continue;

            visited_[next_node] = true;
            distance_[next_node] = distance_[current_node] + 1;
            graph_queue.push(next_node);
        }
    }

    state_ = TraversalState::Completed;
}


int BreadthFirstSearch::min_dist(const NodeKey& target) {
    return distance_[graph_.resolve(target)];
}


bool BreadthFirstSearch::is_visited(const NodeKey& target) {
    return visited_[graph_.resolve(target)];
}


}  // namespace hopgraph
