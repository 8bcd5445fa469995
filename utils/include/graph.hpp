#ifndef HOPGRAPH_GRAPH_HPP
#define HOPGRAPH_GRAPH_HPP

#include <iostream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "identifier_index.hpp"
#include "node_key.hpp"


namespace hopgraph {


using Weight = int;


struct Edge {
    DenseId to{};
    Weight weight{};

    bool operator==(const Edge& rhs) const {
        return to == rhs.to && weight == rhs.weight;
    }
};


inline std::ostream& operator<<(std::ostream& os, const Edge& edge) {
    return os << "{to: " << edge.to << ", weight: " << edge.weight << "}";
}


using AdjList = std::vector<Edge>;


class Graph {
public:

    /// @brief Create a graph able to hold node_capacity distinct node keys
    /// @param node_capacity Upper bound on distinct keys ever resolved
    /// @param directed If false every edge is mirrored
    explicit Graph(std::size_t node_capacity, bool directed = true)
        : directed_(directed), adj_list_(node_capacity), index_(node_capacity) {
        if (node_capacity == 0) {
            throw std::invalid_argument("Cannot build a graph with 0 node capacity");
        }
        std::cout << "Graph initialization: capacity " << node_capacity
                  << (directed_ ? ", directed" : ", undirected") << std::endl;
    }

    /// @brief Graph dimension
    /// @return Number of adjacency lists, fixed at construction
    std::size_t capacity() const { return adj_list_.size(); }

    /// @brief Number of distinct node keys resolved so far
    std::size_t size() const { return index_.size(); }

    bool is_directed() const { return directed_; }

    /// @brief Append a weighted edge between two node keys.
    /// Both keys are resolved first; if either does not fit, nothing is appended.
    void add_edge(const NodeKey& from, const NodeKey& to, Weight weight = 0) {
        const DenseId u = index_.resolve(from);
        const DenseId v = index_.resolve(to);

        adj_list_[u].push_back(Edge{v, weight});
        if (!directed_) {
            adj_list_[v].push_back(Edge{u, weight});
        }
    }

    DenseId resolve(const NodeKey& key) { return index_.resolve(key); }

    const IdentifierIndex& index() const { return index_; }

    const AdjList& neighbors(const DenseId node) const {
        this->check_node(node);
        return adj_list_[node];
    }


protected:
    /// @brief Node existance validation
    /// @param node Node to validate
    void check_node(const DenseId node) const {
        if (node >= this->capacity()) {
            std::string err = "Node: " + std::to_string(node) + " out of range [0.." + std::to_string(capacity()-1) + "]";
            throw std::out_of_range(err);
        }
    }


private:
    bool directed_;
    std::vector<AdjList> adj_list_;
    IdentifierIndex index_;
};


}  // namespace hopgraph


#endif  // HOPGRAPH_GRAPH_HPP
