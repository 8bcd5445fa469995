#ifndef HOPGRAPH_NODE_KEY_HPP
#define HOPGRAPH_NODE_KEY_HPP

#include <array>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

#include "graph_errors.hpp"


namespace hopgraph {


/// @brief Canonical form every node key reduces to before lookup
using NormalizedTriple = std::array<int, 3>;


struct Scalar {
    int x{};
};


struct Pair {
    int x{};
    int y{};
};


struct Triple {
    int x{};
    int y{};
    int z{};
};


/// @brief Caller-facing node identifier.
///
/// Holds one of Scalar, Pair or Triple. Missing coordinates are filled with
/// zeros when normalized, so Scalar(5), Pair(5, 0) and Triple(5, 0, 0) are the
/// same node. Equality and hashing only look at the normalized triple.
class NodeKey {
public:

    NodeKey(int x) : value_(Scalar{x}) {}

    NodeKey(int x, int y) : value_(Pair{x, y}) {}

    NodeKey(int x, int y, int z) : value_(Triple{x, y, z}) {}

    NodeKey(Scalar key) : value_(key) {}

    NodeKey(Pair key) : value_(key) {}

    NodeKey(Triple key) : value_(key) {}

    /// @brief Build a key from a runtime coordinate list
    /// @param coords 1, 2 or 3 coordinates
    /// @return Scalar, Pair or Triple key depending on coords.size()
    /// @throws InvalidKeyShape for any other size
    static NodeKey from_coords(const std::vector<int>& coords) {
        switch (coords.size()) {
            case 1:
                return NodeKey(coords[0]);
            case 2:
                return NodeKey(coords[0], coords[1]);
            case 3:
                return NodeKey(coords[0], coords[1], coords[2]);
            default:
                throw InvalidKeyShape("Node key must have 1, 2 or 3 coordinates, got " + std::to_string(coords.size()));
        }
    }

    NormalizedTriple normalized() const {
        if (const auto* s = std::get_if<Scalar>(&value_)) {
            return {s->x, 0, 0};
        }
        if (const auto* p = std::get_if<Pair>(&value_)) {
            return {p->x, p->y, 0};
        }
        const auto& t = std::get<Triple>(value_);
        return {t.x, t.y, t.z};
    }

    /// @brief Number of coordinates the key was built with (1, 2 or 3)
    std::size_t arity() const { return value_.index() + 1; }

    bool operator==(const NodeKey& rhs) const { return normalized() == rhs.normalized(); }

    bool operator!=(const NodeKey& rhs) const { return !(*this == rhs); }

private:
    std::variant<Scalar, Pair, Triple> value_;
};


struct TripleHash {
    std::size_t operator()(const NormalizedTriple& triple) const noexcept {
        std::size_t seed = 0;
        for (const int coord : triple) {
            seed ^= std::hash<int>{}(coord) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        }
        return seed;
    }
};


inline std::ostream& operator<<(std::ostream& os, const NodeKey& key) {
    const auto t = key.normalized();
    return os << "(" << t[0] << ", " << t[1] << ", " << t[2] << ")";
}


}  // namespace hopgraph


namespace std {

template <>
struct hash<hopgraph::NodeKey> {
    std::size_t operator()(const hopgraph::NodeKey& key) const noexcept {
        return hopgraph::TripleHash{}(key.normalized());
    }
};

}  // namespace std


#endif  // HOPGRAPH_NODE_KEY_HPP
