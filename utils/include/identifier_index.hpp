#ifndef HOPGRAPH_IDENTIFIER_INDEX_HPP
#define HOPGRAPH_IDENTIFIER_INDEX_HPP

#include <cstddef>
#include <limits>
#include <unordered_map>

#include "node_key.hpp"


namespace hopgraph {


using DenseId = std::size_t;


/// @brief Insert-or-get mapping from node keys to dense ids.
///
/// Ids are handed out contiguously from 0 in first-seen order and never
/// reassigned. An optional limit bounds how many ids may be minted.
class IdentifierIndex {
public:

    explicit IdentifierIndex(std::size_t limit = std::numeric_limits<std::size_t>::max());

    /// @brief Dense id of key, minting the next one if the key is new
    /// @throws CapacityExceeded if a new id would reach the limit
    DenseId resolve(const NodeKey& key);

    /// @brief Next id to be handed out
    std::size_t size() const { return ids_.size(); }

    std::size_t limit() const { return limit_; }

private:
    std::size_t limit_;
    std::unordered_map<NormalizedTriple, DenseId, TripleHash> ids_;
};


}  // namespace hopgraph


#endif  // HOPGRAPH_IDENTIFIER_INDEX_HPP
