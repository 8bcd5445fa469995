#include <identifier_index.hpp>

#include <iostream>
#include <sstream>


namespace hopgraph {


IdentifierIndex::IdentifierIndex(std::size_t limit) : limit_(limit) {}


DenseId IdentifierIndex::resolve(const NodeKey& key) {
    const auto triple = key.normalized();

    auto it = ids_.find(triple);
    if (it != ids_.end()) {
        return it->second;
    }

    // Refuse before minting, so the mapping never holds an unaddressable id
    const DenseId next = ids_.size();
    if (next >= limit_) {
        std::ostringstream err;
        err << "Node " << key << " needs id " << next << " but capacity is " << limit_;
        std::cerr << err.str() << std::endl;
        throw CapacityExceeded(err.str());
    }

    ids_.emplace(triple, next);
    return next;
}


}  // namespace hopgraph
