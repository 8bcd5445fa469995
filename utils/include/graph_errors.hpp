#ifndef HOPGRAPH_GRAPH_ERRORS_HPP
#define HOPGRAPH_GRAPH_ERRORS_HPP

#include <stdexcept>
#include <string>


namespace hopgraph {


/// @brief Coordinate list that is neither a scalar, a pair nor a triple
class InvalidKeyShape : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};


/// @brief A key would need a dense id the graph cannot address.
/// Raised when the store was sized too small, never recovered from internally.
class CapacityExceeded : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};


/// @brief run() called again without clear() in between
class StaleTraversalState : public std::logic_error {
public:
    using std::logic_error::logic_error;
};


}  // namespace hopgraph


#endif  // HOPGRAPH_GRAPH_ERRORS_HPP
