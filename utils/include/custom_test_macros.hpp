#ifndef HOPGRAPH_CUSTOM_TEST_MACROS_HPP
#define HOPGRAPH_CUSTOM_TEST_MACROS_HPP
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <sstream>
#include <utility>
#include <vector>

#include "node_key.hpp"


using namespace ::testing;


// ====================
// Helper macros
// ====================
template <typename Search>
::testing::AssertionResult AssertDistances(
    Search& search,
    const std::vector<std::pair<hopgraph::NodeKey, int>>& expected)
{
    std::ostringstream oss;
    bool ok = true;

    for (const auto& [key, distance] : expected) {
        const int actual = search.min_dist(key);
        if (actual != distance) {
            ok = false;
            oss << "Node " << key << ": actual " << actual << ", expected " << distance << "\n";
        }
    }

    if (ok) {
        return ::testing::AssertionSuccess();
    }

    return ::testing::AssertionFailure() << oss.str();
}

// Variadic so brace lists with commas pass through the preprocessor
#define EXPECT_DISTANCES(search, ...) \
    EXPECT_TRUE(AssertDistances((search), __VA_ARGS__))

#define ASSERT_DISTANCES(search, ...) \
    ASSERT_TRUE(AssertDistances((search), __VA_ARGS__))


#endif // HOPGRAPH_CUSTOM_TEST_MACROS_HPP
