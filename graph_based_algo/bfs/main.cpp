#include <bfs.hpp>
#include <graph.hpp>

#include <Eigen/Dense>

#include <iomanip>


using namespace hopgraph;


Eigen::MatrixXi example_maze() {
    // S . . # . .
    // # # . # . #
    // . . . . . .
    // . # # # # .
    // . . . # G .

    Eigen::MatrixXi maze(5, 6);
    maze << 0, 0, 0, 1, 0, 0,
            1, 1, 0, 1, 0, 1,
            0, 0, 0, 0, 0, 0,
            0, 1, 1, 1, 1, 0,
            0, 0, 0, 1, 0, 0;

    return maze;
}


/// @brief 4-connected grid graph over the free cells (0) of an occupancy map
Graph grid_graph(const Eigen::MatrixXi& occupancy) {
    Graph graph{static_cast<std::size_t>(occupancy.size()), false};

    for (int r = 0; r < occupancy.rows(); ++r) {
        for (int c = 0; c < occupancy.cols(); ++c) {
            if (occupancy(r, c) != 0) continue;

            if (r + 1 < occupancy.rows() && occupancy(r + 1, c) == 0) {
                graph.add_edge({r, c}, {r + 1, c}, 1);
            }
            if (c + 1 < occupancy.cols() && occupancy(r, c + 1) == 0) {
                graph.add_edge({r, c}, {r, c + 1}, 1);
            }
        }
    }

    return graph;
}


int main() {
    const Eigen::MatrixXi maze = example_maze();
    Graph graph = grid_graph(maze);

    BreadthFirstSearch bfs(graph);

    const NodeKey start{0, 0};
    const NodeKey goal{4, 4};

    bfs.run(start);

    if (!bfs.is_visited(goal)) {
        std::cout << "No feasible path found" << std::endl;
        return 0;
    }

    std::cout << "Path found:" << std::endl;
    std::cout << "* hops = " << bfs.min_dist(goal) << std::endl;

    // Walls stay at -1
    Eigen::MatrixXi distance_field = Eigen::MatrixXi::Constant(maze.rows(), maze.cols(), -1);
    for (int r = 0; r < maze.rows(); ++r) {
        for (int c = 0; c < maze.cols(); ++c) {
            if (maze(r, c) == 0) {
                distance_field(r, c) = bfs.min_dist({r, c});
            }
        }
    }

    std::cout << "* distance field =" << std::endl;
    for (int r = 0; r < distance_field.rows(); ++r) {
        for (int c = 0; c < distance_field.cols(); ++c) {
            std::cout << std::setw(4) << distance_field(r, c);
        }
        std::cout << std::endl;
    }

    return 0;
}
