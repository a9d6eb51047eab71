#pragma once

#include <cstddef>
#include <limits>
#include <vector>

using WeightMatrix = std::vector<std::vector<double>>;

/**
 * Minimum spanning tree capability over a dense weighted adjacency.
 * Entry [i][j] is the weight of edge i-j; zero or non-finite entries are not
 * edges and the diagonal is ignored. The graph is treated as undirected: when
 * both [i][j] and [j][i] exist, whichever is lighter competes for the edge.
 */
class SpanningTreeSolver {
public:
    virtual ~SpanningTreeSolver() = default;

    /**
     * @brief Computes a minimum spanning forest.
     * @pre adjacency is square.
     * @post Result has the shape of adjacency; a chosen edge keeps the weight
     *       and position of the entry it was taken from, everything else is 0.
     * @throws AcMap::PreconditionException when adjacency is not square.
     */
    virtual WeightMatrix solve(const WeightMatrix& adjacency) const = 0;
};

class KruskalSpanningTree final : public SpanningTreeSolver {
public:
    WeightMatrix solve(const WeightMatrix& adjacency) const override;
};

namespace SpanningTree {

constexpr size_t kUnreachable = std::numeric_limits<size_t>::max();

size_t edgeCount(const WeightMatrix& tree);

// Undirected neighbour lists, ascending.
std::vector<std::vector<size_t>> neighbours(const WeightMatrix& tree);

/**
 * @brief Hop distances between every pair of nodes along tree edges.
 * @post [i][i] == 0; pairs in different components are kUnreachable.
 */
std::vector<std::vector<size_t>> hopDistances(const WeightMatrix& tree);

} // namespace SpanningTree
