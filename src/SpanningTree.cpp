#include "SpanningTree.h"
#include "AcMapExceptions.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <queue>
#include <string>

namespace {
struct WeightedEdge {
    double weight;
    size_t from;
    size_t to;
};

class DisjointSet {
public:
    explicit DisjointSet(size_t n) : parent_(n), rank_(n, 0) {
        std::iota(parent_.begin(), parent_.end(), size_t{0});
    }

    size_t find(size_t x) {
        while (parent_[x] != x) {
            parent_[x] = parent_[parent_[x]];
            x = parent_[x];
        }
        return x;
    }

    bool unite(size_t a, size_t b) {
        a = find(a);
        b = find(b);
        if (a == b) return false;
        if (rank_[a] < rank_[b]) std::swap(a, b);
        parent_[b] = a;
        if (rank_[a] == rank_[b]) ++rank_[a];
        return true;
    }

private:
    std::vector<size_t> parent_;
    std::vector<unsigned> rank_;
};

void requireSquare(const WeightMatrix& m) {
    for (size_t i = 0; i < m.size(); ++i) {
        if (m[i].size() != m.size()) {
            throw AcMap::PreconditionException("Adjacency matrix must be square: row " + std::to_string(i) +
                                               " has " + std::to_string(m[i].size()) + " entries, expected " +
                                               std::to_string(m.size()));
        }
    }
}
} // namespace

WeightMatrix KruskalSpanningTree::solve(const WeightMatrix& adjacency) const {
    requireSquare(adjacency);
    const size_t n = adjacency.size();

    std::vector<WeightedEdge> edges;
    edges.reserve(n * (n > 0 ? n - 1 : 0));
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) {
            const double w = adjacency[i][j];
            if (i == j || w == 0.0 || !std::isfinite(w)) continue;
            edges.push_back({w, i, j});
        }
    }

    // Ties resolve in row-major order of the source entry.
    std::stable_sort(edges.begin(), edges.end(), [](const WeightedEdge& a, const WeightedEdge& b) {
        return a.weight < b.weight;
    });

    WeightMatrix tree(n, std::vector<double>(n, 0.0));
    DisjointSet components(n);
    size_t accepted = 0;
    for (const auto& e : edges) {
        if (accepted + 1 >= n) break;
        if (components.unite(e.from, e.to)) {
            tree[e.from][e.to] = e.weight;
            ++accepted;
        }
    }
    return tree;
}

namespace SpanningTree {

size_t edgeCount(const WeightMatrix& tree) {
    size_t count = 0;
    for (const auto& row : tree) {
        for (double w : row) {
            if (w != 0.0) ++count;
        }
    }
    return count;
}

std::vector<std::vector<size_t>> neighbours(const WeightMatrix& tree) {
    const size_t n = tree.size();
    std::vector<std::vector<size_t>> adj(n);
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < tree[i].size() && j < n; ++j) {
            if (i == j || tree[i][j] == 0.0) continue;
            adj[i].push_back(j);
            adj[j].push_back(i);
        }
    }
    for (auto& list : adj) {
        std::sort(list.begin(), list.end());
        list.erase(std::unique(list.begin(), list.end()), list.end());
    }
    return adj;
}

std::vector<std::vector<size_t>> hopDistances(const WeightMatrix& tree) {
    const size_t n = tree.size();
    const auto adj = neighbours(tree);
    std::vector<std::vector<size_t>> dist(n, std::vector<size_t>(n, kUnreachable));

    for (size_t source = 0; source < n; ++source) {
        dist[source][source] = 0;
        std::queue<size_t> frontier;
        frontier.push(source);
        while (!frontier.empty()) {
            const size_t u = frontier.front();
            frontier.pop();
            for (size_t v : adj[u]) {
                if (dist[source][v] != kUnreachable) continue;
                dist[source][v] = dist[source][u] + 1;
                frontier.push(v);
            }
        }
    }
    return dist;
}

} // namespace SpanningTree
