#include "TreeReporter.h"
#include "CommonUtils.h"

#include <algorithm>
#include <map>
#include <ostream>
#include <queue>
#include <sstream>
#include <utility>

void TextTreeReporter::report(const std::vector<TreeConnection>& connections, size_t runCount) {
    out_ << "Total number of runs: " << runCount << "\n\n";
    for (const auto& c : connections) {
        out_ << formatConnection(c) << "\n";
    }
    out_.flush();
}

std::string TextTreeReporter::formatConnection(const TreeConnection& c) {
    return "Connection: " + c.from + " --> \t" + c.to + "\t" + CommonUtils::formatShortest(c.weight);
}

GraphTreeReporter::GraphTreeReporter(GnuplotEngine& plotter, std::string id, std::string title)
    : plotter_(plotter), id_(std::move(id)), title_(std::move(title)) {}

GraphTreeReporter::Layout GraphTreeReporter::layout(const std::vector<TreeConnection>& connections) {
    // Nodes are the dimensions that appear in at least one edge, keyed by index.
    std::map<size_t, std::string> labelByIdx;
    for (const auto& c : connections) {
        labelByIdx.emplace(c.fromIdx, c.from);
        labelByIdx.emplace(c.toIdx, c.to);
    }

    Layout out;
    if (labelByIdx.empty()) return out;

    std::map<size_t, size_t> slot;
    for (const auto& [idx, label] : labelByIdx) {
        slot.emplace(idx, out.nodes.size());
        out.nodes.push_back({0.0, 0.0, label});
    }

    std::vector<std::vector<size_t>> adj(out.nodes.size());
    for (const auto& c : connections) {
        const size_t a = slot.at(c.fromIdx);
        const size_t b = slot.at(c.toIdx);
        out.edges.push_back({a, b, CommonUtils::formatShortest(c.weight)});
        if (a == b) continue;
        adj[a].push_back(b);
        adj[b].push_back(a);
    }
    for (auto& list : adj) std::sort(list.begin(), list.end());

    // BFS per component; rows per depth, components placed side by side.
    std::vector<bool> seen(out.nodes.size(), false);
    double xOffset = 0.0;
    for (size_t root = 0; root < out.nodes.size(); ++root) {
        if (seen[root]) continue;

        std::vector<std::vector<size_t>> levels;
        std::queue<std::pair<size_t, size_t>> frontier;
        frontier.push({root, 0});
        seen[root] = true;
        while (!frontier.empty()) {
            const auto [u, depth] = frontier.front();
            frontier.pop();
            if (levels.size() <= depth) levels.resize(depth + 1);
            levels[depth].push_back(u);
            for (size_t v : adj[u]) {
                if (seen[v]) continue;
                seen[v] = true;
                frontier.push({v, depth + 1});
            }
        }

        size_t width = 1;
        for (const auto& level : levels) width = std::max(width, level.size());
        for (size_t depth = 0; depth < levels.size(); ++depth) {
            const auto& level = levels[depth];
            const double spacing = static_cast<double>(width) / static_cast<double>(level.size());
            for (size_t k = 0; k < level.size(); ++k) {
                auto& node = out.nodes[level[k]];
                node.x = xOffset + spacing * (static_cast<double>(k) + 0.5);
                node.y = -static_cast<double>(depth);
            }
        }
        xOffset += static_cast<double>(width) + 1.0;
    }
    return out;
}

void GraphTreeReporter::report(const std::vector<TreeConnection>& connections, size_t runCount) {
    lastImagePath_.clear();
    const Layout l = layout(connections);
    if (l.nodes.empty()) return;

    std::ostringstream title;
    title << title_ << " (" << runCount << " runs)";
    lastImagePath_ = plotter_.graph(id_, l.nodes, l.edges, title.str());
}
