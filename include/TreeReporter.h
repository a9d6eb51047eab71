#pragma once

#include "AutoContractiveMap.h"
#include "GnuplotEngine.h"

#include <iosfwd>
#include <string>
#include <vector>

class TreeReporter {
public:
    virtual ~TreeReporter() = default;
    virtual void report(const std::vector<TreeConnection>& connections, size_t runCount) = 0;
};

// Prints "Total number of runs: <cnt>" then one "Connection:" line per edge.
class TextTreeReporter final : public TreeReporter {
public:
    explicit TextTreeReporter(std::ostream& out) : out_(out) {}
    void report(const std::vector<TreeConnection>& connections, size_t runCount) override;

    static std::string formatConnection(const TreeConnection& c);

private:
    std::ostream& out_;
};

/**
 * Renders the tree as a node-link diagram through gnuplot. Each connected
 * component is rooted at its lowest dimension index and laid out breadth-first,
 * one row per depth. Rendering is best effort: a missing gnuplot leaves
 * lastImagePath() empty.
 */
class GraphTreeReporter final : public TreeReporter {
public:
    GraphTreeReporter(GnuplotEngine& plotter, std::string id, std::string title);
    void report(const std::vector<TreeConnection>& connections, size_t runCount) override;

    const std::string& lastImagePath() const noexcept { return lastImagePath_; }

    struct Layout {
        std::vector<GnuplotEngine::GraphNode> nodes;
        std::vector<GnuplotEngine::GraphEdge> edges;
    };
    static Layout layout(const std::vector<TreeConnection>& connections);

private:
    GnuplotEngine& plotter_;
    std::string id_;
    std::string title_;
    std::string lastImagePath_;
};
