#pragma once
#include "AcmConfig.h"
#include <cstddef>
#include <string>
#include <vector>

class GnuplotEngine {
public:
    struct GraphNode {
        double x = 0.0;
        double y = 0.0;
        std::string label;
    };

    struct GraphEdge {
        size_t from = 0;
        size_t to = 0;
        std::string label;
    };

    /**
     * @brief Initializes plotting backend and asset directory.
     * @post assets directory is created if possible.
     */
    GnuplotEngine(std::string assetsDir, PlotConfig cfg);

    /**
     * @brief Checks whether gnuplot executable is available in PATH.
     */
    bool isAvailable() const;

    const std::string& assetsDir() const { return assetsDir_; }

    /**
     * @brief Draws a node-link diagram; edges index into nodes.
     * @post Returns output image path, or empty string on generation failure.
     */
    std::string graph(const std::string& id,
                      const std::vector<GraphNode>& nodes,
                      const std::vector<GraphEdge>& edges,
                      const std::string& title);

    /**
     * @brief Generates heatmap image with an automatic colour range.
     * @post Returns output image path, or empty string on generation failure.
     */
    std::string heatmap(const std::string& id,
                        const std::vector<std::vector<double>>& matrix,
                        const std::string& title,
                        const std::vector<std::string>& labels = {});

    std::string line(const std::string& id,
                     const std::vector<double>& x,
                     const std::vector<double>& y,
                     const std::string& title,
                     const std::string& xLabel = "",
                     const std::string& yLabel = "");

    /**
     * @brief Builds the gnuplot script for graph() without running it.
     */
    std::string graphScript(const std::string& id, const std::string& title) const;
    static std::string graphData(const std::vector<GraphNode>& nodes, const std::vector<GraphEdge>& edges);

    static std::string sanitizeId(const std::string& id);
    static std::string quoteForGnuplot(const std::string& value);

private:
    std::string assetsDir_;
    PlotConfig cfg_;

    static std::string quoteDataString(const std::string& value);
    static std::string terminalForFormat(const std::string& format, int width, int height);
    std::string outputPath(const std::string& id) const;
    std::string dataPath(const std::string& id) const;
    std::string styledHeader(const std::string& id, const std::string& title) const;
    std::string runScript(const std::string& id, const std::string& dataContent, const std::string& scriptContent);
};
