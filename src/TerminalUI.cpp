#include "TerminalUI.h"
#include <algorithm>
#include <iomanip>
#include <iostream>

void TerminalUI::printBanner(const AcmConfig& config) {
    std::cout << "\n=============================================== AUTO-CONTRACTIVE MAP ===============================================\n";
    std::cout << "  Dimensions (N)      : " << config.dimensions << "\n"
              << "  Contraction (C)     : " << config.contraction << "\n"
              << "  Fixture             : " << config.fixture << " (" << config.sampleCount << " samples, seed " << config.seed << ")\n"
              << "  Convergence         : 0 <= sum(out) < " << config.convergenceThreshold << "\n";
    std::cout << "====================================================================================================================\n";
}

void TerminalUI::printWeightMatrix(const std::vector<std::string>& labels, const WeightMatrix& matrix) {
    size_t maxNameLen = 8;
    for (const auto& name : labels) maxNameLen = std::max(maxNameLen, name.length());
    const int w = static_cast<int>(maxNameLen) + 2;

    const auto oldPrecision = std::cout.precision();
    std::cout << "\n============================================ LEARNED WEIGHTS (w) ============================================\n";
    std::cout << std::setw(w) << " ";
    for (const auto& name : labels) {
        std::cout << std::setw(w) << name;
    }
    std::cout << "\n" << std::string(static_cast<size_t>(w) * (labels.size() + 1), '-') << "\n";
    for (size_t i = 0; i < matrix.size() && i < labels.size(); ++i) {
        std::cout << std::left << std::setw(w) << labels[i] << std::right;
        for (size_t j = 0; j < matrix[i].size(); ++j) {
            std::cout << std::setw(w) << std::fixed << std::setprecision(4) << matrix[i][j];
        }
        std::cout << "\n";
    }
    std::cout << std::defaultfloat << std::setprecision(static_cast<int>(oldPrecision));
    std::cout << "=============================================================================================================\n";
}

size_t TerminalUI::treeHub(const WeightMatrix& tree) {
    const auto adj = SpanningTree::neighbours(tree);
    size_t hub = 0;
    for (size_t i = 1; i < adj.size(); ++i) {
        if (adj[i].size() > adj[hub].size()) hub = i;
    }
    return hub;
}

void TerminalUI::printTrainingSummary(const AutoContractiveMap& model, size_t samplesOffered) {
    std::cout << "\n[AcMap][Train] Consumed " << model.runCount() << " of " << samplesOffered << " samples"
              << (model.stoppedEarly() ? " (converged)" : " (sample sequence exhausted)") << "\n";
    const auto oldPrecision = std::cout.precision();
    std::cout << "[AcMap][Train] Final output sum: " << std::scientific << std::setprecision(3)
              << model.outputSum() << std::defaultfloat << std::setprecision(static_cast<int>(oldPrecision)) << "\n";

    const WeightMatrix& tree = model.spanningTree();
    const size_t edges = SpanningTree::edgeCount(tree);
    std::cout << "[AcMap][Train] Spanning tree: " << edges << " edge(s) over " << model.dimensions() << " dimension(s)";
    if (edges > 0) {
        const size_t hub = treeHub(tree);
        std::cout << ", hub '" << model.labels()[hub] << "' with "
                  << SpanningTree::neighbours(tree)[hub].size() << " link(s)";
    }
    std::cout << "\n";
}
