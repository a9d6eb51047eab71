#pragma once

#include "SpanningTree.h"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

struct AcmOptions {
    // Contraction parameter C; must exceed 1.
    double contraction = 2.0;
    // Starting value of every entry of v and w.
    double initialWeight = 0.01;
    // Training stops once 0 <= sum(mOut) < convergenceThreshold.
    double convergenceThreshold = 1e-6;
    bool recordHistory = true;
};

struct TreeConnection {
    size_t fromIdx = 0;
    size_t toIdx = 0;
    std::string from;
    std::string to;
    double weight = 0.0;
};

/**
 * Auto-Contractive Map over N input dimensions.
 *
 * Owns the input weights v (N) and hidden-to-output weights w (N x N, row
 * major) plus per-step scratch buffers, all sized once at construction.
 * Training is a strictly sequential fold over the samples.
 */
class AutoContractiveMap {
public:
    /**
     * @throws AcMap::ConfigurationException when dimensions == 0, contraction <= 1,
     *         or the options are otherwise out of range.
     */
    AutoContractiveMap(size_t dimensions,
                       const AcmOptions& options = {},
                       std::shared_ptr<const SpanningTreeSolver> treeSolver = nullptr);

    size_t dimensions() const noexcept { return m_dimensions; }
    double contraction() const noexcept { return m_options.contraction; }
    const AcmOptions& options() const noexcept { return m_options; }

    /**
     * @brief Replaces dimension labels.
     * @throws AcMap::ConfigurationException when labels.size() != dimensions().
     */
    void setLabels(std::vector<std::string> labels);
    const std::vector<std::string>& labels() const noexcept { return m_labels; }

    /**
     * @brief Applies one learning step for a raw input vector.
     * @pre input.size() == dimensions(); input is finite and not constant.
     * @post v, w, hidden and output buffers hold the post-step state.
     * @throws AcMap::PreconditionException on malformed input.
     * @throws AcMap::NumericException when any phase produces a non-finite value.
     */
    void runOnce(const std::vector<double>& input);

    /**
     * @brief Trains over samples in order, stopping early on convergence, then
     *        extracts the spanning tree of w.
     * @post runCount() holds the number of samples consumed.
     * @throws Propagates runOnce failures; the model is then invalid.
     */
    void train(const std::vector<std::vector<double>>& samples);

    /**
     * @brief Tree edges as labelled triples in row-major order.
     * @throws AcMap::ModelStateException before training or after a failed run.
     */
    std::vector<TreeConnection> connections() const;

    const WeightMatrix& spanningTree() const;
    std::vector<std::vector<size_t>> treeDistances() const;

    bool isTrained() const noexcept { return m_trained && m_valid; }
    bool isValid() const noexcept { return m_valid; }
    size_t runCount() const noexcept { return m_runCount; }
    bool stoppedEarly() const noexcept { return m_stoppedEarly; }

    const std::vector<double>& inputWeights() const noexcept { return m_v; }
    const std::vector<double>& hiddenToOutputWeights() const noexcept { return m_w; }
    double weight(size_t i, size_t j) const { return m_w[i * m_dimensions + j]; }
    WeightMatrix weightMatrix() const;

    const std::vector<double>& hidden() const noexcept { return m_hidden; }
    const std::vector<double>& output() const noexcept { return m_out; }
    const std::vector<double>& net() const noexcept { return m_net; }
    double outputSum() const;

    // sum(mOut) after each processed sample of the last train() call.
    const std::vector<double>& outputSumHistory() const noexcept { return m_outputSumHistory; }

private:
    void checkPhase(const char* phase, const char* array, const double* values, size_t count);
    void requireSummarizable() const;
    static std::vector<std::string> defaultLabels(size_t n);

    size_t m_dimensions = 0;
    AcmOptions m_options;
    std::shared_ptr<const SpanningTreeSolver> m_treeSolver;
    std::vector<std::string> m_labels;

    std::vector<double> m_v;
    std::vector<double> m_w;
    std::vector<double> m_scaled;
    std::vector<double> m_hidden;
    std::vector<double> m_out;
    std::vector<double> m_net;

    std::vector<double> m_outputSumHistory;
    WeightMatrix m_mst;
    size_t m_runCount = 0;
    size_t m_stepCounter = 0;
    bool m_trained = false;
    bool m_valid = true;
    bool m_stoppedEarly = false;
};
