#include "AutoContractiveMap.h"
#include "AcMapExceptions.h"
#include "CommonUtils.h"
#include "MathUtils.h"

#include <cmath>
#include <string>
#include <utility>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
// Below this size the per-phase loops stay serial; thread startup dominates.
constexpr size_t kParallelDimensionThreshold = 64;
}

AutoContractiveMap::AutoContractiveMap(size_t dimensions,
                                       const AcmOptions& options,
                                       std::shared_ptr<const SpanningTreeSolver> treeSolver)
    : m_dimensions(dimensions), m_options(options), m_treeSolver(std::move(treeSolver)) {
    if (m_dimensions == 0) {
        throw AcMap::ConfigurationException("Input length must be at least 1");
    }
    if (!std::isfinite(m_options.contraction) || m_options.contraction <= 1.0) {
        throw AcMap::ConfigurationException("Contraction parameter must be finite and > 1, got " +
                                            CommonUtils::formatShortest(m_options.contraction));
    }
    if (!std::isfinite(m_options.initialWeight)) {
        throw AcMap::ConfigurationException("Initial weight must be finite");
    }
    if (!(m_options.convergenceThreshold > 0.0) || !std::isfinite(m_options.convergenceThreshold)) {
        throw AcMap::ConfigurationException("Convergence threshold must be finite and > 0");
    }
    if (!m_treeSolver) {
        m_treeSolver = std::make_shared<KruskalSpanningTree>();
    }

    m_labels = defaultLabels(m_dimensions);
    m_v.assign(m_dimensions, m_options.initialWeight);
    m_w.assign(m_dimensions * m_dimensions, m_options.initialWeight);
    m_scaled.assign(m_dimensions, 0.0);
    m_hidden.assign(m_dimensions, 0.0);
    m_out.assign(m_dimensions, 0.0);
    m_net.assign(m_dimensions, 0.0);
}

std::vector<std::string> AutoContractiveMap::defaultLabels(size_t n) {
    std::vector<std::string> out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) out.push_back("D" + std::to_string(i));
    return out;
}

void AutoContractiveMap::setLabels(std::vector<std::string> labels) {
    if (labels.size() != m_dimensions) {
        throw AcMap::ConfigurationException("Expected " + std::to_string(m_dimensions) + " labels, got " +
                                            std::to_string(labels.size()));
    }
    m_labels = std::move(labels);
}

void AutoContractiveMap::checkPhase(const char* phase, const char* array, const double* values, size_t count) {
    const auto bad = MathUtils::firstNonFinite(values, count);
    if (!bad) return;

    m_valid = false;
    std::string where = std::string(array) + "[";
    if (count == m_dimensions * m_dimensions && count != m_dimensions) {
        where += std::to_string(*bad / m_dimensions) + "][" + std::to_string(*bad % m_dimensions) + "]";
    } else {
        where += std::to_string(*bad) + "]";
    }
    throw AcMap::NumericException(std::string(phase) + " produced " + where + " = " +
                                  CommonUtils::formatShortest(values[*bad]) + " at sample " +
                                  std::to_string(m_stepCounter));
}

void AutoContractiveMap::runOnce(const std::vector<double>& input) {
    const size_t n = m_dimensions;
    const double c = m_options.contraction;
    if (!m_valid) {
        throw AcMap::ModelStateException("Model state is invalid after a failed update step");
    }
    ++m_stepCounter;

    if (input.size() != n) {
        m_valid = false;
        throw AcMap::PreconditionException("Training sample has length " + std::to_string(input.size()) +
                                           ", expected " + std::to_string(n));
    }

    try {
        MathUtils::rescaleToUnitInterval(input, m_scaled);
    } catch (const AcMap::AcMapException&) {
        m_valid = false;
        throw;
    }

    // 1. Signal in -> hidden
    #ifdef USE_OPENMP
    #pragma omp parallel for if(n >= kParallelDimensionThreshold)
    #endif
    for (size_t i = 0; i < n; ++i) {
        m_hidden[i] = m_scaled[i] * (1.0 - m_v[i] / c);
    }
    checkPhase("Hidden signal", "mHidden", m_hidden.data(), n);

    // 2. Adapt v
    #ifdef USE_OPENMP
    #pragma omp parallel for if(n >= kParallelDimensionThreshold)
    #endif
    for (size_t i = 0; i < n; ++i) {
        m_v[i] += (m_scaled[i] - m_hidden[i]) * (1.0 - (m_v[i] / c));
    }
    checkPhase("Input-weight adaptation", "v", m_v.data(), n);

    // 3. Net hidden -> out; j stays sequential so sums match serial builds.
    #ifdef USE_OPENMP
    #pragma omp parallel for if(n >= kParallelDimensionThreshold)
    #endif
    for (size_t i = 0; i < n; ++i) {
        const double* row = m_w.data() + i * n;
        double acc = 0.0;
        for (size_t j = 0; j < n; ++j) {
            acc += m_hidden[j] * (1.0 - (row[j] / c));
        }
        m_net[i] = acc;
    }
    checkPhase("Net accumulation", "net", m_net.data(), n);

    // 4. Signal hidden -> out
    #ifdef USE_OPENMP
    #pragma omp parallel for if(n >= kParallelDimensionThreshold)
    #endif
    for (size_t i = 0; i < n; ++i) {
        m_out[i] = m_hidden[i] * (1.0 - m_net[i] / c);
    }
    checkPhase("Output signal", "mOut", m_out.data(), n);

    // 5. Adapt w in single operations to keep intermediates small.
    #ifdef USE_OPENMP
    #pragma omp parallel for if(n >= kParallelDimensionThreshold)
    #endif
    for (size_t i = 0; i < n; ++i) {
        double* row = m_w.data() + i * n;
        const double delta = m_hidden[i] - m_out[i];
        for (size_t j = 0; j < n; ++j) {
            const double contraction = 1.0 - row[j] / c;
            double step = delta * contraction;
            step *= m_hidden[j];
            row[j] += step;
        }
    }
    checkPhase("Hidden-to-output adaptation", "w", m_w.data(), n * n);
}

void AutoContractiveMap::train(const std::vector<std::vector<double>>& samples) {
    if (!m_valid) {
        throw AcMap::ModelStateException("Model state is invalid after a failed training run; construct a new model");
    }
    m_runCount = 0;
    m_stepCounter = 0;
    m_trained = false;
    m_stoppedEarly = false;
    m_mst.clear();
    m_outputSumHistory.clear();
    if (m_options.recordHistory) m_outputSumHistory.reserve(samples.size());

    for (const auto& sample : samples) {
        runOnce(sample);
        ++m_runCount;

        const double sumOut = outputSum();
        if (m_options.recordHistory) m_outputSumHistory.push_back(sumOut);
        if (sumOut >= 0.0 && sumOut < m_options.convergenceThreshold) {
            m_stoppedEarly = true;
            break;
        }
    }

    m_mst = m_treeSolver->solve(weightMatrix());
    m_trained = true;
}

double AutoContractiveMap::outputSum() const {
    return MathUtils::sum(m_out);
}

WeightMatrix AutoContractiveMap::weightMatrix() const {
    WeightMatrix out(m_dimensions, std::vector<double>(m_dimensions, 0.0));
    for (size_t i = 0; i < m_dimensions; ++i) {
        for (size_t j = 0; j < m_dimensions; ++j) {
            out[i][j] = m_w[i * m_dimensions + j];
        }
    }
    return out;
}

void AutoContractiveMap::requireSummarizable() const {
    if (!m_valid) {
        throw AcMap::ModelStateException("Model state is invalid after a failed training run");
    }
    if (!m_trained) {
        throw AcMap::ModelStateException("Model has not been trained");
    }
}

const WeightMatrix& AutoContractiveMap::spanningTree() const {
    requireSummarizable();
    return m_mst;
}

std::vector<std::vector<size_t>> AutoContractiveMap::treeDistances() const {
    requireSummarizable();
    return SpanningTree::hopDistances(m_mst);
}

std::vector<TreeConnection> AutoContractiveMap::connections() const {
    requireSummarizable();
    std::vector<TreeConnection> out;
    for (size_t i = 0; i < m_dimensions; ++i) {
        for (size_t j = 0; j < m_dimensions; ++j) {
            const double w = m_mst[i][j];
            if (w == 0.0) continue;
            out.push_back({i, j, m_labels[i], m_labels[j], w});
        }
    }
    return out;
}
