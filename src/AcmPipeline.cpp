#include "AcmPipeline.h"
#include "AcMapExceptions.h"
#include "AutoContractiveMap.h"
#include "CommonUtils.h"
#include "GnuplotEngine.h"
#include "ReportEngine.h"
#include "SampleProvider.h"
#include "TerminalUI.h"
#include "TreeReporter.h"

#include <filesystem>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {
struct PlotArtifacts {
    std::string tree;
    std::string heatmap;
    std::string convergence;
};

PlotArtifacts renderPlots(const AcmConfig& config,
                          const AutoContractiveMap& model,
                          const std::vector<TreeConnection>& connections) {
    PlotArtifacts artifacts;
    GnuplotEngine plotter((std::filesystem::path(config.assetsDir) / "plots").string(), config.plot);
    if (!plotter.isAvailable()) {
        std::cout << "[AcMap][Plot] gnuplot not available in PATH: plot generation skipped.\n";
        return artifacts;
    }

    GraphTreeReporter graph(plotter, "acm_tree", "Auto-Contractive Map spanning tree");
    graph.report(connections, model.runCount());
    artifacts.tree = graph.lastImagePath();

    artifacts.heatmap = plotter.heatmap("acm_weights", model.weightMatrix(), "Learned weights w", model.labels());

    const auto& history = model.outputSumHistory();
    if (!history.empty()) {
        std::vector<double> steps(history.size());
        for (size_t i = 0; i < steps.size(); ++i) steps[i] = static_cast<double>(i + 1);
        artifacts.convergence = plotter.line("acm_convergence", steps, history, "Output sum per sample", "sample", "sum(out)");
    }

    for (const std::string* path : {&artifacts.tree, &artifacts.heatmap, &artifacts.convergence}) {
        if (!path->empty()) std::cout << "[AcMap][Plot] Wrote " << *path << "\n";
    }
    return artifacts;
}

void writeReport(const AcmConfig& config,
                 const AutoContractiveMap& model,
                 const std::vector<TreeConnection>& connections,
                 const PlotArtifacts& artifacts) {
    ReportEngine report;
    report.addTitle("Auto-Contractive Map");
    report.addParagraph("Fixture: " + config.fixture + " | Dimensions: " + std::to_string(config.dimensions) +
                        " | Samples offered: " + std::to_string(config.sampleCount) +
                        " | Seed: " + std::to_string(config.seed));
    report.addParagraph("Contraction C = " + CommonUtils::formatShortest(config.contraction) +
                        ". Samples consumed: " + std::to_string(model.runCount()) +
                        (model.stoppedEarly() ? " (converged)." : " (samples exhausted)."));

    std::vector<std::vector<std::string>> edgeRows;
    edgeRows.reserve(connections.size());
    for (const auto& c : connections) {
        edgeRows.push_back({c.from, c.to, CommonUtils::formatShortest(c.weight)});
    }
    report.addTable("Spanning Tree", {"From", "To", "Weight"}, edgeRows);

    const auto& labels = model.labels();
    const WeightMatrix w = model.weightMatrix();
    std::vector<std::string> headers{""};
    headers.insert(headers.end(), labels.begin(), labels.end());
    std::vector<std::vector<std::string>> weightRows;
    for (size_t i = 0; i < w.size(); ++i) {
        std::vector<std::string> row{labels[i]};
        for (double value : w[i]) row.push_back(CommonUtils::formatShortest(value));
        weightRows.push_back(std::move(row));
    }
    report.addTable("Learned Weights", headers, weightRows);

    if (!artifacts.tree.empty()) report.addImage("Spanning Tree Diagram", artifacts.tree);
    if (!artifacts.heatmap.empty()) report.addImage("Weight Heatmap", artifacts.heatmap);
    if (!artifacts.convergence.empty()) report.addImage("Convergence", artifacts.convergence);

    report.save(config.reportFile);
    std::cout << "[AcMap] Report saved to " << config.reportFile << "\n";
}
} // namespace

std::unique_ptr<SampleProvider> AcmPipeline::makeProvider(const AcmConfig& config) {
    if (config.fixture == "correlated") {
        return std::make_unique<CorrelatedSampleProvider>(config.dimensions, config.sampleCount, config.seed);
    }
    if (config.fixture == "random") {
        return std::make_unique<RandomSampleProvider>(config.dimensions, config.sampleCount, config.seed);
    }
    throw AcMap::ConfigurationException("Unknown fixture: " + config.fixture);
}

int AcmPipeline::run(const AcmConfig& config) {
    TerminalUI::printBanner(config);

    const auto provider = makeProvider(config);
    SampleSet samples = provider->provide();
    if (config.verbose) {
        std::cout << "[AcMap] Generated " << samples.rows.size() << " " << config.fixture
                  << " samples over " << provider->dimensions() << " dimensions\n";
    }

    AcmOptions options;
    options.contraction = config.contraction;
    options.convergenceThreshold = config.convergenceThreshold;
    AutoContractiveMap model(provider->dimensions(), options);
    model.setLabels(std::move(samples.labels));
    model.train(samples.rows);

    TerminalUI::printTrainingSummary(model, samples.rows.size());
    if (config.printWeights) {
        TerminalUI::printWeightMatrix(model.labels(), model.weightMatrix());
    }

    const std::vector<TreeConnection> connections = model.connections();
    std::cout << "\n";
    TextTreeReporter text(std::cout);
    text.report(connections, model.runCount());

    PlotArtifacts artifacts;
    if (config.plotGraph) {
        artifacts = renderPlots(config, model, connections);
    }
    if (!config.reportFile.empty()) {
        writeReport(config, model, connections, artifacts);
    }
    return 0;
}
