/**
 * @file test_end_to_end.cpp
 * @brief End-to-end runs over the correlated fixture
 */

#include <gtest/gtest.h>
#include "AcmPipeline.h"
#include "AcMapExceptions.h"
#include "AutoContractiveMap.h"
#include "SampleProvider.h"
#include "TerminalUI.h"
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace {
struct HopMeans {
    double intra = 0.0;
    double cross = 0.0;
};

// Mean tree distance inside the R1 block (0..5) versus between it and 6..9.
HopMeans blockHopMeans(const AutoContractiveMap& acm) {
    const auto dist = acm.treeDistances();
    HopMeans m;
    size_t intraCount = 0, crossCount = 0;
    for (size_t i = 0; i < 6; ++i) {
        for (size_t j = i + 1; j < 6; ++j) {
            m.intra += static_cast<double>(dist[i][j]);
            ++intraCount;
        }
        for (size_t j = 6; j < 10; ++j) {
            m.cross += static_cast<double>(dist[i][j]);
            ++crossCount;
        }
    }
    m.intra /= static_cast<double>(intraCount);
    m.cross /= static_cast<double>(crossCount);
    return m;
}
}

TEST(EndToEndTest, DefaultRunConvergesToStarOnSquare) {
    const SampleSet set = CorrelatedSampleProvider(10, 1000, 1337).provide();
    AutoContractiveMap acm(10);
    acm.setLabels(set.labels);
    acm.train(set.rows);

    EXPECT_EQ(acm.runCount(), 170u);
    EXPECT_TRUE(acm.stoppedEarly());

    const auto conns = acm.connections();
    ASSERT_EQ(conns.size(), 9u);
    for (const auto& c : conns) {
        EXPECT_EQ(c.toIdx, 3u);
        EXPECT_EQ(c.to, "R1^2");
        EXPECT_TRUE(std::isfinite(c.weight));
        EXPECT_NE(c.weight, 0.0);
    }
    EXPECT_EQ(conns.front().from, "R1");
    EXPECT_EQ(TerminalUI::treeHub(acm.spanningTree()), 3u);

    const HopMeans m = blockHopMeans(acm);
    EXPECT_LT(m.intra, m.cross);
}

TEST(EndToEndTest, CorrelatedBlockStaysCloserAcrossSeeds) {
    size_t holds = 0;
    for (uint32_t seed = 2; seed <= 8; ++seed) {
        const SampleSet set = CorrelatedSampleProvider(10, 1000, seed).provide();
        AutoContractiveMap acm(10);
        acm.train(set.rows);
        const HopMeans m = blockHopMeans(acm);
        if (m.intra < m.cross) ++holds;
    }
    EXPECT_GE(holds, 5u);
}

TEST(EndToEndTest, WiderFixturesTrain) {
    for (size_t n : {6u, 12u}) {
        const SampleSet set = CorrelatedSampleProvider(n, 1000, 1337).provide();
        AutoContractiveMap acm(n);
        acm.train(set.rows);
        EXPECT_TRUE(acm.isTrained());
        EXPECT_EQ(acm.connections().size(), n - 1);
    }
}

TEST(EndToEndTest, PipelinePrintsTreeAndWritesReport) {
    const auto dir = std::filesystem::temp_directory_path() / "acmap_e2e";
    std::filesystem::remove_all(dir);

    AcmConfig cfg;
    cfg.plotGraph = false;
    cfg.assetsDir = dir.string();
    cfg.reportFile = (dir / "acm.md").string();
    std::filesystem::create_directories(dir);

    testing::internal::CaptureStdout();
    const int rc = AcmPipeline().run(cfg);
    const std::string out = testing::internal::GetCapturedStdout();

    EXPECT_EQ(rc, 0);
    EXPECT_NE(out.find("Total number of runs: 170\n\n"), std::string::npos);
    EXPECT_NE(out.find("Connection: R1 --> \tR1^2\t"), std::string::npos);

    std::ifstream in(cfg.reportFile);
    ASSERT_TRUE(in.good());
    std::stringstream report;
    report << in.rdbuf();
    EXPECT_NE(report.str().find("## Spanning Tree"), std::string::npos);
    EXPECT_NE(report.str().find("Samples consumed: 170 (converged)."), std::string::npos);
    std::filesystem::remove_all(dir);
}

TEST(EndToEndTest, PipelineRejectsUnsupportedFixtures) {
    AcmConfig cfg;
    cfg.dimensions = 5;
    EXPECT_THROW(AcmPipeline::makeProvider(cfg), AcMap::ConfigurationException);

    cfg.fixture = "random";
    EXPECT_TRUE(AcmPipeline::makeProvider(cfg) != nullptr);

    cfg.fixture = "uniform";
    EXPECT_THROW(AcmPipeline::makeProvider(cfg), AcMap::ConfigurationException);
}

TEST(EndToEndTest, DivergingSeedSurfacesNumericError) {
    AcmConfig cfg;
    cfg.seed = 1;
    cfg.plotGraph = false;
    testing::internal::CaptureStdout();
    EXPECT_THROW(AcmPipeline().run(cfg), AcMap::NumericException);
    testing::internal::GetCapturedStdout();
}
