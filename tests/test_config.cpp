/**
 * @file test_config.cpp
 * @brief Unit tests for command-line and file configuration
 */

#include <gtest/gtest.h>
#include "AcmConfig.h"
#include "AcMapExceptions.h"
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {
AcmConfig parse(std::vector<std::string> args) {
    args.insert(args.begin(), "acmap");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);
    return AcmConfig::fromArgs(static_cast<int>(args.size()), argv.data());
}

std::string writeTempConfig(const std::string& name, const std::string& content) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path.string();
}
}

TEST(ConfigTest, Defaults) {
    const AcmConfig cfg = parse({});
    EXPECT_EQ(cfg.dimensions, 10u);
    EXPECT_DOUBLE_EQ(cfg.contraction, 2.0);
    EXPECT_EQ(cfg.sampleCount, 1000u);
    EXPECT_EQ(cfg.fixture, "correlated");
    EXPECT_EQ(cfg.seed, 1337u);
    EXPECT_DOUBLE_EQ(cfg.convergenceThreshold, 1e-6);
    EXPECT_TRUE(cfg.plotGraph);
    EXPECT_FALSE(cfg.showHelp);
}

TEST(ConfigTest, FlagsOverrideDefaults) {
    const AcmConfig cfg = parse({"--dimensions", "12", "--contraction", "3.5", "--samples", "500",
                                 "--fixture", "RANDOM", "--seed", "42", "--plot", "off",
                                 "--print-weights", "yes", "--plot-format", "svg"});
    EXPECT_EQ(cfg.dimensions, 12u);
    EXPECT_DOUBLE_EQ(cfg.contraction, 3.5);
    EXPECT_EQ(cfg.sampleCount, 500u);
    EXPECT_EQ(cfg.fixture, "random");
    EXPECT_EQ(cfg.seed, 42u);
    EXPECT_FALSE(cfg.plotGraph);
    EXPECT_TRUE(cfg.printWeights);
    EXPECT_EQ(cfg.plot.format, "svg");
}

TEST(ConfigTest, HelpSkipsValidation) {
    const AcmConfig cfg = parse({"--contraction", "0.5", "--help"});
    EXPECT_TRUE(cfg.showHelp);
}

TEST(ConfigTest, InvalidArgumentsThrow) {
    EXPECT_THROW(parse({"--bogus", "1"}), AcMap::ConfigurationException);
    EXPECT_THROW(parse({"--dimensions"}), AcMap::ConfigurationException);
    EXPECT_THROW(parse({"--dimensions", "-3"}), AcMap::ConfigurationException);
    EXPECT_THROW(parse({"--dimensions", "0"}), AcMap::ConfigurationException);
    EXPECT_THROW(parse({"--contraction", "1"}), AcMap::ConfigurationException);
    EXPECT_THROW(parse({"--contraction", "2x"}), AcMap::ConfigurationException);
    EXPECT_THROW(parse({"--convergence-threshold", "1.5"}), AcMap::ConfigurationException);
    EXPECT_THROW(parse({"--fixture", "uniform"}), AcMap::ConfigurationException);
    EXPECT_THROW(parse({"--plot", "maybe"}), AcMap::ConfigurationException);
    EXPECT_THROW(parse({"--plot-theme", "neon"}), AcMap::ConfigurationException);
    EXPECT_THROW(parse({"--seed", "99999999999"}), AcMap::ConfigurationException);
}

TEST(ConfigTest, RandomFixtureNeedsTwoDimensions) {
    EXPECT_THROW(parse({"--dimensions", "1", "--fixture", "random"}), AcMap::ConfigurationException);
    EXPECT_NO_THROW(parse({"--dimensions", "2", "--fixture", "random"}));
}

TEST(ConfigTest, LoadsKeyValueFile) {
    const std::string path = writeTempConfig("acmap_config_test.yaml",
                                             "# ACM run\n"
                                             "dimensions: 8\n"
                                             "contraction: 2.5   # C\n"
                                             "convergence-threshold: 0.0001\n"
                                             "assets_dir: \"out dir\"\n"
                                             "plot_width: 800\n");
    const AcmConfig cfg = parse({"--config", path, "--seed", "3"});
    EXPECT_EQ(cfg.dimensions, 8u);
    EXPECT_DOUBLE_EQ(cfg.contraction, 2.5);
    EXPECT_DOUBLE_EQ(cfg.convergenceThreshold, 0.0001);
    EXPECT_EQ(cfg.assetsDir, "out dir");
    EXPECT_EQ(cfg.plot.width, 800);
    EXPECT_EQ(cfg.seed, 3u);
    std::filesystem::remove(path);
}

TEST(ConfigTest, FlagsWinOverFile) {
    const std::string path = writeTempConfig("acmap_config_override.json",
                                             "{\n  \"samples\": 20,\n  \"verbose\": true\n}\n");
    const AcmConfig cfg = parse({"--samples", "30", "--config", path});
    EXPECT_EQ(cfg.sampleCount, 30u);
    EXPECT_TRUE(cfg.verbose);
    std::filesystem::remove(path);
}

TEST(ConfigTest, MalformedFileThrows) {
    const std::string unknown = writeTempConfig("acmap_config_unknown.yaml", "learning_rate: 0.1\n");
    EXPECT_THROW(AcmConfig::fromFile(unknown, AcmConfig{}), AcMap::ConfigurationException);
    std::filesystem::remove(unknown);

    const std::string malformed = writeTempConfig("acmap_config_malformed.yaml", "dimensions 8\n");
    EXPECT_THROW(AcmConfig::fromFile(malformed, AcmConfig{}), AcMap::ConfigurationException);
    std::filesystem::remove(malformed);

    EXPECT_THROW(AcmConfig::fromFile("/nonexistent/acmap.yaml", AcmConfig{}), AcMap::ConfigurationException);
}
