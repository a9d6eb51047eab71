#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

struct PlotConfig {
    std::string format = "png";
    std::string theme = "light";
    int width = 1280;
    int height = 720;
    bool showGrid = true;
    double lineWidth = 1.6;
    double pointSize = 0.9;
};

struct AcmConfig {
    size_t dimensions = 10;
    double contraction = 2.0;
    size_t sampleCount = 1000;
    std::string fixture = "correlated";   // correlated|random
    uint32_t seed = 1337;
    double convergenceThreshold = 1e-6;

    bool plotGraph = true;
    bool printWeights = false;
    bool verbose = false;
    bool showHelp = false;
    std::string assetsDir = "acmap_assets";
    std::string reportFile;                // empty => no markdown report

    PlotConfig plot;

    /**
     * @brief Builds config from CLI args and optional config file override.
     * @post Returns a validated config object.
     * @throws AcMap::ConfigurationException on invalid arguments or values.
     */
    static AcmConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads config values from a lightweight YAML/JSON-like key:value file.
     * @pre configPath points to a readable text file.
     * @post Returns merged config using `base` as defaults.
     * @throws AcMap::ConfigurationException on parse/validation failures.
     */
    static AcmConfig fromFile(const std::string& configPath, const AcmConfig& base);

    /**
     * @brief Validates merged configuration invariants and enum-like fields.
     * @throws AcMap::ConfigurationException on invalid values.
     */
    void validate() const;

    static std::string usage();
};
