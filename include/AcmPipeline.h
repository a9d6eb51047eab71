#pragma once

#include "AcmConfig.h"

#include <memory>

class SampleProvider;

class AcmPipeline final {
public:
    /**
     * @brief Generates the configured fixture, trains the map and reports the tree.
     * @return process exit code (0 on success).
     * @throws AcMap::AcMapException on configuration, input or numeric failures.
     */
    int run(const AcmConfig& config);

    /**
     * @throws AcMap::ConfigurationException for an unknown fixture or an
     *         unsupported dimension count.
     */
    static std::unique_ptr<SampleProvider> makeProvider(const AcmConfig& config);
};
