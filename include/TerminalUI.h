#pragma once
#include "AcmConfig.h"
#include "AutoContractiveMap.h"
#include <string>
#include <vector>

class TerminalUI {
public:
    static void printBanner(const AcmConfig& config);
    static void printWeightMatrix(const std::vector<std::string>& labels, const WeightMatrix& matrix);
    static void printTrainingSummary(const AutoContractiveMap& model, size_t samplesOffered);

    // Dimension with the most tree edges; ties go to the lowest index.
    static size_t treeHub(const WeightMatrix& tree);
};
