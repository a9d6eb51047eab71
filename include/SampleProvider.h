#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct SampleSet {
    std::vector<std::vector<double>> rows;
    std::vector<std::string> labels;
};

class SampleProvider {
public:
    virtual ~SampleProvider() = default;

    virtual size_t dimensions() const = 0;

    /**
     * @brief Produces the ordered training rows and one label per dimension.
     * @post Every row and the label list have dimensions() entries.
     */
    virtual SampleSet provide() const = 0;
};

/**
 * Rows of the form
 * [R1, 2xR1, R1+0.1, R1^2, 2*R1^2, 3xR1^2, R2>0.9 .. R5>0.9, uniform noise ...].
 */
class CorrelatedSampleProvider final : public SampleProvider {
public:
    static constexpr size_t kMinDimensions = 6;

    /**
     * @throws AcMap::ConfigurationException when dimensions < kMinDimensions or count == 0.
     */
    CorrelatedSampleProvider(size_t dimensions, size_t count, uint32_t seed);

    size_t dimensions() const override { return dimensions_; }
    SampleSet provide() const override;

    static std::vector<std::string> labelsFor(size_t dimensions);

private:
    size_t dimensions_;
    size_t count_;
    uint32_t seed_;
};

// Uniform [0,1) rows with no correlation between dimensions.
class RandomSampleProvider final : public SampleProvider {
public:
    // A single column is constant after per-row rescaling.
    static constexpr size_t kMinDimensions = 2;

    /**
     * @throws AcMap::ConfigurationException when dimensions < kMinDimensions or count == 0.
     */
    RandomSampleProvider(size_t dimensions, size_t count, uint32_t seed);

    size_t dimensions() const override { return dimensions_; }
    SampleSet provide() const override;

    static std::vector<std::string> labelsFor(size_t dimensions);

private:
    size_t dimensions_;
    size_t count_;
    uint32_t seed_;
};
