#include "SampleProvider.h"
#include "AcMapExceptions.h"

#include <algorithm>
#include <cmath>
#include <random>

namespace {
constexpr size_t kNearOneFirst = 6;
constexpr size_t kNearOneLast = 10;
// R1 drives the correlated block; near-one columns continue as R2, R3, ...
constexpr size_t kNoiseLabelOffset = kNearOneFirst - 2;

// Uniform [0,1) from two raw mt19937 words, low word first. Rows depend only
// on the engine output, never on the library's distribution classes.
class UnitDraw {
public:
    explicit UnitDraw(uint32_t seed) : rng_(seed) {}

    double operator()() {
        const double lo = static_cast<double>(rng_());
        const double hi = static_cast<double>(rng_());
        const double r = (lo + hi * 4294967296.0) / 18446744073709551616.0;
        return r < 1.0 ? r : std::nextafter(1.0, 0.0);
    }

private:
    std::mt19937 rng_;
};

void requireCount(size_t count) {
    if (count == 0) {
        throw AcMap::ConfigurationException("Sample count must be at least 1");
    }
}
} // namespace

CorrelatedSampleProvider::CorrelatedSampleProvider(size_t dimensions, size_t count, uint32_t seed)
    : dimensions_(dimensions), count_(count), seed_(seed) {
    if (dimensions_ < kMinDimensions) {
        throw AcMap::ConfigurationException("Correlated samples need an input vector size of at least " +
                                            std::to_string(kMinDimensions) + ", got " + std::to_string(dimensions_));
    }
    requireCount(count_);
}

std::vector<std::string> CorrelatedSampleProvider::labelsFor(size_t dimensions) {
    static const std::vector<std::string> kFixed = {
        "R1", "2xR1", "R1+0.1", "R1^2", "2*R1^2", "3xR1^2", "R2>0.9", "R3>0.9", "R4>0.9", "R5>0.9"
    };
    std::vector<std::string> labels(kFixed.begin(), kFixed.begin() + static_cast<long>(std::min(dimensions, kFixed.size())));
    for (size_t j = kFixed.size(); j < dimensions; ++j) {
        labels.push_back("R" + std::to_string(j - kNoiseLabelOffset));
    }
    return labels;
}

SampleSet CorrelatedSampleProvider::provide() const {
    UnitDraw unit(seed_);

    SampleSet set;
    set.labels = labelsFor(dimensions_);
    set.rows.reserve(count_);
    const size_t nearOneEnd = std::min(dimensions_, kNearOneLast);

    for (size_t r = 0; r < count_; ++r) {
        std::vector<double> v(dimensions_, 0.0);
        v[0] = unit();
        v[1] = v[0] * 2;
        v[2] = v[0] + 0.1;
        v[3] = v[0] * v[0];
        v[4] = v[0] * v[0] * 2;
        v[5] = v[0] * v[0] * 3;
        for (size_t j = kNearOneFirst; j < nearOneEnd; ++j) {
            v[j] = unit() * 0.1 + 0.9;
        }
        for (size_t j = kNearOneLast; j < dimensions_; ++j) {
            v[j] = unit();
        }
        set.rows.push_back(std::move(v));
    }
    return set;
}

RandomSampleProvider::RandomSampleProvider(size_t dimensions, size_t count, uint32_t seed)
    : dimensions_(dimensions), count_(count), seed_(seed) {
    if (dimensions_ < kMinDimensions) {
        throw AcMap::ConfigurationException("Random samples need an input vector size of at least " +
                                            std::to_string(kMinDimensions) + ", got " + std::to_string(dimensions_));
    }
    requireCount(count_);
}

std::vector<std::string> RandomSampleProvider::labelsFor(size_t dimensions) {
    std::vector<std::string> labels;
    labels.reserve(dimensions);
    for (size_t j = 0; j < dimensions; ++j) labels.push_back("R" + std::to_string(j));
    return labels;
}

SampleSet RandomSampleProvider::provide() const {
    UnitDraw unit(seed_);

    SampleSet set;
    set.labels = labelsFor(dimensions_);
    set.rows.assign(count_, std::vector<double>(dimensions_, 0.0));
    for (auto& row : set.rows) {
        for (double& x : row) x = unit();
    }
    return set;
}
