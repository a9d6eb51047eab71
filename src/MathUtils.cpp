#include "MathUtils.h"
#include "AcMapExceptions.h"
#include "CommonUtils.h"

#include <cmath>
#include <string>

std::optional<MathUtils::Range> MathUtils::minMax(const std::vector<double>& values) {
    if (values.empty()) return std::nullopt;
    Range r{values.front(), values.front()};
    for (double v : values) {
        if (v < r.min) r.min = v;
        if (v > r.max) r.max = v;
    }
    return r;
}

void MathUtils::rescaleToUnitInterval(const std::vector<double>& raw, std::vector<double>& out) {
    if (raw.empty()) {
        throw AcMap::PreconditionException("Training sample is empty");
    }
    if (const auto bad = firstNonFinite(raw.data(), raw.size())) {
        throw AcMap::PreconditionException("Training sample holds non-finite value at index " +
                                           std::to_string(*bad) + ": " + CommonUtils::joinVector(raw));
    }

    const Range r = *minMax(raw);
    const double span = r.max - r.min;
    if (!(span > 0.0)) {
        throw AcMap::PreconditionException("Training sample is constant (min == max == " +
                                           CommonUtils::formatShortest(r.min) + "), cannot rescale: " +
                                           CommonUtils::joinVector(raw));
    }
    if (!std::isfinite(span)) {
        throw AcMap::PreconditionException("Training sample range overflows: " + CommonUtils::joinVector(raw));
    }

    out.resize(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        out[i] = (raw[i] - r.min) / span;
    }

    for (double v : out) {
        if (v < 0.0) {
            throw AcMap::PreconditionException("Training sample holds data <0: " + CommonUtils::joinVector(out));
        }
        if (v > 1.0) {
            throw AcMap::PreconditionException("Training sample holds data >1: " + CommonUtils::joinVector(out));
        }
    }
}

std::vector<double> MathUtils::rescaleToUnitInterval(const std::vector<double>& raw) {
    std::vector<double> out;
    rescaleToUnitInterval(raw, out);
    return out;
}

std::optional<size_t> MathUtils::firstNonFinite(const double* values, size_t count) {
    for (size_t i = 0; i < count; ++i) {
        if (!std::isfinite(values[i])) return i;
    }
    return std::nullopt;
}

double MathUtils::sum(const std::vector<double>& values) {
    double total = 0.0;
    for (double v : values) total += v;
    return total;
}
