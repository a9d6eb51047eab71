#pragma once
#include <cstddef>
#include <optional>
#include <vector>

class MathUtils {
public:
    struct Range {
        double min = 0.0;
        double max = 0.0;
    };

    /**
     * @brief Finds minimum and maximum of a vector in one pass.
     * @post Returns std::nullopt for an empty vector.
     */
    static std::optional<Range> minMax(const std::vector<double>& values);

    /**
     * @brief Linearly maps values so that min -> 0 and max -> 1.
     * @pre raw is non-empty, finite, and not constant.
     * @post out.size() == raw.size() and every entry lies in [0,1].
     * @throws AcMap::PreconditionException when raw is empty, constant, holds
     *         a non-finite value, or the rescaled result leaves [0,1].
     */
    static void rescaleToUnitInterval(const std::vector<double>& raw, std::vector<double>& out);

    static std::vector<double> rescaleToUnitInterval(const std::vector<double>& raw);

    /**
     * @brief Returns index of first non-finite value, or std::nullopt if all finite.
     */
    static std::optional<size_t> firstNonFinite(const double* values, size_t count);

    static double sum(const std::vector<double>& values);
};
