#pragma once

#include <cstddef>
#include <vector>

namespace StatsUtils {
struct FiniteRange {
    double min = 0.0;
    double max = 0.0;
    size_t finiteCount = 0;
};

double percentileSorted(const std::vector<double>& sorted, double q);

// q in [0,1]; NaN when no finite value is present.
double finitePercentile(const std::vector<double>& values, double q);

FiniteRange finiteRange(const std::vector<double>& values);

/**
 * @brief Numerical gradient with unit spacing.
 * @pre values.size() >= 2.
 * @post Central differences in the interior, one-sided first-order differences at both ends.
 */
std::vector<double> gradient(const std::vector<double>& values);
}
