#pragma once

#include "ProxyComputer.h"

#include <cstddef>
#include <vector>

struct GateSeries {
    std::vector<double> g;
    // Derivative of g with respect to sample index.
    std::vector<double> dGdt;

    size_t size() const { return g.size(); }
};

class GateProductEngine {
public:
    static constexpr size_t kMinSeriesLength = 2;

    /**
     * @brief Scalar gate product (1 - z) * sigma.
     */
    static double gateProduct(double z, double sigma) { return (1.0 - z) * sigma; }

    /**
     * @brief Elementwise gate product and its index gradient.
     * @throws Sandy::InsufficientDataException when fewer than kMinSeriesLength samples are given.
     * @throws Sandy::ValidationException when z and sigma differ in length.
     */
    static GateSeries compute(const ProxySeries& proxies);
};
