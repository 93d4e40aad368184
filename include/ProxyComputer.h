#pragma once

#include "Batch.h"
#include "StatsUtils.h"

#include <cstddef>
#include <vector>

struct ProxySettings {
    // Added to every min-max denominator so a constant column normalizes to zero instead of NaN.
    double epsilon = 1e-6;
    // Raw ranges at or below this are reported as degenerate.
    double degenerateRangeTolerance = 1e-9;
};

struct ProxySeries {
    std::vector<double> z;
    std::vector<double> sigma;

    // Raw spans behind each normalization (NaN when the column has no finite value).
    double h98Range = 0.0;
    double sigmaRawRange = 0.0;
    bool h98Degenerate = false;
    bool sigmaDegenerate = false;

    size_t size() const { return z.size(); }
};

class ProxyComputer {
public:
    static constexpr double kRadiatedFractionWeight = 0.5;
    static constexpr double kElmFrequencyWeight = 0.4;
    static constexpr double kElmEnergyWeight = 0.3;

    explicit ProxyComputer(ProxySettings settings = ProxySettings{});

    /**
     * @brief Derives the normalized confinement (Z) and entropy-export (Sigma) proxies.
     * @post Output has batch.size() entries in batch order.
     * @post Non-finite radiated fractions (P_input == 0) stay non-finite in Sigma.
     */
    ProxySeries compute(const Batch& batch) const;

    /**
     * @brief Sigma_raw = 0.5 * P_rad/P_input + 0.4 * f_ELM - 0.3 * DeltaW_ELM, elementwise.
     */
    static std::vector<double> entropyExportRaw(const Batch& batch);

    /**
     * @brief Min-max normalization (v - min) / (max - min + epsilon).
     * The extremes are taken over finite entries only; non-finite entries map to non-finite output.
     */
    static std::vector<double> normalize(const std::vector<double>& values,
                                         double epsilon,
                                         StatsUtils::FiniteRange* rangeOut = nullptr);

    /**
     * @brief Wraps precomputed Z_proxy / Sigma_proxy columns without renormalizing them.
     * @throws Sandy::ValidationException if either column is missing or lengths differ.
     */
    static ProxySeries fromProxyColumns(const ColumnMap& columns);

    static const std::vector<std::string>& proxyColumns();

private:
    ProxySettings settings_;
};
