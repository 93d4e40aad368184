#include "ProxyComputer.h"
#include "SandyExceptions.h"

#include <cmath>
#include <limits>
#include <omp.h>

namespace {
bool isDegenerate(const StatsUtils::FiniteRange& range, double tolerance) {
    if (range.finiteCount == 0) return false;
    return (range.max - range.min) <= tolerance;
}

double spanOf(const StatsUtils::FiniteRange& range) {
    if (range.finiteCount == 0) return std::numeric_limits<double>::quiet_NaN();
    return range.max - range.min;
}
}

ProxyComputer::ProxyComputer(ProxySettings settings) : settings_(settings) {}

std::vector<double> ProxyComputer::normalize(const std::vector<double>& values,
                                             double epsilon,
                                             StatsUtils::FiniteRange* rangeOut) {
    const StatsUtils::FiniteRange range = StatsUtils::finiteRange(values);
    if (rangeOut) *rangeOut = range;

    const size_t n = values.size();
    std::vector<double> out(n, std::numeric_limits<double>::quiet_NaN());
    if (range.finiteCount == 0) return out;

    const double denom = (range.max - range.min) + epsilon;
    #pragma omp parallel for
    for (long long i = 0; i < static_cast<long long>(n); ++i) {
        out[static_cast<size_t>(i)] = (values[static_cast<size_t>(i)] - range.min) / denom;
    }
    return out;
}

std::vector<double> ProxyComputer::entropyExportRaw(const Batch& batch) {
    const size_t n = batch.size();
    const auto& pRad = batch.pRad();
    const auto& pInput = batch.pInput();
    const auto& fElm = batch.fElm();
    const auto& deltaW = batch.deltaWElm();

    std::vector<double> raw(n, 0.0);
    #pragma omp parallel for
    for (long long i = 0; i < static_cast<long long>(n); ++i) {
        const size_t r = static_cast<size_t>(i);
        // IEEE division: P_input == 0 yields +-inf or NaN and is left in place.
        const double fRad = pRad[r] / pInput[r];
        raw[r] = kRadiatedFractionWeight * fRad + kElmFrequencyWeight * fElm[r] - kElmEnergyWeight * deltaW[r];
    }
    return raw;
}

ProxySeries ProxyComputer::compute(const Batch& batch) const {
    ProxySeries out;

    StatsUtils::FiniteRange h98Range;
    out.z = normalize(batch.h98y2(), settings_.epsilon, &h98Range);
    out.h98Range = spanOf(h98Range);
    out.h98Degenerate = isDegenerate(h98Range, settings_.degenerateRangeTolerance);

    StatsUtils::FiniteRange sigmaRange;
    out.sigma = normalize(entropyExportRaw(batch), settings_.epsilon, &sigmaRange);
    out.sigmaRawRange = spanOf(sigmaRange);
    out.sigmaDegenerate = isDegenerate(sigmaRange, settings_.degenerateRangeTolerance);

    return out;
}

const std::vector<std::string>& ProxyComputer::proxyColumns() {
    static const std::vector<std::string> names = {"Z_proxy", "Sigma_proxy"};
    return names;
}

ProxySeries ProxyComputer::fromProxyColumns(const ColumnMap& columns) {
    BatchColumns::requirePresent(columns, proxyColumns());
    BatchColumns::requireAligned(columns, proxyColumns());

    ProxySeries out;
    out.z = columns.at("Z_proxy");
    out.sigma = columns.at("Sigma_proxy");
    out.h98Range = spanOf(StatsUtils::finiteRange(out.z));
    out.sigmaRawRange = spanOf(StatsUtils::finiteRange(out.sigma));
    return out;
}
