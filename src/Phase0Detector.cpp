#include "Phase0Detector.h"
#include "SandyExceptions.h"
#include "StatsUtils.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <omp.h>

Phase0Detector::Phase0Detector(Phase0Settings settings) : settings_(settings) {}

double Phase0Detector::slopeThreshold(const std::vector<double>& dGdt, double percentile) {
    return StatsUtils::finitePercentile(dGdt, percentile / 100.0);
}

Phase0Report Phase0Detector::evaluate(const ProxySeries& proxies, const GateSeries& gate) const {
    const size_t n = proxies.size();
    if (proxies.sigma.size() != n || gate.dGdt.size() != n) {
        throw Sandy::ValidationException("phase-0 inputs are not aligned: " + std::to_string(n) + " proxy samples, " +
                                         std::to_string(gate.dGdt.size()) + " slope samples");
    }

    Phase0Report report;
    report.dCrit = settings_.dCrit;
    report.dGCrit = slopeThreshold(gate.dGdt, settings_.percentile);
    report.distanceToWall.assign(n, 0.0);

    const SandySquare& square = settings_.square;
    #pragma omp parallel for
    for (long long i = 0; i < static_cast<long long>(n); ++i) {
        const size_t r = static_cast<size_t>(i);
        report.distanceToWall[r] = square.distanceToWall(proxies.z[r], proxies.sigma[r]);
    }

    report.proximityFlag.assign(n, false);
    report.pressureFlag.assign(n, false);
    report.phase0Flag.assign(n, false);

    const double nan = std::numeric_limits<double>::quiet_NaN();
    double minDistance = nan;
    double maxSlope = nan;
    for (size_t i = 0; i < n; ++i) {
        const double d = report.distanceToWall[i];
        const double slope = gate.dGdt[i];

        // NaN compares false on both tests, so non-finite samples are never flagged.
        report.proximityFlag[i] = d < settings_.dCrit;
        report.pressureFlag[i] = slope > report.dGCrit;
        report.phase0Flag[i] = report.proximityFlag[i] || report.pressureFlag[i];
        if (report.phase0Flag[i]) ++report.flaggedCount;

        if (std::isfinite(d)) minDistance = std::isnan(minDistance) ? d : std::min(minDistance, d);
        if (std::isfinite(slope)) maxSlope = std::isnan(maxSlope) ? slope : std::max(maxSlope, slope);
    }
    report.minDistance = minDistance;
    report.maxSlope = maxSlope;
    return report;
}
