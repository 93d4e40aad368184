#pragma once

#include "GateProductEngine.h"
#include "ProxyComputer.h"
#include "SandySquare.h"

#include <cstddef>
#include <vector>

struct Phase0Settings {
    SandySquare square;
    // Proximity band: a sample closer than this to any wall is flagged.
    double dCrit = 0.05;
    // Percentile (0,100] of the batch's own dG/dt used as the pressure threshold.
    double percentile = 90.0;
};

struct Phase0Report {
    std::vector<double> distanceToWall;
    std::vector<bool> proximityFlag;
    std::vector<bool> pressureFlag;
    std::vector<bool> phase0Flag;

    double minDistance = 0.0;
    double maxSlope = 0.0;
    size_t flaggedCount = 0;

    // Thresholds actually applied to this batch.
    double dCrit = 0.0;
    double dGCrit = 0.0;

    size_t size() const { return distanceToWall.size(); }
};

class Phase0Detector {
public:
    explicit Phase0Detector(Phase0Settings settings = Phase0Settings{});

    /**
     * @brief Flags samples that sit near the Sandy Square walls or whose gate product rises unusually fast.
     * @pre proxies and gate come from the same batch.
     * @post distanceToWall is signed and never clamped; phase0Flag = proximity OR pressure.
     * @throws Sandy::ValidationException when proxies and gate differ in length.
     */
    Phase0Report evaluate(const ProxySeries& proxies, const GateSeries& gate) const;

    /**
     * @brief Percentile of the finite dG/dt values (linear interpolation); NaN when none are finite.
     */
    static double slopeThreshold(const std::vector<double>& dGdt, double percentile);

private:
    Phase0Settings settings_;
};
