#pragma once

#include "ProxyComputer.h"

#include <string>
#include <vector>

enum class PhaseLabel { DeadZone, DangerZone, SafeZone };

class PhaseClassifier {
public:
    static constexpr double kDeadZoneMaxZ = 0.3;
    static constexpr double kDangerZoneMinZ = 0.7;
    static constexpr double kDangerZoneMaxSigma = 0.15;

    /**
     * @brief Labels a single (z, sigma) point.
     * Precedence: z < 0.3 is DeadZone regardless of sigma; then z > 0.7 with sigma < 0.15 is
     * DangerZone; everything else is SafeZone.
     */
    static PhaseLabel classify(double z, double sigma);

    static std::vector<PhaseLabel> classify(const ProxySeries& proxies);

    // Identifier form, e.g. "DangerZone".
    static std::string name(PhaseLabel label);
    // Display form, e.g. "Danger Zone (Phase III Risk)".
    static std::string title(PhaseLabel label);
    static std::string interpretation(PhaseLabel label);
};
