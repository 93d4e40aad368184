#include "PhaseClassifier.h"

PhaseLabel PhaseClassifier::classify(double z, double sigma) {
    if (z < kDeadZoneMaxZ) return PhaseLabel::DeadZone;
    if (z > kDangerZoneMinZ && sigma < kDangerZoneMaxSigma) return PhaseLabel::DangerZone;
    return PhaseLabel::SafeZone;
}

std::vector<PhaseLabel> PhaseClassifier::classify(const ProxySeries& proxies) {
    std::vector<PhaseLabel> out;
    out.reserve(proxies.size());
    for (size_t i = 0; i < proxies.z.size() && i < proxies.sigma.size(); ++i) {
        out.push_back(classify(proxies.z[i], proxies.sigma[i]));
    }
    return out;
}

std::string PhaseClassifier::name(PhaseLabel label) {
    switch (label) {
        case PhaseLabel::DeadZone: return "DeadZone";
        case PhaseLabel::DangerZone: return "DangerZone";
        case PhaseLabel::SafeZone: return "SafeZone";
    }
    return "SafeZone";
}

std::string PhaseClassifier::title(PhaseLabel label) {
    switch (label) {
        case PhaseLabel::DeadZone: return "Dead Zone";
        case PhaseLabel::DangerZone: return "Danger Zone (Phase III Risk)";
        case PhaseLabel::SafeZone: return "Safe Zone (Phase II - False Freedom)";
    }
    return "Safe Zone (Phase II - False Freedom)";
}

std::string PhaseClassifier::interpretation(PhaseLabel label) {
    switch (label) {
        case PhaseLabel::DeadZone:
            return "Low confinement. Energy escapes freely. No sustained structure or gain is possible.";
        case PhaseLabel::DangerZone:
            return "High confinement with insufficient entropy export. Stress accumulation likely. "
                   "Breakout or disruption imminent.";
        case PhaseLabel::SafeZone:
            return "High confinement with controlled entropy flow. System remains stable without stress accumulation.";
    }
    return "";
}
