#pragma once

#include "GateProductEngine.h"
#include "Phase0Detector.h"
#include "PhaseClassifier.h"
#include "ProxyComputer.h"
#include "SandySquare.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

struct DiagnosticWarning {
    std::string code;
    std::string message;
};

struct ManualReading {
    double z = 0.0;
    double sigma = 0.0;
    double gateProduct = 0.0;
    PhaseLabel phase = PhaseLabel::SafeZone;
};

// Read-only result of one diagnostic run. Series members are empty for a manual-only run.
struct DiagnosticReport {
    std::string systemType;

    std::vector<double> time;
    ProxySeries proxies;
    GateSeries gate;
    Phase0Report phase0;
    std::vector<PhaseLabel> zones;

    std::optional<ManualReading> manual;

    SandySquare square;
    double dCrit = 0.0;
    double epsilon = 0.0;
    double percentile = 0.0;

    std::vector<DiagnosticWarning> warnings;
    size_t nonFiniteCount = 0;

    bool hasSeries() const { return !gate.g.empty(); }
    size_t sampleCount() const { return gate.g.size(); }
    bool hasWarning(const std::string& code) const {
        for (const auto& w : warnings) {
            if (w.code == code) return true;
        }
        return false;
    }
};
