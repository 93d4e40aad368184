#include "TerminalUI.h"

#include <cmath>
#include <iomanip>
#include <iostream>

namespace {
const char* kRule = "============================================================================================================\n";

// Restores std::cout flags and precision when a panel finishes.
class CoutStateGuard {
public:
    CoutStateGuard() : flags_(std::cout.flags()), precision_(std::cout.precision()) {}
    ~CoutStateGuard() {
        std::cout.flags(flags_);
        std::cout.precision(precision_);
    }
    CoutStateGuard(const CoutStateGuard&) = delete;
    CoutStateGuard& operator=(const CoutStateGuard&) = delete;

private:
    std::ios::fmtflags flags_;
    std::streamsize precision_;
};

void printNumber(double v, int precision, int width) {
    if (std::isfinite(v)) {
        std::cout << std::setw(width) << std::fixed << std::setprecision(precision) << v;
    } else {
        std::cout << std::setw(width) << "n/a";
    }
}
}

void TerminalUI::printManualPanel(const ManualReading& reading, const std::string& systemType) {
    const CoutStateGuard guard;
    std::cout << "\n============================================ MANUAL DIAGNOSTICS ============================================\n";
    std::cout << "    System: " << systemType << "\n\n";
    std::cout << std::fixed
              << "    Z (confinement)       = " << std::setprecision(2) << reading.z << "\n"
              << "    Sigma (export)        = " << std::setprecision(2) << reading.sigma << "\n"
              << "    Gate product G        = " << std::setprecision(4) << reading.gateProduct << "\n\n";
    std::cout << "    [Phase] " << PhaseClassifier::title(reading.phase) << "\n";
    std::cout << "            " << PhaseClassifier::interpretation(reading.phase) << "\n";
    std::cout << kRule;
}

void TerminalUI::printBatchSummary(const DiagnosticReport& report) {
    const CoutStateGuard guard;
    const Phase0Report& p0 = report.phase0;
    size_t dead = 0;
    size_t danger = 0;
    size_t safe = 0;
    for (PhaseLabel label : report.zones) {
        if (label == PhaseLabel::DeadZone) ++dead;
        else if (label == PhaseLabel::DangerZone) ++danger;
        else ++safe;
    }

    std::cout << "\n============================================= BATCH DIAGNOSTICS ============================================\n";
    std::cout << std::left << std::setw(28) << "Metric" << std::right << std::setw(16) << "Value" << "\n";
    std::cout << std::string(44, '-') << "\n";
    std::cout << std::left << std::setw(28) << "Samples" << std::right << std::setw(16) << report.sampleCount() << "\n";
    std::cout << std::left << std::setw(28) << "Min distance to wall" << std::right;
    printNumber(p0.minDistance, 4, 16);
    std::cout << "\n" << std::left << std::setw(28) << "Max dG/dt" << std::right;
    printNumber(p0.maxSlope, 4, 16);
    std::cout << "\n" << std::left << std::setw(28) << "d_crit" << std::right;
    printNumber(p0.dCrit, 4, 16);
    std::cout << "\n" << std::left << std::setw(28) << "dG_crit (percentile)" << std::right;
    printNumber(p0.dGCrit, 4, 16);
    std::cout << "\n" << std::left << std::setw(28) << "Phase-0 samples" << std::right << std::setw(16) << p0.flaggedCount << "\n";
    std::cout << std::left << std::setw(28) << "Dead / Danger / Safe" << std::right << std::setw(16)
              << (std::to_string(dead) + " / " + std::to_string(danger) + " / " + std::to_string(safe)) << "\n";
    std::cout << kRule;

    if (p0.flaggedCount > 0) {
        std::cout << "[Sandy] Phase-0 early warning raised on " << p0.flaggedCount << " sample(s).\n";
    } else {
        std::cout << "[Sandy] No Phase-0 early warning in this batch.\n";
    }
}

void TerminalUI::printWarnings(const DiagnosticReport& report) {
    for (const auto& w : report.warnings) {
        std::cout << "[Sandy Warning] " << w.code << ": " << w.message << "\n";
    }
}

void TerminalUI::printPhase0Samples(const DiagnosticReport& report, size_t maxRows) {
    const CoutStateGuard guard;
    const Phase0Report& p0 = report.phase0;
    if (p0.flaggedCount == 0) return;

    std::cout << "\n    " << std::left << std::setw(14) << "time" << std::right
              << std::setw(10) << "Z" << std::setw(10) << "Sigma" << std::setw(12) << "distance"
              << std::setw(12) << "dG/dt" << "  trigger\n";
    size_t shown = 0;
    for (size_t i = 0; i < p0.size() && shown < maxRows; ++i) {
        if (!p0.phase0Flag[i]) continue;
        std::cout << "    " << std::left;
        printNumber(report.time[i], 4, 14);
        std::cout << std::right;
        printNumber(report.proxies.z[i], 3, 10);
        printNumber(report.proxies.sigma[i], 3, 10);
        printNumber(p0.distanceToWall[i], 4, 12);
        printNumber(report.gate.dGdt[i], 4, 12);
        std::cout << "  " << (p0.proximityFlag[i] ? "wall" : "")
                  << (p0.proximityFlag[i] && p0.pressureFlag[i] ? "+" : "")
                  << (p0.pressureFlag[i] ? "pressure" : "") << "\n";
        ++shown;
    }
    if (p0.flaggedCount > shown) {
        std::cout << "    ... " << (p0.flaggedCount - shown) << " more\n";
    }
}
