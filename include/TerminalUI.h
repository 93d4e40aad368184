#pragma once
#include "DiagnosticReport.h"

#include <cstddef>

class TerminalUI {
public:
    // Manual mode: Z and Sigma to 2dp, G to 4dp, zone title and interpretation.
    static void printManualPanel(const ManualReading& reading, const std::string& systemType);

    static void printBatchSummary(const DiagnosticReport& report);
    static void printWarnings(const DiagnosticReport& report);

    // Verbose listing of Phase-0 samples, capped at maxRows.
    static void printPhase0Samples(const DiagnosticReport& report, size_t maxRows = 25);
};
