#pragma once

#include "Batch.h"
#include "DiagnosticReport.h"
#include "SandySquare.h"

#include <string>
#include <vector>

enum class InputMode { RAW, PROXY };

struct PipelineSettings {
    SandySquare square;
    double dCrit = 0.05;
    double percentile = 90.0;
    double epsilon = 1e-6;
    double degenerateRangeTolerance = 1e-9;
    std::string systemType = "fusion";
};

namespace WarningCodes {
inline const std::string kDegenerateH98 = "DEGENERATE_RANGE_H98";
inline const std::string kDegenerateSigma = "DEGENERATE_RANGE_SIGMA";
inline const std::string kNonFinite = "NON_FINITE_VALUES";
}

/**
 * Batch -> ProxyComputer -> {GateProductEngine, Phase0Detector} -> DiagnosticReport.
 * Stateless between calls; each run recomputes every series and threshold from its own input.
 */
class DiagnosticPipeline {
public:
    explicit DiagnosticPipeline(PipelineSettings settings = PipelineSettings{});

    /**
     * @brief Series mode over raw observables.
     * @throws Sandy::InsufficientDataException for batches shorter than two rows.
     */
    DiagnosticReport run(const Batch& batch) const;

    /**
     * @brief Series mode over already-normalized Z/Sigma proxies.
     * @param time Optional time axis; when empty, the sample index is used.
     */
    DiagnosticReport runProxies(const std::vector<double>& time, const ProxySeries& proxies) const;

    /**
     * @brief Validates and dispatches a named-column table according to the input mode.
     * @throws Sandy::ValidationException for missing columns before any computation starts.
     */
    DiagnosticReport runColumns(const ColumnMap& columns, InputMode mode) const;

    /**
     * @brief Manual (scalar) mode: gate product and phase label for one point.
     */
    DiagnosticReport runManual(double z, double sigma) const;

    static ManualReading manualReading(double z, double sigma);

private:
    PipelineSettings settings_;

    DiagnosticReport emptyReport() const;
    void finishSeries(DiagnosticReport& report) const;
};
