#include "DiagnosticPipeline.h"
#include "GateProductEngine.h"
#include "Phase0Detector.h"
#include "PhaseClassifier.h"
#include "ProxyComputer.h"
#include "SandyExceptions.h"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace {
void requireSeriesLength(size_t n) {
    if (n < GateProductEngine::kMinSeriesLength) {
        throw Sandy::InsufficientDataException("series mode needs at least " +
                                               std::to_string(GateProductEngine::kMinSeriesLength) +
                                               " rows, got " + std::to_string(n));
    }
}

std::string formatRange(double value) {
    std::ostringstream out;
    out << std::setprecision(3) << std::scientific << value;
    return out.str();
}

std::vector<double> indexAxis(size_t n) {
    std::vector<double> axis(n);
    for (size_t i = 0; i < n; ++i) axis[i] = static_cast<double>(i);
    return axis;
}
}

DiagnosticPipeline::DiagnosticPipeline(PipelineSettings settings) : settings_(std::move(settings)) {}

ManualReading DiagnosticPipeline::manualReading(double z, double sigma) {
    ManualReading reading;
    reading.z = z;
    reading.sigma = sigma;
    reading.gateProduct = GateProductEngine::gateProduct(z, sigma);
    reading.phase = PhaseClassifier::classify(z, sigma);
    return reading;
}

DiagnosticReport DiagnosticPipeline::emptyReport() const {
    DiagnosticReport report;
    report.systemType = settings_.systemType;
    report.square = settings_.square;
    report.dCrit = settings_.dCrit;
    report.epsilon = settings_.epsilon;
    report.percentile = settings_.percentile;
    return report;
}

DiagnosticReport DiagnosticPipeline::runManual(double z, double sigma) const {
    DiagnosticReport report = emptyReport();
    report.manual = manualReading(z, sigma);
    return report;
}

DiagnosticReport DiagnosticPipeline::run(const Batch& batch) const {
    requireSeriesLength(batch.size());

    ProxySettings proxySettings;
    proxySettings.epsilon = settings_.epsilon;
    proxySettings.degenerateRangeTolerance = settings_.degenerateRangeTolerance;

    DiagnosticReport report = emptyReport();
    report.time = batch.time();
    report.proxies = ProxyComputer(proxySettings).compute(batch);

    if (report.proxies.h98Degenerate) {
        report.warnings.push_back({WarningCodes::kDegenerateH98,
                                   "H98y2 range " + formatRange(report.proxies.h98Range) +
                                   " is degenerate; Z is dominated by the epsilon guard"});
    }
    if (report.proxies.sigmaDegenerate) {
        report.warnings.push_back({WarningCodes::kDegenerateSigma,
                                   "Sigma_raw range " + formatRange(report.proxies.sigmaRawRange) +
                                   " is degenerate; Sigma is dominated by the epsilon guard"});
    }

    finishSeries(report);
    return report;
}

DiagnosticReport DiagnosticPipeline::runProxies(const std::vector<double>& time, const ProxySeries& proxies) const {
    if (proxies.z.size() != proxies.sigma.size()) {
        throw Sandy::ValidationException("Z_proxy and Sigma_proxy differ in length");
    }
    requireSeriesLength(proxies.size());
    if (!time.empty() && time.size() != proxies.size()) {
        throw Sandy::ValidationException("time axis has " + std::to_string(time.size()) + " rows, expected " +
                                         std::to_string(proxies.size()));
    }

    DiagnosticReport report = emptyReport();
    report.time = time.empty() ? indexAxis(proxies.size()) : time;
    report.proxies = proxies;
    finishSeries(report);
    return report;
}

DiagnosticReport DiagnosticPipeline::runColumns(const ColumnMap& columns, InputMode mode) const {
    if (mode == InputMode::PROXY) {
        ProxySeries proxies = ProxyComputer::fromProxyColumns(columns);
        const auto timeIt = columns.find("time");
        const std::vector<double> time = (timeIt != columns.end()) ? timeIt->second : std::vector<double>{};
        return runProxies(time, proxies);
    }
    return run(Batch::fromColumns(columns));
}

void DiagnosticPipeline::finishSeries(DiagnosticReport& report) const {
    report.gate = GateProductEngine::compute(report.proxies);

    Phase0Settings phase0Settings;
    phase0Settings.square = settings_.square;
    phase0Settings.dCrit = settings_.dCrit;
    phase0Settings.percentile = settings_.percentile;
    report.phase0 = Phase0Detector(phase0Settings).evaluate(report.proxies, report.gate);
    report.zones = PhaseClassifier::classify(report.proxies);

    size_t nonFinite = 0;
    for (size_t i = 0; i < report.gate.size(); ++i) {
        if (!std::isfinite(report.proxies.z[i]) || !std::isfinite(report.proxies.sigma[i]) ||
            !std::isfinite(report.gate.g[i]) || !std::isfinite(report.gate.dGdt[i])) {
            ++nonFinite;
        }
    }
    report.nonFiniteCount = nonFinite;
    if (nonFinite > 0) {
        report.warnings.push_back({WarningCodes::kNonFinite,
                                   std::to_string(nonFinite) + " of " + std::to_string(report.gate.size()) +
                                   " samples carry non-finite values (check P_input for zeros)"});
    }
}
