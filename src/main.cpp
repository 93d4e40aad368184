#include "Dataset.h"
#include "DiagnosticConfig.h"
#include "DiagnosticExport.h"
#include "DiagnosticPipeline.h"
#include "GnuplotEngine.h"
#include "ProxyComputer.h"
#include "ReportEngine.h"
#include "SandyExceptions.h"
#include "TerminalUI.h"
#include "WebDashboard.h"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {
struct PlotPaths {
    std::string operatingMap;
    std::string timeSeries;
};

std::string fmt(double v, int precision) {
    if (!std::isfinite(v)) return "n/a";
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision) << v;
    return out.str();
}

PlotPaths renderPlots(const DiagnosticConfig& config, const DiagnosticReport& report) {
    PlotPaths paths;
    GnuplotEngine plotter(config.assetsDir, config.plot);
    if (!plotter.isAvailable()) {
        std::cout << "[Sandy Warning] gnuplot not found in PATH; skipping plots.\n";
        return paths;
    }

    GnuplotEngine::OperatingMapData map;
    map.square = report.square;
    if (report.hasSeries()) {
        map.z = report.proxies.z;
        map.sigma = report.proxies.sigma;
        map.phase0Flag = report.phase0.phase0Flag;
    }
    if (report.manual) map.manualPoint = std::make_pair(report.manual->z, report.manual->sigma);
    paths.operatingMap = plotter.operatingMap("operating_map", map, "Z-Sigma Operating Map (" + report.systemType + ")");

    if (report.hasSeries()) {
        paths.timeSeries = plotter.multiLine("gate_product_series",
                                             report.time,
                                             {report.gate.g, report.gate.dGdt},
                                             {"G", "dG/dt"},
                                             "Gate Product over Time",
                                             "time",
                                             "G, dG/dt");
    }
    return paths;
}

void writeMarkdownReport(const DiagnosticConfig& config, const DiagnosticReport& report, const PlotPaths& plots) {
    ReportEngine doc;
    doc.addTitle("Sandy's Law Diagnostic Report");
    doc.addParagraph("System: **" + report.systemType + "**" +
                     (config.datasetPath.empty() ? std::string() : "  \nDataset: `" + config.datasetPath + "`"));

    const SandySquare& sq = report.square;
    doc.addTable("Configuration",
                 {"Setting", "Value"},
                 {{"Sandy Square Z", "[" + fmt(sq.zMin, 2) + ", " + fmt(sq.zMax, 2) + "]"},
                  {"Sandy Square Sigma", "[" + fmt(sq.sigmaMin, 2) + ", " + fmt(sq.sigmaMax, 2) + "]"},
                  {"d_crit", fmt(report.dCrit, 4)},
                  {"dG/dt percentile", fmt(report.percentile, 1)},
                  {"epsilon", std::to_string(report.epsilon)}});

    if (report.manual) {
        const ManualReading& m = *report.manual;
        doc.addTable("Manual Reading",
                     {"Z", "Sigma", "G", "Phase"},
                     {{fmt(m.z, 2), fmt(m.sigma, 2), fmt(m.gateProduct, 4), PhaseClassifier::title(m.phase)}});
        doc.addParagraph("> " + PhaseClassifier::interpretation(m.phase));
    }

    if (report.hasSeries()) {
        const Phase0Report& p0 = report.phase0;
        doc.addTable("Batch Summary",
                     {"Metric", "Value"},
                     {{"Samples", std::to_string(report.sampleCount())},
                      {"Min distance to wall", fmt(p0.minDistance, 4)},
                      {"Max dG/dt", fmt(p0.maxSlope, 4)},
                      {"dG_crit", fmt(p0.dGCrit, 4)},
                      {"Phase-0 samples", std::to_string(p0.flaggedCount)},
                      {"Non-finite samples", std::to_string(report.nonFiniteCount)}});
        doc.addParagraph(p0.flaggedCount > 0
                             ? "**Phase-0 early warning** raised on " + std::to_string(p0.flaggedCount) + " sample(s)."
                             : "No Phase-0 early warning in this batch.");
    }

    if (!report.warnings.empty()) {
        doc.addSection("Warnings");
        std::vector<std::string> items;
        for (const auto& w : report.warnings) items.push_back("`" + w.code + "`: " + w.message);
        doc.addBullets(items);
    }

    if (!plots.operatingMap.empty()) doc.addImage("Operating Map", plots.operatingMap);
    if (!plots.timeSeries.empty()) doc.addImage("Gate Product Series", plots.timeSeries);

    if (report.hasSeries()) {
        const Phase0Report& p0 = report.phase0;
        std::vector<std::vector<std::string>> rows;
        rows.reserve(report.sampleCount());
        for (size_t i = 0; i < report.sampleCount(); ++i) {
            rows.push_back({fmt(report.time[i], 4),
                            fmt(report.proxies.z[i], 4),
                            fmt(report.proxies.sigma[i], 4),
                            fmt(report.gate.g[i], 4),
                            fmt(report.gate.dGdt[i], 4),
                            fmt(p0.distanceToWall[i], 4),
                            p0.proximityFlag[i] ? "yes" : "",
                            p0.pressureFlag[i] ? "yes" : "",
                            p0.phase0Flag[i] ? "**PHASE-0**" : "",
                            PhaseClassifier::name(report.zones[i])});
        }
        doc.addTable("Per-Sample Diagnostics",
                     {"time", "Z", "Sigma", "G", "dG/dt", "distance", "proximity", "pressure", "phase-0", "zone"},
                     rows);
    }

    doc.save(config.reportFile);
    std::cout << "[Sandy] Report written to " << config.reportFile << "\n";
}

DiagnosticReport runDiagnostics(const DiagnosticConfig& config) {
    const DiagnosticPipeline pipeline(config.pipelineSettings());

    if (config.datasetPath.empty()) {
        return pipeline.runManual(*config.manualZ, *config.manualSigma);
    }

    Dataset dataset(config.datasetPath);
    dataset.setDelimiter(config.delimiter);
    dataset.load(config.skipMalformed);
    if (config.verbose) dataset.printSummary();

    const InputMode mode = config.mode();
    const auto& numeric = (mode == InputMode::PROXY) ? ProxyComputer::proxyColumns() : Batch::requiredColumns();
    std::cout << "[Sandy] Running " << (mode == InputMode::PROXY ? "proxy" : "raw") << "-mode diagnostics on "
              << dataset.getRowCount() << " row(s)...\n";

    DiagnosticReport report = pipeline.runColumns(dataset.columnMap(numeric), mode);
    if (config.hasManualPoint()) {
        report.manual = DiagnosticPipeline::manualReading(*config.manualZ, *config.manualSigma);
    }
    return report;
}
} // namespace

int main(int argc, char* argv[]) {
    DiagnosticConfig config;
    try {
        config = DiagnosticConfig::fromArgs(argc, argv);
    } catch (const Sandy::SandyException& e) {
        std::cerr << "[Sandy Error] " << e.what() << "\n";
        std::cout << DiagnosticConfig::usage(argv[0]);
        return 1;
    }

    if (config.showHelp) {
        std::cout << DiagnosticConfig::usage(argv[0]);
        return 0;
    }

    if (config.serve) {
        WebDashboard dashboard;
        return dashboard.start(config);
    }

    try {
        const DiagnosticReport report = runDiagnostics(config);

        if (report.manual) TerminalUI::printManualPanel(*report.manual, report.systemType);
        if (report.hasSeries()) {
            TerminalUI::printBatchSummary(report);
            if (config.verbose) TerminalUI::printPhase0Samples(report);
        }
        TerminalUI::printWarnings(report);

        PlotPaths plots;
        if (config.plots) plots = renderPlots(config, report);
        if (config.generateReport) writeMarkdownReport(config, report, plots);

        if (!config.outputFile.empty()) {
            DiagnosticExport::writeFile(config.outputFile, report);
            std::cout << "[Sandy] Exported results to " << config.outputFile << "\n";
        }
    } catch (const Sandy::SandyException& e) {
        std::cerr << "[Sandy Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Sandy Exception] " << e.what() << "\n";
        return 1;
    }

    return 0;
}
