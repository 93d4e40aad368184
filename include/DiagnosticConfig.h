#pragma once
#include "DiagnosticPipeline.h"
#include "SandySquare.h"

#include <cstddef>
#include <optional>
#include <string>

struct PlotConfig {
    std::string format = "png";
    std::string theme = "light";
    int width = 1280;
    int height = 720;
    double pointSize = 1.2;
    double lineWidth = 2.0;
    bool showGrid = true;
};

struct DashboardConfig {
    std::string host = "127.0.0.1";
    int port = 8090;
    size_t threads = 4;
};

struct DiagnosticConfig {
    std::string datasetPath;
    std::string reportFile = "sandy_report.md";
    std::string assetsDir = "sandy_report_assets";
    std::string outputFile; // .json or .csv export, optional
    char delimiter = ',';
    bool skipMalformed = true;
    std::string inputMode = "raw";     // raw|proxy
    std::string systemType = "fusion"; // fusion|stellar|generic

    // Manual (scalar) mode; both must be set together.
    std::optional<double> manualZ;
    std::optional<double> manualSigma;

    SandySquare square;
    double dCrit = 0.05;
    double percentile = 90.0;
    double epsilon = 1e-6;
    double degenerateRangeTolerance = 1e-9;

    bool generateReport = true;
    bool plots = true;
    bool verbose = false;
    bool serve = false;
    bool showHelp = false;

    PlotConfig plot;
    DashboardConfig dashboard;

    /**
     * @brief Builds config from CLI args, merged over an optional --config file.
     * @post Returns a validated config object.
     * @throws Sandy::ConfigurationException on invalid arguments or values.
     */
    static DiagnosticConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads `key: value` lines (loose YAML / JSON-ish) on top of `base`.
     * @throws Sandy::ConfigurationException on unknown keys or invalid values.
     */
    static DiagnosticConfig fromFile(const std::string& configPath, const DiagnosticConfig& base);

    /**
     * @brief Applies one setting by its config-file key (e.g. "d_crit").
     * @throws Sandy::ConfigurationException on unknown keys or invalid values.
     */
    static void assign(DiagnosticConfig& config, const std::string& key, const std::string& value);

    /**
     * @throws Sandy::ConfigurationException on inconsistent values.
     */
    void validate() const;

    bool hasManualPoint() const { return manualZ.has_value() && manualSigma.has_value(); }
    InputMode mode() const { return inputMode == "proxy" ? InputMode::PROXY : InputMode::RAW; }
    PipelineSettings pipelineSettings() const;

    static std::string usage(const std::string& prog);
};
