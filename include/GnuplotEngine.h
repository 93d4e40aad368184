#pragma once
#include "DiagnosticConfig.h"
#include "SandySquare.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

class GnuplotEngine {
public:
    struct OperatingMapData {
        // Trajectory in (Z, Sigma); may be empty for a manual-only map.
        std::vector<double> z;
        std::vector<double> sigma;
        std::vector<bool> phase0Flag;
        std::optional<std::pair<double, double>> manualPoint;
        SandySquare square;
    };

    static const std::vector<double>& gateContourLevels();

    /**
     * @brief Initializes plotting backend and asset directory.
     * @post assets directory is created if possible.
     */
    GnuplotEngine(std::string assetsDir, PlotConfig cfg);

    /**
     * @brief Checks whether gnuplot executable is available in PATH.
     */
    bool isAvailable() const;

    /**
     * @brief Renders the Z-Sigma operating map: shaded zones, the Sandy Square outline,
     * constant-G contours, the trajectory with Phase-0 samples highlighted, and the manual point.
     * @post Returns output image path, or empty string on generation failure.
     */
    std::string operatingMap(const std::string& id, const OperatingMapData& map, const std::string& title);

    /**
     * @brief Generates multi-series line plot image sharing the same x-axis.
     * Non-finite samples are written as gaps.
     */
    std::string multiLine(const std::string& id,
                          const std::vector<double>& x,
                          const std::vector<std::vector<double>>& series,
                          const std::vector<std::string>& labels,
                          const std::string& title,
                          const std::string& xLabel = "Time",
                          const std::string& yLabel = "Value");

private:
    std::string assetsDir_;
    PlotConfig cfg_;

    static std::string sanitizeId(const std::string& id);
    static std::string quoteForGnuplot(const std::string& value);
    static std::string terminalForFormat(const std::string& format, int width, int height);
    std::string styledHeader(const std::string& id, const std::string& title) const;
    std::string runScript(const std::string& id, const std::string& dataContent, const std::string& scriptContent);
};
