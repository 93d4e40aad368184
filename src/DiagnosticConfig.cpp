#include "DiagnosticConfig.h"
#include "CommonUtils.h"
#include "SandyExceptions.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <unordered_map>
#include <vector>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Sandy::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Sandy::SandyException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Sandy::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    int parsed = parseNumericStrict<int>(
        value,
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue) {
        throw Sandy::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

double parseDoubleStrict(const std::string& value, const std::string& key) {
    double parsed = parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
    if (!std::isfinite(parsed)) {
        throw Sandy::ConfigurationException("Value for " + key + " must be finite");
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Sandy::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    for (char c : line) {
        if (c == '"') inQuotes = !inQuotes;
        if (!inQuotes && (c == '{' || c == '}')) continue;
        out.push_back(c);
    }

    size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') {
            inQuotes = !inQuotes;
        } else if (!inQuotes && line[i] == sep) {
            return i;
        }
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(std::string key) {
    std::string out = CommonUtils::toLower(CommonUtils::trim(key));
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

// Flags that take no value on the command line.
const std::unordered_map<std::string, std::string>& switchFlags() {
    static const std::unordered_map<std::string, std::string> flags = {
        {"--verbose", "verbose"},
        {"--serve", "serve"},
        {"--no-plots", "plots"},
        {"--no-report", "generate_report"},
    };
    return flags;
}
}

void DiagnosticConfig::assign(DiagnosticConfig& config, const std::string& rawKey, const std::string& value) {
    using StringField = std::string DiagnosticConfig::*;
    using BoolField = bool DiagnosticConfig::*;
    using DoubleField = double DiagnosticConfig::*;
    using SquareField = double SandySquare::*;

    static const std::unordered_map<std::string, StringField> rawStringFields = {
        {"dataset", &DiagnosticConfig::datasetPath},
        {"report_file", &DiagnosticConfig::reportFile},
        {"assets_dir", &DiagnosticConfig::assetsDir},
        {"output", &DiagnosticConfig::outputFile},
    };
    static const std::unordered_map<std::string, StringField> lowerStringFields = {
        {"input_mode", &DiagnosticConfig::inputMode},
        {"system_type", &DiagnosticConfig::systemType},
    };
    static const std::unordered_map<std::string, BoolField> boolFields = {
        {"skip_malformed", &DiagnosticConfig::skipMalformed},
        {"generate_report", &DiagnosticConfig::generateReport},
        {"plots", &DiagnosticConfig::plots},
        {"verbose", &DiagnosticConfig::verbose},
        {"serve", &DiagnosticConfig::serve},
    };
    static const std::unordered_map<std::string, DoubleField> doubleFields = {
        {"d_crit", &DiagnosticConfig::dCrit},
        {"percentile", &DiagnosticConfig::percentile},
        {"epsilon", &DiagnosticConfig::epsilon},
        {"degenerate_range_tolerance", &DiagnosticConfig::degenerateRangeTolerance},
    };
    static const std::unordered_map<std::string, SquareField> squareFields = {
        {"z_min", &SandySquare::zMin},
        {"z_max", &SandySquare::zMax},
        {"sigma_min", &SandySquare::sigmaMin},
        {"sigma_max", &SandySquare::sigmaMax},
    };

    const std::string key = normalizeConfigKey(rawKey);

    if (key == "delimiter") {
        if (value.size() != 1) throw Sandy::ConfigurationException("delimiter expects a single character");
        config.delimiter = value[0];
        return;
    }
    if (key == "z") {
        config.manualZ = parseDoubleStrict(value, key);
        return;
    }
    if (key == "sigma") {
        config.manualSigma = parseDoubleStrict(value, key);
        return;
    }
    if (key == "plot_format") {
        config.plot.format = CommonUtils::toLower(value);
        return;
    }
    if (key == "plot_theme") {
        config.plot.theme = CommonUtils::toLower(value);
        return;
    }
    if (key == "plot_width") {
        config.plot.width = parseIntStrict(value, key, 320);
        return;
    }
    if (key == "plot_height") {
        config.plot.height = parseIntStrict(value, key, 240);
        return;
    }
    if (key == "plot_grid") {
        config.plot.showGrid = parseBoolStrict(value, key);
        return;
    }
    if (key == "host") {
        config.dashboard.host = value;
        return;
    }
    if (key == "port") {
        config.dashboard.port = parseIntStrict(value, key, 1);
        return;
    }
    if (key == "threads") {
        config.dashboard.threads = static_cast<size_t>(parseIntStrict(value, key, 1));
        return;
    }

    if (const auto it = rawStringFields.find(key); it != rawStringFields.end()) {
        config.*(it->second) = value;
        return;
    }
    if (const auto it = lowerStringFields.find(key); it != lowerStringFields.end()) {
        config.*(it->second) = CommonUtils::toLower(value);
        return;
    }
    if (const auto it = boolFields.find(key); it != boolFields.end()) {
        config.*(it->second) = parseBoolStrict(value, key);
        return;
    }
    if (const auto it = doubleFields.find(key); it != doubleFields.end()) {
        config.*(it->second) = parseDoubleStrict(value, key);
        return;
    }
    if (const auto it = squareFields.find(key); it != squareFields.end()) {
        config.square.*(it->second) = parseDoubleStrict(value, key);
        return;
    }

    throw Sandy::ConfigurationException("Unknown setting: " + rawKey);
}

DiagnosticConfig DiagnosticConfig::fromArgs(int argc, char* argv[]) {
    DiagnosticConfig config;
    if (argc < 2) {
        config.showHelp = true;
        return config;
    }

    int first = 1;
    const std::string head = argv[1];
    if (head == "--help" || head == "-h") {
        config.showHelp = true;
        return config;
    }
    if (head.rfind("--", 0) != 0) {
        config.datasetPath = head;
        first = 2;
    }

    // The config file is the base layer; the positional dataset and explicit flags override it.
    for (int i = first; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            const std::string positional = config.datasetPath;
            config = fromFile(argv[i + 1], config);
            if (!positional.empty()) config.datasetPath = positional;
            break;
        }
    }

    for (int i = first; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
            return config;
        }
        if (arg == "--config") {
            if (i + 1 >= argc) throw Sandy::ConfigurationException("--config expects a file path");
            ++i;
            continue;
        }
        if (const auto it = switchFlags().find(arg); it != switchFlags().end()) {
            const bool negated = arg.rfind("--no-", 0) == 0;
            assign(config, it->second, negated ? "false" : "true");
            continue;
        }
        if (arg == "-o") {
            if (i + 1 >= argc) throw Sandy::ConfigurationException("-o expects a file name");
            config.outputFile = argv[++i];
            continue;
        }
        if (arg.rfind("--", 0) != 0) {
            throw Sandy::ConfigurationException("Unexpected argument: " + arg);
        }
        if (i + 1 >= argc) {
            throw Sandy::ConfigurationException("Missing value for " + arg);
        }
        assign(config, arg.substr(2), argv[++i]);
    }

    config.validate();
    return config;
}

DiagnosticConfig DiagnosticConfig::fromFile(const std::string& configPath, const DiagnosticConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Sandy::ConfigurationException("Could not open config file: " + configPath);

    DiagnosticConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        const std::string key = maybeUnquote(line.substr(0, sep));
        const std::string value = maybeUnquote(line.substr(sep + 1));
        try {
            assign(config, key, value);
        } catch (const Sandy::SandyException& ex) {
            throw Sandy::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    return config;
}

void DiagnosticConfig::validate() const {
    const auto isIn = [](const std::string& value, const std::vector<std::string>& allowed) {
        return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
    };

    if (!isIn(inputMode, {"raw", "proxy"})) {
        throw Sandy::ConfigurationException("input_mode must be one of: raw, proxy");
    }
    if (!isIn(systemType, {"fusion", "stellar", "generic"})) {
        throw Sandy::ConfigurationException("system_type must be one of: fusion, stellar, generic");
    }
    if (!isIn(plot.format, {"png", "svg", "pdf"})) {
        throw Sandy::ConfigurationException("plot_format must be one of: png, svg, pdf");
    }
    if (!isIn(plot.theme, {"light", "dark"})) {
        throw Sandy::ConfigurationException("plot_theme must be one of: light, dark");
    }
    if (delimiter == '"' || delimiter == '\n' || delimiter == '\r' || delimiter == '\0') {
        throw Sandy::ConfigurationException("Invalid delimiter character");
    }

    if (square.zMin >= square.zMax) {
        throw Sandy::ConfigurationException("z_min must be < z_max");
    }
    if (square.sigmaMin >= square.sigmaMax) {
        throw Sandy::ConfigurationException("sigma_min must be < sigma_max");
    }
    if (dCrit < 0.0) {
        throw Sandy::ConfigurationException("d_crit must be >= 0");
    }
    if (percentile <= 0.0 || percentile > 100.0) {
        throw Sandy::ConfigurationException("percentile must be within (0,100]");
    }
    if (epsilon <= 0.0) {
        throw Sandy::ConfigurationException("epsilon must be > 0");
    }
    if (degenerateRangeTolerance < 0.0) {
        throw Sandy::ConfigurationException("degenerate_range_tolerance must be >= 0");
    }

    if (manualZ.has_value() != manualSigma.has_value()) {
        throw Sandy::ConfigurationException("manual mode needs both --z and --sigma");
    }
    if (hasManualPoint()) {
        if (*manualZ < 0.0 || *manualZ > 1.0 || *manualSigma < 0.0 || *manualSigma > 1.0) {
            throw Sandy::ConfigurationException("--z and --sigma must be within [0,1]");
        }
    }
    if (dashboard.port > 65535) {
        throw Sandy::ConfigurationException("port must be <= 65535");
    }
    if (datasetPath.empty() && !hasManualPoint() && !serve) {
        throw Sandy::ConfigurationException("a dataset path, a manual point (--z/--sigma) or --serve is required");
    }
}

PipelineSettings DiagnosticConfig::pipelineSettings() const {
    PipelineSettings settings;
    settings.square = square;
    settings.dCrit = dCrit;
    settings.percentile = percentile;
    settings.epsilon = epsilon;
    settings.degenerateRangeTolerance = degenerateRangeTolerance;
    settings.systemType = systemType;
    return settings;
}

std::string DiagnosticConfig::usage(const std::string& prog) {
    return "Usage: " + prog + " [dataset.csv] [options]\n"
           "Options:\n"
           "  --config <file>                    key: value settings file (flags override it)\n"
           "  --input-mode <raw|proxy>           raw observables or precomputed Z_proxy/Sigma_proxy (default: raw)\n"
           "  --delimiter <char>                 CSV delimiter character (default: ,)\n"
           "  --skip-malformed <true|false>      Malformed row handling (default: true)\n"
           "  --z <0..1> --sigma <0..1>          Manual mode: classify a single operating point\n"
           "  --system-type <fusion|stellar|generic>\n"
           "  --z-min/--z-max/--sigma-min/--sigma-max <val>  Sandy Square bounds (default: 0.30/0.90/0.15/0.85)\n"
           "  --d-crit <val>                     Wall proximity threshold (default: 0.05)\n"
           "  --percentile <val>                 dG/dt percentile for the pressure threshold (default: 90)\n"
           "  --epsilon <val>                    Normalization guard (default: 1e-6)\n"
           "  --report-file <file>               Markdown report (default: sandy_report.md)\n"
           "  --assets-dir <dir>                 Plot output directory (default: sandy_report_assets)\n"
           "  --output, -o <file>                Export the report as .json, .csv or .parquet\n"
           "  --plot-format <png|svg|pdf>        --plot-theme <light|dark>\n"
           "  --no-plots                         Skip gnuplot rendering\n"
           "  --no-report                        Skip the markdown report\n"
           "  --serve [--host h] [--port p]      Start the HTTP diagnostics dashboard\n"
           "  --verbose                          Enable detailed logs\n"
           "  --help                             Show this help message\n";
}
