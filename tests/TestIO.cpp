#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "DashboardApi.h"
#include "Dataset.h"
#include "DiagnosticConfig.h"
#include "DiagnosticExport.h"
#include "DiagnosticPipeline.h"
#include "ReportEngine.h"
#include "SandyExceptions.h"
#include "TerminalUI.h"

namespace {

// Always-on requirement: never compiled out in Release.
#define REQUIRE(cond, msg)                                                      \
    do {                                                                        \
        if (!(cond)) {                                                          \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ << " " << msg \
                      << "\n";                                                  \
            std::exit(1);                                                       \
        }                                                                       \
    } while (0)

namespace fs = std::filesystem;

static inline bool near(double a, double b, double tol = 1e-9) { return std::fabs(a - b) <= tol; }

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

static std::string slurp(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static void writeText(const fs::path& path, const std::string& body) {
    std::ofstream out(path, std::ios::binary);
    out << body;
}

static DiagnosticConfig parseArgs(std::vector<std::string> args) {
    args.insert(args.begin(), "sandy");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return DiagnosticConfig::fromArgs(static_cast<int>(argv.size()), argv.data());
}

static const std::string kRawTable =
    "time,H98y2,P_rad,P_input,f_ELM,DeltaW_ELM,tau_E\n"
    "0.0,0.90,2.0,10.0,5.0,0.50,0.1\n"
    "0.1,0.95,2.5,10.0,5.5,0.45,0.1\n"
    "0.2,1.00,3.0,10.0,6.0,0.40,0.1\n"
    "0.3,1.05,3.5,10.0,7.0,0.30,0.1\n"
    "0.4,1.10,4.0,10.0,8.0,0.20,0.1\n";

static void runCsvIngestion() {
    const std::string text =
        "\xEF\xBB\xBF" "\"time\",H98y2,label,P_rad\r\n"
        "0, 1.5 ,\"a, quoted\",2\r\n"
        "\r\n"
        "1,,b,+3\r\n"
        "2,nan,c,inf\r\n";
    const Dataset data = Dataset::fromString(text);

    REQUIRE(data.getRowCount() == 3, "blank lines are ignored");
    REQUIRE(data.isNumericColumn("time"), "BOM and quotes stripped from the first header");
    REQUIRE(data.isNumericColumn("H98y2") && data.isNumericColumn("P_rad"), "numeric columns detected");
    REQUIRE(data.hasColumn("label") && !data.isNumericColumn("label"), "text column kept aside");

    const ColumnMap columns = data.columnMap();
    REQUIRE(near(columns.at("H98y2")[0], 1.5), "unquoted fields are trimmed");
    REQUIRE(std::isnan(columns.at("H98y2")[1]), "empty cell becomes NaN");
    REQUIRE(std::isnan(columns.at("H98y2")[2]), "nan literal accepted");
    REQUIRE(near(columns.at("P_rad")[1], 3.0), "leading plus accepted");
    REQUIRE(std::isinf(columns.at("P_rad")[2]), "inf literal accepted");
    REQUIRE(columns.find("label") == columns.end(), "text columns are not in the numeric map");
    REQUIRE(data.getTextColumnNames() == std::vector<std::string>{"label"}, "text column names listed");

    bool threw = false;
    try {
        data.columnMap({"label"});
    } catch (const Sandy::DatasetException& e) {
        threw = contains(e.what(), "label");
    }
    REQUIRE(threw, "text in a required numeric column is a DatasetException naming it");

    const Dataset dupes = Dataset::fromString("a,a,,b\n1,2,3,4\n");
    const auto& names = dupes.getColumnNames();
    REQUIRE(names.size() == 4 && names[1] == "a_2" && names[2] == "column_3", "header names are normalized");
    std::cout << "[PASS] CSV ingestion: BOM, quoting, blanks, NaN/inf, text columns\n";
}

static void runMalformedRows() {
    const std::string text = "x,y\n1,2\n3\n4,5\n";
    const Dataset skipped = Dataset::fromString(text, ',', true);
    REQUIRE(skipped.getRowCount() == 2 && skipped.getSkippedRowCount() == 1, "short row skipped");

    bool threw = false;
    try {
        Dataset::fromString(text, ',', false);
    } catch (const Sandy::DatasetException& e) {
        threw = contains(e.what(), "record 3");
    }
    REQUIRE(threw, "short row is fatal when not skipping");

    const Dataset trailing = Dataset::fromString("x,y\n1,2,\n");
    REQUIRE(trailing.getRowCount() == 1, "trailing empty field is tolerated");

    const Dataset semi = Dataset::fromString("x;y\n1,5;2\n", ';');
    REQUIRE(semi.getRowCount() == 1 && semi.getColCount() == 1, "custom delimiter; '1,5' is text");

    threw = false;
    try {
        Dataset::fromString("\n\n");
    } catch (const Sandy::DatasetException&) {
        threw = true;
    }
    REQUIRE(threw, "missing header is a DatasetException");

    threw = false;
    try {
        Dataset missing("definitely_missing_input.csv");
        missing.load();
    } catch (const Sandy::IOException&) {
        threw = true;
    }
    REQUIRE(threw, "unreadable file is an IOException");
    std::cout << "[PASS] malformed row policy and load errors\n";
}

static void runEndToEndFromText() {
    const Dataset data = Dataset::fromString(kRawTable);
    const DiagnosticReport report =
        DiagnosticPipeline().runColumns(data.columnMap(Batch::requiredColumns()), InputMode::RAW);
    REQUIRE(report.sampleCount() == 5, "all rows processed");
    REQUIRE(near(report.time[4], 0.4), "time column carried through");
    REQUIRE(near(report.proxies.z[0], 0.0) && report.proxies.z[4] > 0.99, "Z normalized over the batch");
    REQUIRE(report.warnings.empty(), "clean batch has no warnings");

    const Dataset partial = Dataset::fromString("time,H98y2\n0,1\n1,2\n");
    std::string message;
    try {
        DiagnosticPipeline().runColumns(partial.columnMap(Batch::requiredColumns()), InputMode::RAW);
    } catch (const Sandy::ValidationException& e) {
        message = e.what();
    }
    REQUIRE(contains(message, "P_rad, P_input, f_ELM, DeltaW_ELM"), "missing columns listed: " << message);
    std::cout << "[PASS] text table through the full pipeline\n";
}

static void runConfigFromArgs() {
    const DiagnosticConfig cfg = parseArgs({"shots.csv", "--d-crit", "0.1", "--percentile", "75",
                                            "--input-mode", "PROXY", "--no-plots", "-o", "out.json",
                                            "--z-min", "0.25", "--system-type", "stellar", "--delimiter", ";"});
    REQUIRE(cfg.datasetPath == "shots.csv", "dataset path from first positional argument");
    REQUIRE(near(cfg.dCrit, 0.1) && near(cfg.percentile, 75.0), "thresholds parsed");
    REQUIRE(cfg.mode() == InputMode::PROXY, "input mode is case-insensitive");
    REQUIRE(!cfg.plots && cfg.outputFile == "out.json", "switches and -o");
    REQUIRE(near(cfg.square.zMin, 0.25) && near(cfg.square.zMax, 0.9), "square bound override keeps the rest");
    REQUIRE(cfg.systemType == "stellar" && cfg.delimiter == ';', "system type and delimiter");

    const PipelineSettings settings = cfg.pipelineSettings();
    REQUIRE(near(settings.dCrit, 0.1) && near(settings.square.zMin, 0.25) && settings.systemType == "stellar",
            "pipeline settings mirror the config");

    const DiagnosticConfig manual = parseArgs({"--z", "0.85", "--sigma", "0.30"});
    REQUIRE(manual.hasManualPoint() && manual.datasetPath.empty(), "manual mode without a dataset");
    REQUIRE(near(*manual.manualZ, 0.85) && near(*manual.manualSigma, 0.30), "manual point parsed");

    REQUIRE(parseArgs({"--help"}).showHelp, "--help");
    REQUIRE(parseArgs({}).showHelp, "no arguments shows help");

    const std::vector<std::vector<std::string>> bad = {
        {"--z", "0.5"},
        {"--z", "1.5", "--sigma", "0.2"},
        {"data.csv", "--z-min", "0.9", "--z-max", "0.3"},
        {"data.csv", "--percentile", "0"},
        {"data.csv", "--epsilon", "0"},
        {"data.csv", "--d-crit", "abc"},
        {"data.csv", "--input-mode", "fancy"},
        {"data.csv", "--plot-format", "gif"},
        {"data.csv", "--bogus", "1"},
        {"data.csv", "--percentile"},
        {"data.csv", "stray"},
        {"--verbose"},
    };
    for (const auto& args : bad) {
        bool threw = false;
        try {
            parseArgs(args);
        } catch (const Sandy::ConfigurationException&) {
            threw = true;
        }
        REQUIRE(threw, "invalid arguments rejected: " << (args.empty() ? "" : args.back()));
    }
    std::cout << "[PASS] DiagnosticConfig::fromArgs parsing and validation\n";
}

static void runConfigFromFile() {
    const fs::path path = fs::path("sandy_test_config.json");
    writeText(path,
              "{\n"
              "  # analysis settings\n"
              "  \"d_crit\": 0.08,\n"
              "  \"percentile\": 80,\n"
              "  \"system_type\": \"generic\",\n"
              "  \"report_file\": \"out/report.md\",\n"
              "  \"plot_theme\": \"dark\"\n"
              "}\n");

    const DiagnosticConfig fromFile = DiagnosticConfig::fromFile(path.string(), DiagnosticConfig{});
    REQUIRE(near(fromFile.dCrit, 0.08) && near(fromFile.percentile, 80.0), "numeric keys from file");
    REQUIRE(fromFile.systemType == "generic" && fromFile.reportFile == "out/report.md", "string keys from file");
    REQUIRE(fromFile.plot.theme == "dark", "plot keys from file");

    const DiagnosticConfig layered = parseArgs({"data.csv", "--config", path.string(), "--percentile", "95"});
    REQUIRE(near(layered.percentile, 95.0), "command-line flags override the file");
    REQUIRE(near(layered.dCrit, 0.08), "file values fill the rest");

    writeText(path, "dataset: from_file.csv\nd_crit: 0.07\n");
    const DiagnosticConfig positional = parseArgs({"cli.csv", "--config", path.string()});
    REQUIRE(positional.datasetPath == "cli.csv", "positional dataset overrides the file: " << positional.datasetPath);
    REQUIRE(near(positional.dCrit, 0.07), "file values still apply beside a positional dataset");
    const DiagnosticConfig fileOnly = parseArgs({"--config", path.string()});
    REQUIRE(fileOnly.datasetPath == "from_file.csv", "dataset taken from the file when none is given");

    writeText(path, "# bad\nd_crit: 0.1\npercentile: abc\n");
    std::string message;
    try {
        DiagnosticConfig::fromFile(path.string(), DiagnosticConfig{});
    } catch (const Sandy::ConfigurationException& e) {
        message = e.what();
    }
    REQUIRE(contains(message, "line 3") && contains(message, "percentile"), "parse error names the line: " << message);

    writeText(path, "unknown_key: 1\n");
    bool threw = false;
    try {
        DiagnosticConfig::fromFile(path.string(), DiagnosticConfig{});
    } catch (const Sandy::ConfigurationException&) {
        threw = true;
    }
    REQUIRE(threw, "unknown keys are rejected");

    threw = false;
    try {
        DiagnosticConfig::fromFile("no_such_config.yaml", DiagnosticConfig{});
    } catch (const Sandy::ConfigurationException&) {
        threw = true;
    }
    REQUIRE(threw, "missing config file is reported");

    std::error_code ec;
    fs::remove(path, ec);
    std::cout << "[PASS] DiagnosticConfig::fromFile layering and errors\n";
}

static void runExport() {
    const DiagnosticPipeline pipeline;
    const DiagnosticReport manual = pipeline.runManual(0.8, 0.1);
    const std::string manualJson = DiagnosticExport::toJson(manual);
    REQUIRE(contains(manualJson, "\"phase\":\"DangerZone\""), "manual phase exported");
    REQUIRE(contains(manualJson, "\"summary\":null") && contains(manualJson, "\"series\":null"), "no series in manual mode");
    REQUIRE(contains(manualJson, "\"d_crit\":0.05"), "settings snapshot exported");
    REQUIRE(contains(DiagnosticExport::toCsv(manual), "0.8,0.1,"), "manual CSV row");

    ProxySeries proxies;
    proxies.z = {0.5, 0.5, 0.5, 0.5, 0.95};
    proxies.sigma = {0.0, 0.25, 0.5, 0.75, 0.5};
    const DiagnosticReport series = pipeline.runProxies({}, proxies);
    const std::string json = DiagnosticExport::toJson(series);
    REQUIRE(contains(json, "\"samples\":5"), "summary exported");
    REQUIRE(contains(json, "\"zone\":[\"SafeZone\""), "zones exported");
    REQUIRE(contains(json, "\"phase0_count\":" + std::to_string(series.phase0.flaggedCount)), "flag count exported");

    ProxySeries broken = proxies;
    broken.sigma[2] = std::nan("");
    const std::string nullJson = DiagnosticExport::toJson(pipeline.runProxies({}, broken));
    REQUIRE(contains(nullJson, "null"), "NaN exported as null");
    REQUIRE(!contains(nullJson, "nan"), "no bare nan tokens in JSON");

    // The CSV export reloads in proxy mode and reproduces the same diagnosis.
    const Dataset reloaded = Dataset::fromString(DiagnosticExport::toCsv(series));
    const DiagnosticReport again =
        pipeline.runColumns(reloaded.columnMap(ProxyComputer::proxyColumns()), InputMode::PROXY);
    REQUIRE(again.sampleCount() == series.sampleCount(), "reloaded sample count");
    REQUIRE(again.phase0.flaggedCount == series.phase0.flaggedCount, "reloaded phase-0 count");
    REQUIRE(near(again.phase0.dGCrit, series.phase0.dGCrit, 1e-9), "reloaded dG_crit");

    const fs::path jsonPath = "sandy_test_export.json";
    DiagnosticExport::writeFile(jsonPath.string(), series);
    REQUIRE(slurp(jsonPath).front() == '{', "JSON file written");

    bool threw = false;
    try {
        DiagnosticExport::writeFile("sandy_test_export.txt", series);
    } catch (const Sandy::ConfigurationException&) {
        threw = true;
    }
    REQUIRE(threw, "unknown export extension is rejected");

    DiagnosticReport combined = series;
    combined.manual = DiagnosticPipeline::manualReading(0.85, 0.30);
    REQUIRE(contains(DiagnosticExport::toJson(combined), "\"manual\":{\"z\":0.85"), "JSON keeps the manual reading");
    REQUIRE(DiagnosticExport::toCsv(combined) == DiagnosticExport::toCsv(series), "CSV holds the series table only");

    const fs::path csvPath = "sandy_test_export.csv";
    std::ostringstream log;
    std::streambuf* original = std::cout.rdbuf(log.rdbuf());
    DiagnosticExport::writeFile(csvPath.string(), combined);
    std::cout.rdbuf(original);
    REQUIRE(contains(log.str(), "[Sandy Warning]") && contains(log.str(), "manual reading"),
            "leaving the manual reading out of a CSV is logged: " << log.str());

    std::error_code ec;
    fs::remove(jsonPath, ec);
    fs::remove(csvPath, ec);
    std::cout << "[PASS] JSON / CSV export\n";
}

static void runMarkdownReport() {
    const fs::path dir = "sandy_test_report";
    std::error_code ec;
    fs::create_directories(dir, ec);

    ReportEngine doc;
    doc.addTitle("Report");
    doc.addTable("Pipes", {"a", "b"}, {{"x|y", "2"}});
    doc.addImage("Map", "sandy_report_assets/operating_map.png");
    doc.addImage("Remote", "https://example.org/p.png");

    std::vector<std::vector<std::string>> rows(130, std::vector<std::string>{"1", "2"});
    doc.addTable("Tall", {"a", "b"}, rows);
    doc.addBullets({"one", "two"});

    const fs::path reportPath = dir / "report.md";
    doc.save(reportPath.string());
    const std::string body = slurp(reportPath);

    REQUIRE(contains(body, "# Report"), "title written");
    REQUIRE(contains(body, "x\\|y"), "pipes escaped in table cells");
    REQUIRE(contains(body, "(../sandy_report_assets/operating_map.png)"), "image link made relative to the report");
    REQUIRE(contains(body, "(https://example.org/p.png)"), "remote links untouched");
    REQUIRE(contains(body, "120 of 130 rows") && contains(body, "<details>"), "tall tables are previewed");
    REQUIRE(contains(body, "- one\n- two"), "bullets written");

    fs::remove_all(dir, ec);
    std::cout << "[PASS] markdown report rendering\n";
}

static void runTerminalPanels() {
    const DiagnosticPipeline pipeline;
    ProxySeries outside;
    outside.z = {0.1, 0.1, 0.1};
    outside.sigma = {0.5, 0.5, 0.5};
    const DiagnosticReport series = pipeline.runProxies({0.123456789, 1.0, 2.0}, outside);
    REQUIRE(series.phase0.flaggedCount == 3, "samples below Z_min are flagged");

    const std::ios::fmtflags flagsBefore = std::cout.flags();
    const std::streamsize precisionBefore = std::cout.precision();

    std::ostringstream captured;
    std::streambuf* original = std::cout.rdbuf(captured.rdbuf());
    TerminalUI::printManualPanel(pipeline.runManual(0.85, 0.30).manual.value(), "fusion");
    TerminalUI::printPhase0Samples(series);
    TerminalUI::printBatchSummary(series);
    std::cout.rdbuf(original);

    const std::string text = captured.str();
    REQUIRE(contains(text, "= 0.85") && contains(text, "= 0.0450"), "manual panel precision");
    REQUIRE(contains(text, "0.1235"), "phase-0 times use a fixed precision: " << text);
    REQUIRE(std::cout.flags() == flagsBefore && std::cout.precision() == precisionBefore,
            "panels restore the stream state");
    std::cout << "[PASS] terminal panels leave std::cout formatting untouched\n";
}

static void runDashboardApi() {
    DiagnosticConfig base;
    base.serve = true;
    const DashboardApi api(base);

    REQUIRE(api.health().first == 200, "health is always 200");

    const DashboardResponse manual = api.classify({{"z", "0.85"}, {"sigma", "0.30"}});
    REQUIRE(manual.first == 200 && contains(manual.second, "\"phase\":\"SafeZone\""), "classify: " << manual.second);
    REQUIRE(api.classify({{"z", "0.85"}}).first == 400, "classify without sigma");
    REQUIRE(api.classify({{"z", "abc"}, {"sigma", "0.3"}}).first == 400, "classify with a non-numeric z");
    REQUIRE(api.classify({{"z", "1.5"}, {"sigma", "0.3"}}).first == 400, "classify with z outside [0,1]");

    const DashboardResponse ok = api.diagnose(kRawTable, {});
    REQUIRE(ok.first == 200 && contains(ok.second, "\"samples\":5"), "diagnose: " << ok.second);

    const DashboardResponse missing = api.diagnose("time,H98y2\n0,1\n1,2\n", {});
    REQUIRE(missing.first == 422 && contains(missing.second, "P_rad"), "missing columns are 422: " << missing.second);

    const DashboardResponse oneRow =
        api.diagnose("time,H98y2,P_rad,P_input,f_ELM,DeltaW_ELM\n0.0,0.90,2.0,10.0,5.0,0.50\n", {});
    REQUIRE(oneRow.first == 400, "a single row is 400: " << oneRow.second);

    REQUIRE(api.diagnose(kRawTable, {{"percentile", "abc"}}).first == 400, "non-numeric percentile override");
    REQUIRE(api.diagnose(kRawTable, {{"percentile", "150"}}).first == 400, "out-of-range percentile override");
    REQUIRE(api.diagnose("", {}).first == 400, "empty body");
    REQUIRE(api.diagnose("time,H98y2,P_rad,P_input,f_ELM,DeltaW_ELM\n0,x,1,1,1,1\n1,y,1,1,1,1\n", {}).first == 400,
            "text in a numeric column is 400");

    const DashboardResponse proxy =
        api.diagnose("Z_proxy;Sigma_proxy\n0.5;0.2\n0.6;0.3\n", {{"input_mode", "proxy"}, {"delimiter", ";"}});
    REQUIRE(proxy.first == 200, "overrides select proxy mode and delimiter: " << proxy.second);

    const DashboardResponse ignored = api.diagnose(kRawTable, {{"report_file", "/tmp/x.md"}, {"d_crit", "0.2"}});
    REQUIRE(ignored.first == 200 && contains(ignored.second, "\"d_crit\":0.2"), "only analysis keys are overridable");
    std::cout << "[PASS] dashboard request handling and status codes\n";
}

} // namespace

int main() {
    runCsvIngestion();
    runMalformedRows();
    runEndToEndFromText();
    runConfigFromArgs();
    runConfigFromFile();
    runExport();
    runMarkdownReport();
    runTerminalPanels();
    runDashboardApi();
    return 0;
}
