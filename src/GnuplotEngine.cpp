#include "GnuplotEngine.h"
#include "PhaseClassifier.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <spawn.h>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {
uint64_t fnv1a64(const std::string& text) {
    uint64_t hash = 1469598103934665603ULL;
    for (unsigned char c : text) {
        hash ^= static_cast<uint64_t>(c);
        hash *= 1099511628211ULL;
    }
    return hash;
}

std::string toHex(uint64_t value) {
    std::ostringstream os;
    os << std::hex << value;
    return os.str();
}

// gnuplot treats '?' as a missing datum (see "set datafile missing").
void writeDatum(std::ostringstream& data, double value) {
    if (std::isfinite(value)) {
        data << value;
    } else {
        data << '?';
    }
}

std::string findExecutableInPath(const std::string& command) {
    if (command.empty()) return "";
    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv) return "";

    std::stringstream ss{std::string(pathEnv)};
    std::string token;
    while (std::getline(ss, token, ':')) {
        if (token.empty()) token = ".";
        std::filesystem::path candidate = std::filesystem::path(token) / command;
        std::error_code ec;
        if (std::filesystem::exists(candidate, ec) && !ec && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate.string();
        }
    }
    return "";
}

int spawnGnuplot(const std::string& executable,
                 const std::string& scriptPath,
                 const std::string& stderrPath) {
    const int errFd = ::open(stderrPath.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (errFd < 0) return -1;

    posix_spawn_file_actions_t actions;
    if (::posix_spawn_file_actions_init(&actions) != 0) {
        ::close(errFd);
        return -1;
    }

    if (::posix_spawn_file_actions_adddup2(&actions, errFd, STDERR_FILENO) != 0 ||
        ::posix_spawn_file_actions_addclose(&actions, errFd) != 0) {
        ::posix_spawn_file_actions_destroy(&actions);
        ::close(errFd);
        return -1;
    }

    const char* argvRaw[] = {executable.c_str(), scriptPath.c_str(), nullptr};
    char* const* argv = const_cast<char* const*>(argvRaw);
    pid_t pid = -1;
    const int spawnRc = ::posix_spawn(&pid, executable.c_str(), &actions, nullptr, argv, environ);

    ::posix_spawn_file_actions_destroy(&actions);
    ::close(errFd);

    if (spawnRc != 0 || pid <= 0) return -1;

    int status = 0;
    if (::waitpid(pid, &status, 0) < 0) return -1;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}
} // namespace

const std::vector<double>& GnuplotEngine::gateContourLevels() {
    static const std::vector<double> levels = {0.02, 0.05, 0.1};
    return levels;
}

std::string GnuplotEngine::sanitizeId(const std::string& id) {
    std::string out = id;
    std::replace_if(out.begin(), out.end(), [](unsigned char c) {
        return !(std::isalnum(c) || c == '_' || c == '-');
    }, '_');
    if (out.empty()) out = "plot";
    return out;
}

std::string GnuplotEngine::quoteForGnuplot(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 2);
    escaped.push_back('\'');
    for (char ch : value) {
        if (ch == '\'') {
            escaped += "''";
        } else {
            escaped.push_back(ch);
        }
    }
    escaped.push_back('\'');
    return escaped;
}

std::string GnuplotEngine::terminalForFormat(const std::string& format, int width, int height) {
    if (format == "svg") return "svg size " + std::to_string(width) + "," + std::to_string(height);
    if (format == "pdf") return "pdfcairo size 11in,8in";
    return "pngcairo size " + std::to_string(width) + "," + std::to_string(height);
}

std::string GnuplotEngine::styledHeader(const std::string& id, const std::string& title) const {
    const std::string safeId = sanitizeId(id);
    const bool darkTheme = (cfg_.theme == "dark");
    const std::string titleColor = darkTheme ? "#f9fafb" : "#1f2937";
    const std::string borderColor = darkTheme ? "#6b7280" : "#9ca3af";
    const std::string ticColor = darkTheme ? "#e5e7eb" : "#374151";
    const std::string gridColor = darkTheme ? "#374151" : "#e5e7eb";
    const std::string bgColor = darkTheme ? "#111827" : "#ffffff";

    std::ostringstream script;
    script << "set terminal " << terminalForFormat(cfg_.format, cfg_.width, cfg_.height) << " enhanced\n";
    script << "set output " << quoteForGnuplot(assetsDir_ + "/" + safeId + "." + cfg_.format) << "\n";
    script << "set object 999 rect from graph 0,0 to graph 1,1 behind fc rgb " << quoteForGnuplot(bgColor) << " fs solid 1.0 noborder\n";
    script << "set title " << quoteForGnuplot(title) << " tc rgb " << quoteForGnuplot(titleColor) << " font ',14'\n";
    script << "set datafile missing '?'\n";
    script << "set border linewidth " << cfg_.lineWidth << " lc rgb " << quoteForGnuplot(borderColor) << "\n";
    script << "set tics textcolor rgb " << quoteForGnuplot(ticColor) << " font ',10'\n";
    script << "set tics out nomirror\nset mxtics 2\nset mytics 2\n";
    if (cfg_.showGrid) {
        script << "set grid back lc rgb " << quoteForGnuplot(gridColor) << " lw 1 dt 2\n";
    } else {
        script << "unset grid\n";
    }
    script << "set key top right opaque box lc rgb " << quoteForGnuplot(borderColor) << " font ',10'\n";
    script << "set style line 1 lc rgb '#2563eb' lw " << cfg_.lineWidth << " pt 7 ps " << cfg_.pointSize << "\n";
    script << "set style line 2 lc rgb '#dc2626' lw " << cfg_.lineWidth << " pt 7 ps " << cfg_.pointSize * 1.4 << "\n";
    script << "set style line 3 lc rgb '#059669' lw " << cfg_.lineWidth << "\n";
    script << "set style line 4 lc rgb '#7c3aed' lw " << cfg_.lineWidth << "\n";
    script << "set style line 5 lc rgb '#d97706' lw " << cfg_.lineWidth << "\n";
    script << "set style line 6 lc rgb '#0891b2' lw " << cfg_.lineWidth << "\n";
    return script.str();
}

GnuplotEngine::GnuplotEngine(std::string assetsDir, PlotConfig cfg)
    : assetsDir_(std::move(assetsDir)), cfg_(std::move(cfg)) {
    std::error_code ec;
    std::filesystem::create_directories(assetsDir_ + "/.plot_cache", ec);
    if (ec) {
        std::cerr << "[Sandy][Plot] Could not create assets directory '" << assetsDir_ << "': " << ec.message() << "\n";
    }
}

bool GnuplotEngine::isAvailable() const {
    return !findExecutableInPath("gnuplot").empty();
}

std::string GnuplotEngine::runScript(const std::string& id, const std::string& dataContent, const std::string& scriptContent) {
    static const std::string gnuplotExeCached = findExecutableInPath("gnuplot");
    if (gnuplotExeCached.empty()) {
        return "";
    }

    const std::string safeId = sanitizeId(id);
    const std::string dataFile = assetsDir_ + "/" + safeId + ".dat";
    const std::string scriptFile = assetsDir_ + "/" + safeId + ".plt";
    const std::string outputFile = assetsDir_ + "/" + safeId + "." + cfg_.format;
    const std::string errFile = assetsDir_ + "/" + safeId + ".err.log";
    const std::string cacheHashFile = assetsDir_ + "/.plot_cache/" + safeId + ".hash";

    const std::string combined = dataContent + "\n@@\n" + scriptContent +
        "\nfmt=" + cfg_.format +
        "\ntheme=" + cfg_.theme;
    const std::string cacheKey = toHex(fnv1a64(combined)) + ":" + std::to_string(combined.size());

    {
        std::ifstream in(cacheHashFile);
        std::string existing;
        if (in && std::getline(in, existing)) {
            if (existing == cacheKey && std::filesystem::exists(outputFile)) {
                return outputFile;
            }
        }
    }

    std::ofstream dout(dataFile, std::ios::binary);
    if (!dout) return "";
    dout << dataContent;
    if (!dout.good()) return "";
    dout.close();

    std::ofstream sout(scriptFile, std::ios::binary);
    if (!sout) return "";
    sout << scriptContent;
    if (!sout.good()) return "";
    sout.close();

    const int rc = spawnGnuplot(gnuplotExeCached, scriptFile, errFile);

    std::error_code ec;
    std::filesystem::remove(dataFile, ec);
    std::filesystem::remove(scriptFile, ec);

    if (rc != 0 || !std::filesystem::exists(outputFile)) {
        std::ifstream errIn(errFile);
        std::string firstLine;
        std::getline(errIn, firstLine);
        std::cerr << "[Sandy][Plot] Generation failed for id='" << safeId
                  << "' rc=" << rc
                  << " output='" << outputFile << "'";
        if (!firstLine.empty()) std::cerr << " stderr='" << firstLine << "'";
        std::cerr << " full_log='" << errFile << "'\n";
        return "";
    }

    std::filesystem::remove(errFile, ec);
    std::ofstream hout(cacheHashFile);
    if (hout) {
        hout << cacheKey;
        if (!hout.good()) {
            std::cerr << "[Sandy][Plot] Failed to write cache hash file: '" << cacheHashFile << "'\n";
        }
    }

    return outputFile;
}

std::string GnuplotEngine::operatingMap(const std::string& id, const OperatingMapData& map, const std::string& title) {
    const size_t n = std::min(map.z.size(), map.sigma.size());

    std::ostringstream data;
    for (size_t i = 0; i < n; ++i) {
        writeDatum(data, map.z[i]);
        data << " ";
        writeDatum(data, map.sigma[i]);
        const bool flagged = i < map.phase0Flag.size() && map.phase0Flag[i];
        data << " " << (flagged ? 1 : 0) << "\n";
    }

    const std::string safeId = sanitizeId(id);
    const std::string axisColor = (cfg_.theme == "dark") ? "#e5e7eb" : "#374151";
    const SandySquare& sq = map.square;

    std::ostringstream script;
    script << styledHeader(id, title);
    script << "set xrange [0:1]\nset yrange [0:1]\nset size ratio -1\n";
    script << "set xlabel 'Z (confinement proxy)' tc rgb " << quoteForGnuplot(axisColor) << " font ',11'\n";
    script << "set ylabel 'Sigma (entropy export proxy)' tc rgb " << quoteForGnuplot(axisColor) << " font ',11'\n";

    // Zone shading follows PhaseClassifier precedence: dead zone drawn over danger zone.
    script << "set object 10 rect from 0,0 to 1,1 behind fc rgb '#059669' fs transparent solid 0.08 noborder\n";
    script << "set object 11 rect from " << PhaseClassifier::kDangerZoneMinZ << ",0 to 1,"
           << PhaseClassifier::kDangerZoneMaxSigma
           << " behind fc rgb '#d97706' fs transparent solid 0.25 noborder\n";
    script << "set object 12 rect from 0,0 to " << PhaseClassifier::kDeadZoneMaxZ
           << ",1 behind fc rgb '#6b7280' fs transparent solid 0.22 noborder\n";
    script << "set label 20 'Dead Zone' at " << PhaseClassifier::kDeadZoneMaxZ / 2.0 << ",0.95 center font ',10'\n";
    script << "set label 21 'Danger Zone' at " << (PhaseClassifier::kDangerZoneMinZ + 1.0) / 2.0 << ","
           << PhaseClassifier::kDangerZoneMaxSigma / 2.0 << " center font ',10'\n";
    script << "set label 22 'Safe Zone' at 0.5,0.95 center font ',10'\n";

    script << "set object 13 rect from " << sq.zMin << "," << sq.sigmaMin << " to " << sq.zMax << "," << sq.sigmaMax
           << " front fs empty border lc rgb '#1f2937' lw " << cfg_.lineWidth << " dt 2\n";

    if (map.manualPoint) {
        script << "set label 30 'Manual' at " << map.manualPoint->first << "," << map.manualPoint->second
               << " point pt 9 ps 2.4 lc rgb '#dc2626' offset 1,1 front\n";
    }

    script << "set samples 500\n";
    script << "plot ";
    const auto& levels = gateContourLevels();
    for (size_t j = 0; j < levels.size(); ++j) {
        if (j > 0) script << ", ";
        script << "(x < 1 ? " << levels[j] << "/(1-x) : 1/0) with lines ls " << (j + 3)
               << " dt 3 title " << quoteForGnuplot("G = " + std::to_string(levels[j]).substr(0, 4));
    }
    if (n > 0) {
        const std::string datPath = quoteForGnuplot(assetsDir_ + "/" + safeId + ".dat");
        script << ", " << datPath << " using 1:2 with linespoints ls 1 title 'Trajectory'";
        script << ", " << datPath << " using 1:($3 > 0 ? $2 : 1/0) with points ls 2 title 'Phase-0'";
    }
    script << "\n";
    return runScript(id, data.str(), script.str());
}

std::string GnuplotEngine::multiLine(const std::string& id,
                                     const std::vector<double>& x,
                                     const std::vector<std::vector<double>>& series,
                                     const std::vector<std::string>& labels,
                                     const std::string& title,
                                     const std::string& xLabel,
                                     const std::string& yLabel) {
    if (x.empty() || series.empty()) return "";
    const size_t m = std::min(series.size(), labels.size());
    if (m == 0) return "";

    size_t n = x.size();
    for (size_t j = 0; j < m; ++j) n = std::min(n, series[j].size());
    if (n == 0) return "";

    std::ostringstream data;
    for (size_t i = 0; i < n; ++i) {
        writeDatum(data, x[i]);
        for (size_t j = 0; j < m; ++j) {
            data << " ";
            writeDatum(data, series[j][i]);
        }
        data << "\n";
    }

    const std::string safeId = sanitizeId(id);
    const std::string axisColor = (cfg_.theme == "dark") ? "#e5e7eb" : "#374151";
    std::ostringstream script;
    script << styledHeader(id, title);
    script << "set xlabel " << quoteForGnuplot(xLabel) << " tc rgb " << quoteForGnuplot(axisColor) << " font ',11'\n";
    script << "set ylabel " << quoteForGnuplot(yLabel) << " tc rgb " << quoteForGnuplot(axisColor) << " font ',11'\n";
    script << "plot ";
    for (size_t j = 0; j < m; ++j) {
        if (j > 0) script << ", ";
        script << quoteForGnuplot(assetsDir_ + "/" + safeId + ".dat")
               << " using 1:" << (j + 2)
               << " with lines ls " << ((j % 6) + 1)
               << " title " << quoteForGnuplot(labels[j]);
    }
    script << "\n";
    return runScript(id, data.str(), script.str());
}
