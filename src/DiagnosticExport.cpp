#include "DiagnosticExport.h"
#include "CommonUtils.h"
#include "SandyExceptions.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

#ifdef SANDY_USE_NATIVE_PARQUET
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace {
std::string num(double v) {
    if (!std::isfinite(v)) return "null";
    std::ostringstream out;
    out << std::setprecision(12) << v;
    return out.str();
}

std::string csvNum(double v) {
    if (!std::isfinite(v)) return "";
    std::ostringstream out;
    out << std::setprecision(12) << v;
    return out.str();
}

void appendNumberArray(std::ostringstream& out, const std::vector<double>& values) {
    out << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out << ",";
        out << num(values[i]);
    }
    out << "]";
}

void appendBoolArray(std::ostringstream& out, const std::vector<bool>& values) {
    out << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out << ",";
        out << (values[i] ? "true" : "false");
    }
    out << "]";
}

void appendManual(std::ostringstream& out, const ManualReading& m) {
    out << "{\"z\":" << num(m.z)
        << ",\"sigma\":" << num(m.sigma)
        << ",\"gate_product\":" << num(m.gateProduct)
        << ",\"phase\":\"" << PhaseClassifier::name(m.phase)
        << "\",\"title\":\"" << DiagnosticExport::jsonEscape(PhaseClassifier::title(m.phase))
        << "\",\"interpretation\":\"" << DiagnosticExport::jsonEscape(PhaseClassifier::interpretation(m.phase))
        << "\"}";
}
#ifdef SANDY_USE_NATIVE_PARQUET
void requireOk(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) throw Sandy::IOException(what + ": " + status.ToString());
}

std::shared_ptr<arrow::Array> doubleArray(const std::vector<double>& values, const std::string& name) {
    arrow::DoubleBuilder builder;
    for (double v : values) {
        requireOk(std::isfinite(v) ? builder.Append(v) : builder.AppendNull(), "append to column '" + name + "'");
    }
    std::shared_ptr<arrow::Array> arr;
    requireOk(builder.Finish(&arr), "finalize column '" + name + "'");
    return arr;
}

std::shared_ptr<arrow::Array> boolArray(const std::vector<bool>& values, const std::string& name) {
    arrow::BooleanBuilder builder;
    for (bool v : values) requireOk(builder.Append(v), "append to column '" + name + "'");
    std::shared_ptr<arrow::Array> arr;
    requireOk(builder.Finish(&arr), "finalize column '" + name + "'");
    return arr;
}

void writeParquet(const std::string& path, const DiagnosticReport& report) {
    if (!report.hasSeries()) {
        throw Sandy::ConfigurationException("parquet export needs a series run, not a manual reading");
    }
    const Phase0Report& p0 = report.phase0;

    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    const auto addDouble = [&](const std::string& name, const std::vector<double>& values) {
        fields.push_back(arrow::field(name, arrow::float64(), true));
        arrays.push_back(doubleArray(values, name));
    };
    const auto addBool = [&](const std::string& name, const std::vector<bool>& values) {
        fields.push_back(arrow::field(name, arrow::boolean(), false));
        arrays.push_back(boolArray(values, name));
    };

    addDouble("time", report.time);
    addDouble("Z_proxy", report.proxies.z);
    addDouble("Sigma_proxy", report.proxies.sigma);
    addDouble("G", report.gate.g);
    addDouble("dGdt", report.gate.dGdt);
    addDouble("distance_to_wall", p0.distanceToWall);
    addBool("proximity_flag", p0.proximityFlag);
    addBool("pressure_flag", p0.pressureFlag);
    addBool("phase0_flag", p0.phase0Flag);

    arrow::StringBuilder zoneBuilder;
    for (PhaseLabel label : report.zones) requireOk(zoneBuilder.Append(PhaseClassifier::name(label)), "append zone");
    std::shared_ptr<arrow::Array> zones;
    requireOk(zoneBuilder.Finish(&zones), "finalize zone column");
    fields.push_back(arrow::field("zone", arrow::utf8(), false));
    arrays.push_back(zones);

    const auto table = arrow::Table::Make(std::make_shared<arrow::Schema>(fields), arrays,
                                          static_cast<int64_t>(report.sampleCount()));

    auto outRes = arrow::io::FileOutputStream::Open(path);
    if (!outRes.ok()) throw Sandy::IOException("Could not open parquet output " + path + ": " + outRes.status().ToString());
    std::shared_ptr<arrow::io::FileOutputStream> sink = outRes.ValueOrDie();

    const int64_t chunkRows = std::max<int64_t>(1024, std::min<int64_t>(65536, static_cast<int64_t>(report.sampleCount())));
    requireOk(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), sink, chunkRows), "parquet write failed");
    requireOk(sink->Close(), "closing parquet output");
}
#endif
} // namespace

namespace DiagnosticExport {

std::string jsonEscape(const std::string& value) {
    std::ostringstream out;
    for (char c : value) {
        switch (c) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            default: out << c; break;
        }
    }
    return out.str();
}

std::string toJson(const DiagnosticReport& report) {
    std::ostringstream out;
    out << "{\"system_type\":\"" << jsonEscape(report.systemType) << "\"";

    const SandySquare& sq = report.square;
    out << ",\"settings\":{\"z_min\":" << num(sq.zMin)
        << ",\"z_max\":" << num(sq.zMax)
        << ",\"sigma_min\":" << num(sq.sigmaMin)
        << ",\"sigma_max\":" << num(sq.sigmaMax)
        << ",\"d_crit\":" << num(report.dCrit)
        << ",\"percentile\":" << num(report.percentile)
        << ",\"epsilon\":" << num(report.epsilon) << "}";

    out << ",\"warnings\":[";
    for (size_t i = 0; i < report.warnings.size(); ++i) {
        if (i > 0) out << ",";
        out << "{\"code\":\"" << jsonEscape(report.warnings[i].code)
            << "\",\"message\":\"" << jsonEscape(report.warnings[i].message) << "\"}";
    }
    out << "]";

    out << ",\"manual\":";
    if (report.manual) {
        appendManual(out, *report.manual);
    } else {
        out << "null";
    }

    if (!report.hasSeries()) {
        out << ",\"summary\":null,\"series\":null}";
        return out.str();
    }

    const Phase0Report& p0 = report.phase0;
    size_t dead = 0;
    size_t danger = 0;
    size_t safe = 0;
    for (PhaseLabel label : report.zones) {
        if (label == PhaseLabel::DeadZone) ++dead;
        else if (label == PhaseLabel::DangerZone) ++danger;
        else ++safe;
    }
    out << ",\"summary\":{\"samples\":" << report.sampleCount()
        << ",\"min_distance\":" << num(p0.minDistance)
        << ",\"max_slope\":" << num(p0.maxSlope)
        << ",\"dG_crit\":" << num(p0.dGCrit)
        << ",\"phase0_count\":" << p0.flaggedCount
        << ",\"non_finite_count\":" << report.nonFiniteCount
        << ",\"zone_counts\":{\"DeadZone\":" << dead
        << ",\"DangerZone\":" << danger
        << ",\"SafeZone\":" << safe << "}}";

    out << ",\"series\":{\"time\":";
    appendNumberArray(out, report.time);
    out << ",\"z\":";
    appendNumberArray(out, report.proxies.z);
    out << ",\"sigma\":";
    appendNumberArray(out, report.proxies.sigma);
    out << ",\"g\":";
    appendNumberArray(out, report.gate.g);
    out << ",\"dGdt\":";
    appendNumberArray(out, report.gate.dGdt);
    out << ",\"distance_to_wall\":";
    appendNumberArray(out, p0.distanceToWall);
    out << ",\"proximity_flag\":";
    appendBoolArray(out, p0.proximityFlag);
    out << ",\"pressure_flag\":";
    appendBoolArray(out, p0.pressureFlag);
    out << ",\"phase0_flag\":";
    appendBoolArray(out, p0.phase0Flag);
    out << ",\"zone\":[";
    for (size_t i = 0; i < report.zones.size(); ++i) {
        if (i > 0) out << ",";
        out << "\"" << PhaseClassifier::name(report.zones[i]) << "\"";
    }
    out << "]}}";
    return out.str();
}

std::string toCsv(const DiagnosticReport& report) {
    std::ostringstream out;
    if (!report.hasSeries()) {
        out << "z,sigma,G,zone\n";
        if (report.manual) {
            out << csvNum(report.manual->z) << "," << csvNum(report.manual->sigma) << ","
                << csvNum(report.manual->gateProduct) << "," << PhaseClassifier::name(report.manual->phase) << "\n";
        }
        return out.str();
    }

    const Phase0Report& p0 = report.phase0;
    out << "time,Z_proxy,Sigma_proxy,G,dGdt,distance_to_wall,proximity_flag,pressure_flag,phase0_flag,zone\n";
    for (size_t i = 0; i < report.sampleCount(); ++i) {
        out << csvNum(report.time[i]) << ","
            << csvNum(report.proxies.z[i]) << ","
            << csvNum(report.proxies.sigma[i]) << ","
            << csvNum(report.gate.g[i]) << ","
            << csvNum(report.gate.dGdt[i]) << ","
            << csvNum(p0.distanceToWall[i]) << ","
            << (p0.proximityFlag[i] ? 1 : 0) << ","
            << (p0.pressureFlag[i] ? 1 : 0) << ","
            << (p0.phase0Flag[i] ? 1 : 0) << ","
            << PhaseClassifier::name(report.zones[i]) << "\n";
    }
    return out.str();
}

void writeFile(const std::string& path, const DiagnosticReport& report) {
    const std::string ext = CommonUtils::toLower(std::filesystem::path(path).extension().string());
    if ((ext == ".csv" || ext == ".parquet") && report.hasSeries() && report.manual) {
        std::cout << "[Sandy Warning] " << path << " holds the per-sample table only; "
                  << "the manual reading is exported to .json\n";
    }
    std::string payload;
    if (ext == ".json") {
        payload = toJson(report);
        payload.push_back('\n');
    } else if (ext == ".csv") {
        payload = toCsv(report);
    } else if (ext == ".parquet") {
#ifdef SANDY_USE_NATIVE_PARQUET
        writeParquet(path, report);
        return;
#else
        throw Sandy::ConfigurationException("parquet export requested, but this build was compiled without "
                                            "native parquet support (configure with -DSANDY_NATIVE_PARQUET=ON)");
#endif
    } else {
        throw Sandy::ConfigurationException("export file must end in .json, .csv or .parquet: " + path);
    }

    std::ofstream out(path, std::ios::binary);
    if (!out) throw Sandy::IOException("Could not open export file: " + path);
    out << payload;
    if (!out.good()) throw Sandy::IOException("Failed while writing export file: " + path);
}

} // namespace DiagnosticExport
