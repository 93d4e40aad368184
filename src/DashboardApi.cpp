#include "DashboardApi.h"

#include "Dataset.h"
#include "DiagnosticExport.h"
#include "DiagnosticPipeline.h"
#include "ProxyComputer.h"
#include "SandyExceptions.h"

#include <iostream>

DashboardApi::DashboardApi(DiagnosticConfig base) : base_(std::move(base)) {
    base_.serve = true;
}

const std::vector<std::string>& DashboardApi::overridableKeys() {
    static const std::vector<std::string> keys = {
        "input_mode", "delimiter", "skip_malformed", "system_type",
        "z_min", "z_max", "sigma_min", "sigma_max",
        "d_crit", "percentile", "epsilon", "degenerate_range_tolerance",
    };
    return keys;
}

DashboardResponse DashboardApi::error(int code, const std::string& message) {
    return {code, "{\"error\":\"" + DiagnosticExport::jsonEscape(message) + "\"}"};
}

DashboardResponse DashboardApi::health() const {
    return {200, "{\"status\":\"ok\",\"service\":\"sandy\"}"};
}

DashboardResponse DashboardApi::classify(const DashboardParams& params) const {
    const auto z = params.find("z");
    const auto sigma = params.find("sigma");
    if (z == params.end() || sigma == params.end()) {
        return error(400, "z and sigma are required");
    }
    try {
        DiagnosticConfig cfg = base_;
        DiagnosticConfig::assign(cfg, "z", z->second);
        DiagnosticConfig::assign(cfg, "sigma", sigma->second);
        if (const auto it = params.find("system_type"); it != params.end()) {
            DiagnosticConfig::assign(cfg, "system_type", it->second);
        }
        cfg.validate();

        const DiagnosticPipeline pipeline(cfg.pipelineSettings());
        return {200, DiagnosticExport::toJson(pipeline.runManual(*cfg.manualZ, *cfg.manualSigma))};
    } catch (const Sandy::SandyException& e) {
        return error(400, e.what());
    }
}

DashboardResponse DashboardApi::diagnose(const std::string& body, const DashboardParams& params) const {
    if (body.empty()) {
        return error(400, "request body must contain a delimited table");
    }
    try {
        DiagnosticConfig cfg = base_;
        for (const auto& key : overridableKeys()) {
            if (const auto it = params.find(key); it != params.end()) DiagnosticConfig::assign(cfg, key, it->second);
        }
        cfg.validate();

        const Dataset data = Dataset::fromString(body, cfg.delimiter, cfg.skipMalformed);
        const InputMode mode = cfg.mode();
        const auto& numeric = (mode == InputMode::PROXY) ? ProxyComputer::proxyColumns() : Batch::requiredColumns();

        const DiagnosticPipeline pipeline(cfg.pipelineSettings());
        return {200, DiagnosticExport::toJson(pipeline.runColumns(data.columnMap(numeric), mode))};
    } catch (const Sandy::ValidationException& e) {
        return error(422, e.what());
    } catch (const Sandy::SandyException& e) {
        return error(400, e.what());
    } catch (const std::exception& e) {
        std::cerr << "[SandyWeb] diagnose failed: " << e.what() << "\n";
        return error(500, e.what());
    }
}
