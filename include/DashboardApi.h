#pragma once

#include "DiagnosticConfig.h"

#include <map>
#include <string>
#include <utility>
#include <vector>

using DashboardParams = std::map<std::string, std::string>;
// HTTP status code and JSON body.
using DashboardResponse = std::pair<int, std::string>;

/**
 * Request handling behind the HTTP dashboard, kept free of any server types.
 * Every call copies the base config, applies the request's overrides and runs its own pipeline.
 */
class DashboardApi {
public:
    explicit DashboardApi(DiagnosticConfig base);

    DashboardResponse health() const;

    /**
     * @brief Manual reading for the `z`/`sigma` parameters (optional `system_type`).
     * @return 200 with the JSON report, 400 when a parameter is missing or invalid.
     */
    DashboardResponse classify(const DashboardParams& params) const;

    /**
     * @brief Series diagnosis of a delimited table.
     * @param params Per-request overrides; only the keys in overridableKeys() are read.
     * @return 200 with the JSON report, 422 when required columns are missing or misaligned,
     *         400 for malformed data, too few rows or a bad override, 500 otherwise.
     */
    DashboardResponse diagnose(const std::string& body, const DashboardParams& params) const;

    static const std::vector<std::string>& overridableKeys();

private:
    DiagnosticConfig base_;

    static DashboardResponse error(int code, const std::string& message);
};
