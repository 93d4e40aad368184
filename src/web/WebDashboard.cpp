#include "WebDashboard.h"

#include "DashboardApi.h"

#include <httplib.h>

#include <algorithm>
#include <iostream>
#include <string>

namespace {
constexpr size_t kMaxUploadBytes = 32 * 1024 * 1024;

class DashboardBackend {
public:
    explicit DashboardBackend(const DiagnosticConfig& cfg) : base(cfg), api(cfg) {}

    int run() {
        httplib::Server server;
        server.new_task_queue = [threads = std::max<size_t>(1, base.dashboard.threads)] {
            return new httplib::ThreadPool(static_cast<int>(threads));
        };
        server.set_default_headers({
            {"X-Content-Type-Options", "nosniff"},
            {"X-Frame-Options", "DENY"},
            {"Referrer-Policy", "strict-origin-when-cross-origin"},
            {"Cache-Control", "no-store"}
        });
        server.set_payload_max_length(kMaxUploadBytes);

        wireRoutes(server);

        std::cout << "[SandyWeb] http://" << base.dashboard.host << ":" << base.dashboard.port << "\n";
        if (!server.listen(base.dashboard.host.c_str(), base.dashboard.port)) {
            std::cerr << "[SandyWeb] failed to bind " << base.dashboard.host << ":" << base.dashboard.port << "\n";
            return 1;
        }
        return 0;
    }

private:
    DiagnosticConfig base;
    DashboardApi api;

    void wireRoutes(httplib::Server& server) {
        server.Get("/api/health", [this](const httplib::Request&, httplib::Response& res) {
            json(res, api.health());
        });

        server.Get("/api/classify", [this](const httplib::Request& req, httplib::Response& res) {
            json(res, api.classify(params(req)));
        });

        server.Post("/api/diagnose", [this](const httplib::Request& req, httplib::Response& res) {
            json(res, api.diagnose(req.body, params(req)));
        });
    }

    // First value wins for repeated query keys.
    static DashboardParams params(const httplib::Request& req) {
        DashboardParams out;
        for (const auto& entry : req.params) out.emplace(entry.first, entry.second);
        return out;
    }

    static void json(httplib::Response& res, const DashboardResponse& response) {
        res.status = response.first;
        res.set_content(response.second, "application/json");
    }
};
} // namespace

int WebDashboard::start(const DiagnosticConfig& base) {
    DashboardBackend backend(base);
    return backend.run();
}
