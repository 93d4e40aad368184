#include "GateProductEngine.h"
#include "SandyExceptions.h"
#include "StatsUtils.h"

GateSeries GateProductEngine::compute(const ProxySeries& proxies) {
    if (proxies.z.size() != proxies.sigma.size()) {
        throw Sandy::ValidationException("proxy series length mismatch: Z has " + std::to_string(proxies.z.size()) +
                                         " samples, Sigma has " + std::to_string(proxies.sigma.size()));
    }
    if (proxies.size() < kMinSeriesLength) {
        throw Sandy::InsufficientDataException("gate product slope needs at least " + std::to_string(kMinSeriesLength) +
                                               " samples, got " + std::to_string(proxies.size()));
    }

    GateSeries out;
    out.g.resize(proxies.size());
    for (size_t i = 0; i < proxies.size(); ++i) {
        out.g[i] = gateProduct(proxies.z[i], proxies.sigma[i]);
    }
    out.dGdt = StatsUtils::gradient(out.g);
    return out;
}
