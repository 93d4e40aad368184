#include "StatsUtils.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace StatsUtils {
double percentileSorted(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) return std::numeric_limits<double>::quiet_NaN();
    if (sorted.size() == 1) return sorted.front();

    const double qq = std::clamp(q, 0.0, 1.0);
    const double pos = qq * static_cast<double>(sorted.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(pos));
    const size_t hi = static_cast<size_t>(std::ceil(pos));
    const double t = pos - static_cast<double>(lo);
    return sorted[lo] * (1.0 - t) + sorted[hi] * t;
}

double finitePercentile(const std::vector<double>& values, double q) {
    std::vector<double> finite;
    finite.reserve(values.size());
    for (double v : values) {
        if (std::isfinite(v)) finite.push_back(v);
    }
    std::sort(finite.begin(), finite.end());
    return percentileSorted(finite, q);
}

FiniteRange finiteRange(const std::vector<double>& values) {
    FiniteRange out;
    out.min = std::numeric_limits<double>::quiet_NaN();
    out.max = std::numeric_limits<double>::quiet_NaN();
    for (double v : values) {
        if (!std::isfinite(v)) continue;
        if (out.finiteCount == 0) {
            out.min = v;
            out.max = v;
        } else {
            out.min = std::min(out.min, v);
            out.max = std::max(out.max, v);
        }
        ++out.finiteCount;
    }
    return out;
}

std::vector<double> gradient(const std::vector<double>& values) {
    const size_t n = values.size();
    std::vector<double> out(n, 0.0);
    if (n < 2) return out;

    out[0] = values[1] - values[0];
    out[n - 1] = values[n - 1] - values[n - 2];
    for (size_t i = 1; i + 1 < n; ++i) {
        out[i] = (values[i + 1] - values[i - 1]) / 2.0;
    }
    return out;
}
}
