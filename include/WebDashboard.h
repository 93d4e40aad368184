#pragma once

#include "DiagnosticConfig.h"

class WebDashboard {
public:
    /**
     * @brief Serves the diagnostic pipeline over HTTP until the server stops.
     * @param base Defaults for every request; POST /api/diagnose may override analysis keys via query parameters.
     * @return 0 on clean shutdown, 1 if the listener could not be bound.
     */
    int start(const DiagnosticConfig& base);
};
