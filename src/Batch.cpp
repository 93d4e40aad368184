#include "Batch.h"
#include "CommonUtils.h"
#include "SandyExceptions.h"

namespace {
const std::string kTauE = "tau_E";
}

namespace BatchColumns {
void requirePresent(const ColumnMap& columns, const std::vector<std::string>& names) {
    std::vector<std::string> missing;
    for (const auto& name : names) {
        if (columns.find(name) == columns.end()) missing.push_back(name);
    }
    if (!missing.empty()) {
        throw Sandy::ValidationException("missing required column(s): " + CommonUtils::joinNames(missing));
    }
}

size_t requireAligned(const ColumnMap& columns, const std::vector<std::string>& names) {
    if (names.empty()) return 0;
    const size_t n = columns.at(names.front()).size();
    for (const auto& name : names) {
        const size_t len = columns.at(name).size();
        if (len != n) {
            throw Sandy::ValidationException("column '" + name + "' has " + std::to_string(len) +
                                             " rows, expected " + std::to_string(n));
        }
    }
    return n;
}
}

const std::vector<std::string>& Batch::requiredColumns() {
    static const std::vector<std::string> names = {
        "time", "H98y2", "P_rad", "P_input", "f_ELM", "DeltaW_ELM"
    };
    return names;
}

Batch Batch::fromColumns(const ColumnMap& columns) {
    const auto& required = requiredColumns();
    BatchColumns::requirePresent(columns, required);

    std::vector<std::string> aligned = required;
    const bool withTau = columns.find(kTauE) != columns.end();
    if (withTau) aligned.push_back(kTauE);
    BatchColumns::requireAligned(columns, aligned);

    Batch batch;
    batch.time_ = columns.at("time");
    batch.h98y2_ = columns.at("H98y2");
    batch.pRad_ = columns.at("P_rad");
    batch.pInput_ = columns.at("P_input");
    batch.fElm_ = columns.at("f_ELM");
    batch.deltaWElm_ = columns.at("DeltaW_ELM");
    if (withTau) batch.tauE_ = columns.at(kTauE);
    return batch;
}

Batch Batch::fromSamples(const std::vector<Sample>& samples) {
    Batch batch;
    const size_t n = samples.size();
    batch.time_.reserve(n);
    batch.h98y2_.reserve(n);
    batch.pRad_.reserve(n);
    batch.pInput_.reserve(n);
    batch.fElm_.reserve(n);
    batch.deltaWElm_.reserve(n);

    bool allTau = n > 0;
    for (const auto& s : samples) {
        batch.time_.push_back(s.time);
        batch.h98y2_.push_back(s.h98y2);
        batch.pRad_.push_back(s.pRad);
        batch.pInput_.push_back(s.pInput);
        batch.fElm_.push_back(s.fElm);
        batch.deltaWElm_.push_back(s.deltaWElm);
        if (!s.tauE) allTau = false;
    }
    if (allTau) {
        batch.tauE_.reserve(n);
        for (const auto& s : samples) batch.tauE_.push_back(*s.tauE);
    }
    return batch;
}

Sample Batch::sample(size_t i) const {
    Sample s;
    s.time = time_.at(i);
    s.h98y2 = h98y2_.at(i);
    s.pRad = pRad_.at(i);
    s.pInput = pInput_.at(i);
    s.fElm = fElm_.at(i);
    s.deltaWElm = deltaWElm_.at(i);
    if (hasTauE()) s.tauE = tauE_.at(i);
    return s;
}
