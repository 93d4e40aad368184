#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct Sample {
    double time = 0.0;
    double h98y2 = 0.0;
    double pRad = 0.0;
    double pInput = 0.0;
    double fElm = 0.0;
    double deltaWElm = 0.0;
    std::optional<double> tauE; // informational only
};

using ColumnMap = std::unordered_map<std::string, std::vector<double>>;

/**
 * Ordered, time-ascending sample batch stored column-wise.
 * Immutable once built; rows keep the order in which they were supplied.
 */
class Batch {
public:
    static const std::vector<std::string>& requiredColumns();

    /**
     * @brief Builds a batch from named numeric columns.
     * @throws Sandy::ValidationException listing every missing required column,
     *         or when the columns differ in length.
     */
    static Batch fromColumns(const ColumnMap& columns);
    static Batch fromSamples(const std::vector<Sample>& samples);

    size_t size() const { return time_.size(); }
    bool empty() const { return time_.empty(); }
    Sample sample(size_t i) const;

    const std::vector<double>& time() const { return time_; }
    const std::vector<double>& h98y2() const { return h98y2_; }
    const std::vector<double>& pRad() const { return pRad_; }
    const std::vector<double>& pInput() const { return pInput_; }
    const std::vector<double>& fElm() const { return fElm_; }
    const std::vector<double>& deltaWElm() const { return deltaWElm_; }
    bool hasTauE() const { return !tauE_.empty(); }
    const std::vector<double>& tauE() const { return tauE_; }

private:
    std::vector<double> time_;
    std::vector<double> h98y2_;
    std::vector<double> pRad_;
    std::vector<double> pInput_;
    std::vector<double> fElm_;
    std::vector<double> deltaWElm_;
    std::vector<double> tauE_;
};

namespace BatchColumns {
/**
 * @throws Sandy::ValidationException naming all absent columns, in the order given.
 */
void requirePresent(const ColumnMap& columns, const std::vector<std::string>& names);

/**
 * @throws Sandy::ValidationException when the named columns differ in length.
 */
size_t requireAligned(const ColumnMap& columns, const std::vector<std::string>& names);
}
