#pragma once

#include "config/config_types.hpp"
#include "core/collection_types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dbsurvey {

/**
 * @brief Scores sampled rows for completeness, consistency and uniqueness
 *
 * Works purely on a TableSample already in memory; issues no queries.
 * Columns are taken from the keys of the first row. Outliers are found
 * with a population z-score over every finite numeric value (numbers and
 * numeric strings) once a column holds at least three of them.
 */
class QualityAnalyzer {
public:
    QualityAnalyzer() : QualityAnalyzer(QualityConfig{}) {}
    explicit QualityAnalyzer(const QualityConfig& config);

    [[nodiscard]] TableQualityMetrics analyze(const TableSample& sample) const;

    [[nodiscard]] std::vector<TableQualityMetrics> analyze_all(
        const std::vector<TableSample>& samples) const;

    /// One warning line per threshold violation
    [[nodiscard]] static std::vector<std::string> violation_warnings(const TableQualityMetrics& metrics);

    /// z-score for "low", "medium" or "high"; nullopt for anything else
    [[nodiscard]] static std::optional<double> z_threshold_for(std::string_view sensitivity);

    [[nodiscard]] bool enabled() const { return config_.enabled; }

private:
    [[nodiscard]] static CompletenessMetrics completeness(const std::vector<nlohmann::json>& rows,
                                                          const std::vector<std::string>& columns);
    [[nodiscard]] static ConsistencyMetrics consistency(const std::vector<nlohmann::json>& rows,
                                                        const std::vector<std::string>& columns);
    [[nodiscard]] static UniquenessMetrics uniqueness(const std::vector<nlohmann::json>& rows,
                                                      const std::vector<std::string>& columns);
    [[nodiscard]] AnomalyMetrics anomalies(const std::vector<nlohmann::json>& rows,
                                           const std::vector<std::string>& columns) const;

    void check_threshold(TableQualityMetrics& metrics, std::string_view metric,
                         double threshold, double actual) const;

    QualityConfig config_;
    double z_threshold_;
};

} // namespace dbsurvey
