#include "sampling/quality_analyzer.hpp"

#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <format>
#include <numeric>
#include <unordered_set>

namespace dbsurvey {

namespace {

constexpr double kMinStdDev = 1e-10;
constexpr size_t kMinNumericValues = 3;
constexpr double kCriticalFactor = 0.8;

// Fixed order so ties between equally common types resolve the same way every run
constexpr std::array<std::string_view, 5> kTypeNames = {"boolean", "number", "string", "array", "object"};

size_t type_slot(const nlohmann::json& v) {
    if (v.is_boolean()) return 0;
    if (v.is_number()) return 1;
    if (v.is_string()) return 2;
    if (v.is_array()) return 3;
    return 4;
}

// ============================================================================
// String format heuristics
// ============================================================================

enum class Format : size_t { UUID, ISO_DATETIME, ISO_DATE, EMAIL, NONE };
constexpr size_t kFormatCount = 5;
constexpr std::array<std::string_view, 4> kFormatNames = {"uuid", "iso_datetime", "iso_date", "email"};

bool looks_like_uuid(std::string_view s) {
    if (s.size() != 36) return false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (s[i] != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(s[i]))) {
            return false;
        }
    }
    return true;
}

Format detect_format(std::string_view s) {
    if (looks_like_uuid(s)) return Format::UUID;
    if (s.size() >= 19 && s.find('T') != std::string_view::npos &&
        s.find(':') != std::string_view::npos) {
        return Format::ISO_DATETIME;
    }
    if (s.size() == 10 && s[4] == '-' && s[7] == '-') return Format::ISO_DATE;
    if (s.find('@') != std::string_view::npos && s.find('.') != std::string_view::npos) {
        return Format::EMAIL;
    }
    return Format::NONE;
}

std::optional<double> numeric_value(const nlohmann::json& v) {
    double d = 0.0;
    if (v.is_number()) {
        d = v.get<double>();
    } else if (v.is_string()) {
        const auto& s = v.get_ref<const std::string&>();
        const auto* first = s.data();
        const auto* last = s.data() + s.size();
        auto [ptr, ec] = std::from_chars(first, last, d);
        if (ec != std::errc{} || ptr != last || s.empty()) return std::nullopt;
    } else {
        return std::nullopt;
    }
    if (!std::isfinite(d)) return std::nullopt;
    return d;
}

const nlohmann::json* cell(const nlohmann::json& row, const std::string& column) {
    if (!row.is_object()) return nullptr;
    const auto it = row.find(column);
    return it == row.end() ? nullptr : &*it;
}

std::vector<std::string> column_names(const std::vector<nlohmann::json>& rows) {
    std::vector<std::string> names;
    if (rows.empty() || !rows.front().is_object()) return names;
    for (const auto& [key, _] : rows.front().items()) names.push_back(key);
    return names;
}

} // namespace

// ============================================================================
// QualityAnalyzer
// ============================================================================

std::optional<double> QualityAnalyzer::z_threshold_for(std::string_view sensitivity) {
    if (sensitivity == "low") return 3.0;
    if (sensitivity == "medium") return 2.5;
    if (sensitivity == "high") return 2.0;
    return std::nullopt;
}

QualityAnalyzer::QualityAnalyzer(const QualityConfig& config)
    : config_(config),
      z_threshold_(z_threshold_for(config.anomaly_sensitivity).value_or(2.5)) {}

TableQualityMetrics QualityAnalyzer::analyze(const TableSample& sample) const {
    TableQualityMetrics metrics;
    metrics.table_name = sample.table_name;
    metrics.schema_name = sample.schema_name;
    metrics.analyzed_rows = sample.rows.size();
    metrics.analyzed_at = utils::now();
    if (!config_.enabled) return metrics;

    const auto columns = column_names(sample.rows);
    metrics.completeness = completeness(sample.rows, columns);
    metrics.consistency = consistency(sample.rows, columns);
    metrics.uniqueness = uniqueness(sample.rows, columns);
    if (config_.anomaly_enabled) {
        metrics.anomalies = anomalies(sample.rows, columns);
    }

    metrics.quality_score = (metrics.completeness.score + metrics.consistency.score +
                             metrics.uniqueness.score) / 3.0;

    check_threshold(metrics, "completeness", config_.completeness_min, metrics.completeness.score);
    check_threshold(metrics, "uniqueness", config_.uniqueness_min, metrics.uniqueness.score);
    check_threshold(metrics, "consistency", config_.consistency_min, metrics.consistency.score);
    return metrics;
}

std::vector<TableQualityMetrics> QualityAnalyzer::analyze_all(
    const std::vector<TableSample>& samples) const {
    std::vector<TableQualityMetrics> out;
    out.reserve(samples.size());
    for (const auto& sample : samples) out.push_back(analyze(sample));
    return out;
}

std::vector<std::string> QualityAnalyzer::violation_warnings(const TableQualityMetrics& metrics) {
    std::vector<std::string> warnings;
    for (const auto& v : metrics.threshold_violations) {
        warnings.push_back(std::format("Quality violation in '{}': {} = {:.2f}% (threshold: {:.2f}%)",
                                       metrics.table_name, v.metric,
                                       v.actual * 100.0, v.threshold * 100.0));
    }
    return warnings;
}

void QualityAnalyzer::check_threshold(TableQualityMetrics& metrics, std::string_view metric,
                                      double threshold, double actual) const {
    if (actual >= threshold) return;
    metrics.threshold_violations.push_back(ThresholdViolation{
        std::string(metric), threshold, actual,
        actual < threshold * kCriticalFactor ? "critical" : "warning"});
}

// ---- Completeness ----------------------------------------------------------

CompletenessMetrics QualityAnalyzer::completeness(const std::vector<nlohmann::json>& rows,
                                                  const std::vector<std::string>& columns) {
    CompletenessMetrics m;
    if (columns.empty()) return m;

    const uint64_t total = rows.size();
    double sum = 0.0;
    for (const auto& column : columns) {
        ColumnCompleteness c;
        c.column_name = column;
        c.total_count = total;
        for (const auto& row : rows) {
            const auto* v = cell(row, column);
            if (!v || v->is_null()) {
                ++c.null_count;
            } else if (v->is_string() && v->get_ref<const std::string&>().empty()) {
                ++c.empty_count;
            }
        }
        if (total > 0) {
            const double present = static_cast<double>(total - c.null_count - c.empty_count);
            c.completeness = std::clamp(present / static_cast<double>(total), 0.0, 1.0);
        }
        m.total_nulls += c.null_count;
        m.total_empty += c.empty_count;
        sum += c.completeness;
        m.column_details.push_back(std::move(c));
    }
    m.score = sum / static_cast<double>(columns.size());
    return m;
}

// ---- Consistency -----------------------------------------------------------

ConsistencyMetrics QualityAnalyzer::consistency(const std::vector<nlohmann::json>& rows,
                                                const std::vector<std::string>& columns) {
    ConsistencyMetrics m;
    if (columns.empty() || rows.empty()) return m;

    uint64_t issues = 0;
    for (const auto& column : columns) {
        std::array<uint64_t, kTypeNames.size()> type_counts{};
        std::array<uint64_t, kFormatCount> format_counts{};

        for (const auto& row : rows) {
            const auto* v = cell(row, column);
            if (!v || v->is_null()) continue;
            ++type_counts[type_slot(*v)];
            if (v->is_string()) {
                const auto& s = v->get_ref<const std::string&>();
                if (!s.empty()) ++format_counts[static_cast<size_t>(detect_format(s))];
            }
        }

        const auto types_seen = std::count_if(type_counts.begin(), type_counts.end(),
                                              [](uint64_t n) { return n > 0; });
        if (types_seen > 1) {
            const auto dominant = static_cast<size_t>(
                std::max_element(type_counts.begin(), type_counts.end()) - type_counts.begin());
            TypeInconsistency t;
            t.column_name = column;
            t.expected_type = std::string(kTypeNames[dominant]);
            for (size_t i = 0; i < type_counts.size(); ++i) {
                if (i == dominant || type_counts[i] == 0) continue;
                t.found_types.emplace_back(kTypeNames[i]);
                t.inconsistent_count += type_counts[i];
            }
            issues += t.inconsistent_count;
            m.type_inconsistencies.push_back(std::move(t));
        }

        // Unrecognized strings count toward the total but never dominate
        const auto recognized_end = format_counts.begin() + static_cast<long>(Format::NONE);
        const auto dominant_it = std::max_element(format_counts.begin(), recognized_end);
        const uint64_t dominant_count = *dominant_it;
        const uint64_t formatted = std::accumulate(format_counts.begin(), format_counts.end(), uint64_t{0});
        if (dominant_count == 0 ||
            static_cast<double>(dominant_count) / static_cast<double>(formatted) <= 0.5) {
            continue;
        }
        const uint64_t violations = formatted - dominant_count;
        if (violations > 0) {
            const auto fmt = static_cast<size_t>(dominant_it - format_counts.begin());
            m.format_violations.push_back(
                FormatViolation{column, std::string(kFormatNames[fmt]), violations});
            issues += violations;
        }
    }

    const double cells = static_cast<double>(rows.size() * columns.size());
    m.score = std::max(0.0, 1.0 - static_cast<double>(issues) / cells);
    return m;
}

// ---- Uniqueness ------------------------------------------------------------

UniquenessMetrics QualityAnalyzer::uniqueness(const std::vector<nlohmann::json>& rows,
                                              const std::vector<std::string>& columns) {
    UniquenessMetrics m;
    if (rows.empty()) return m;

    const uint64_t total = rows.size();
    double column_sum = 0.0;
    for (const auto& column : columns) {
        std::unordered_set<std::string> seen;
        uint64_t duplicates = 0;
        for (const auto& row : rows) {
            const auto* v = cell(row, column);
            const std::string key = (!v || v->is_null()) ? "__NULL__" : v->dump();
            if (!seen.insert(key).second) ++duplicates;
        }
        if (duplicates == 0) continue;
        const double ratio = static_cast<double>(total - duplicates) / static_cast<double>(total);
        column_sum += ratio;
        m.columns_with_duplicates.push_back(ColumnUniqueness{column, total, duplicates, ratio});
    }

    // nlohmann::json objects keep their keys sorted, so dump() is canonical
    std::unordered_set<std::string> seen_rows;
    for (const auto& row : rows) {
        if (!seen_rows.insert(row.dump()).second) ++m.duplicate_row_count;
    }

    const double row_uniqueness =
        static_cast<double>(total - m.duplicate_row_count) / static_cast<double>(total);
    const double column_uniqueness = m.columns_with_duplicates.empty()
        ? 1.0
        : column_sum / static_cast<double>(m.columns_with_duplicates.size());
    m.score = std::min(row_uniqueness, column_uniqueness);
    return m;
}

// ---- Anomalies -------------------------------------------------------------

AnomalyMetrics QualityAnalyzer::anomalies(const std::vector<nlohmann::json>& rows,
                                          const std::vector<std::string>& columns) const {
    AnomalyMetrics m;
    for (const auto& column : columns) {
        std::vector<double> values;
        for (const auto& row : rows) {
            const auto* v = cell(row, column);
            if (!v) continue;
            if (auto d = numeric_value(*v)) values.push_back(*d);
        }
        if (values.size() < kMinNumericValues) continue;

        const double n = static_cast<double>(values.size());
        const double mean = std::accumulate(values.begin(), values.end(), 0.0) / n;
        double sq_sum = 0.0;
        for (double v : values) sq_sum += (v - mean) * (v - mean);
        const double stddev = std::sqrt(sq_sum / n);
        if (stddev < kMinStdDev) continue;

        const auto outliers = static_cast<uint64_t>(std::count_if(
            values.begin(), values.end(),
            [&](double v) { return std::abs((v - mean) / stddev) > z_threshold_; }));
        if (outliers == 0) continue;

        m.outliers.push_back(ColumnOutliers{column, outliers, z_threshold_, mean, stddev});
        m.total_outliers += outliers;
    }
    return m;
}

} // namespace dbsurvey
