#include "aggregator/result_aggregator.hpp"

#include <algorithm>

namespace dbsurvey {

ResultAggregator::ResultAggregator() : started_at_(utils::now()) {}

void ResultAggregator::add_database(DatabaseSchema schema) {
    databases_.push_back(std::move(schema));
}

void ResultAggregator::add_failure(DatabaseInfo base, DatabaseFailure failure) {
    DatabaseSchema placeholder;
    placeholder.database_info = std::move(base);
    placeholder.database_info.name = failure.database_name;
    placeholder.database_info.collection_status = CollectionStatus::failed(failure.error);
    databases_.push_back(std::move(placeholder));
    failures_.push_back(std::move(failure));
}

void ResultAggregator::add_skipped(DatabaseInfo base, std::string reason) {
    DatabaseSchema placeholder;
    placeholder.database_info = std::move(base);
    placeholder.database_info.collection_status = CollectionStatus::skipped(std::move(reason));
    databases_.push_back(std::move(placeholder));
}

size_t ResultAggregator::collected_count() const {
    return static_cast<size_t>(std::count_if(databases_.begin(), databases_.end(),
        [](const DatabaseSchema& db) {
            const auto& status = db.database_info.collection_status;
            return status.is_success() || status.is_partial();
        }));
}

CollectionResult ResultAggregator::finish() {
    CollectionResult result;

    std::stable_sort(databases_.begin(), databases_.end(),
        [](const DatabaseSchema& a, const DatabaseSchema& b) {
            return a.database_info.name < b.database_info.name;
        });
    std::stable_sort(failures_.begin(), failures_.end(),
        [](const DatabaseFailure& a, const DatabaseFailure& b) {
            return a.database_name < b.database_name;
        });

    result.server_info = std::move(server_info_);
    result.databases = std::move(databases_);
    result.failures = std::move(failures_);
    result.metadata.collected_at = started_at_;
    result.metadata.duration_ms = static_cast<uint64_t>(timer_.elapsed_ms().count());
    result.metadata.warnings = std::move(warnings_);
    return result;
}

} // namespace dbsurvey
