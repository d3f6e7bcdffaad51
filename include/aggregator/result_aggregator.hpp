#pragma once

#include "core/collection_types.hpp"
#include "core/utils.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace dbsurvey {

/**
 * @brief Assembles the versioned CollectionResult for one run
 *
 * Per-database results may arrive in any order; finish() emits databases
 * and failures sorted by name so two runs over the same server compare
 * equal regardless of scheduling.
 */
class ResultAggregator {
public:
    ResultAggregator();

    void set_server_info(ServerInfo info) { server_info_ = std::move(info); }

    void add_database(DatabaseSchema schema);

    /**
     * @brief Record a failed database: a Failed placeholder entry plus a failure record
     *
     * base supplies what discovery already knew about the database
     * (size, owner, flags); its status is replaced.
     */
    void add_failure(DatabaseInfo base, DatabaseFailure failure);

    /**
     * @brief Record a database that was deliberately not collected
     */
    void add_skipped(DatabaseInfo base, std::string reason);

    void add_warning(std::string warning) { warnings_.push_back(std::move(warning)); }

    [[nodiscard]] size_t collected_count() const;
    [[nodiscard]] size_t failed_count() const { return failures_.size(); }

    [[nodiscard]] CollectionResult finish();

private:
    ServerInfo server_info_;
    std::vector<DatabaseSchema> databases_;
    std::vector<DatabaseFailure> failures_;
    std::vector<std::string> warnings_;
    std::chrono::system_clock::time_point started_at_;
    utils::Timer timer_;
};

} // namespace dbsurvey
