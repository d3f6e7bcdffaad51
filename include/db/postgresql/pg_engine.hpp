#pragma once

#include "db/sql_engine_base.hpp"

#include <map>
#include <string_view>

namespace dbsurvey {

/**
 * @brief PostgreSQL engine: pg_catalog / information_schema introspection
 *
 * Creates:
 * - PgConnectionFactory -> ConnectionPool
 * - unified schema entities from catalog queries
 *
 * Wrapped by AdapterBridge<PgEngine> for orchestration.
 */
class PgEngine : public SqlEngineBase {
public:
    static constexpr DatabaseType kType = DatabaseType::POSTGRESQL;

    PgEngine() : SqlEngineBase(SqlDialect::POSTGRESQL) {}

    [[nodiscard]] Result<void> open(const ConnectionParams& params);

    [[nodiscard]] Result<std::vector<DatabaseInfo>> enumerate_databases();
    [[nodiscard]] Result<ServerInfo> describe_server();
    [[nodiscard]] Result<DatabaseInfo> describe_database();

    [[nodiscard]] Result<std::vector<Table>> load_tables();
    [[nodiscard]] Result<std::vector<View>> load_views();
    [[nodiscard]] Result<std::vector<Index>> load_indexes();
    [[nodiscard]] Result<std::vector<Constraint>> load_constraints();
    [[nodiscard]] Result<std::vector<Routine>> load_routines();
    [[nodiscard]] Result<std::vector<Trigger>> load_triggers();
    [[nodiscard]] Result<std::vector<CustomType>> load_custom_types();

    /**
     * @brief pg_class.reltuples estimate when the table has been analyzed,
     *        exact COUNT(*) otherwise
     */
    [[nodiscard]] std::optional<uint64_t> count_rows(const Table& table);

    [[nodiscard]] bool supports(AdapterFeature feature) const;

private:
    using ColumnMap = std::map<std::pair<std::string, std::string>, std::vector<Column>>;

    /**
     * @brief Columns of every readable relation keyed by (schema, relation)
     */
    [[nodiscard]] Result<ColumnMap> load_columns();
};

} // namespace dbsurvey
