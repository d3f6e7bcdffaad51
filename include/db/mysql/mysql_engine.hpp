#pragma once

#include "db/sql_engine_base.hpp"

#include <map>
#include <string_view>

namespace dbsurvey {

/**
 * @brief MySQL/MariaDB engine: INFORMATION_SCHEMA introspection
 *
 * A MySQL database is a schema, so catalog queries are scoped with
 * DATABASE() and tables carry no separate schema name.
 */
class MysqlEngine : public SqlEngineBase {
public:
    static constexpr DatabaseType kType = DatabaseType::MYSQL;

    MysqlEngine() : SqlEngineBase(SqlDialect::MYSQL) {}

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

    /// MySQL has no user-defined types
    [[nodiscard]] Result<std::vector<CustomType>> load_custom_types() {
        return Result<std::vector<CustomType>>::ok({});
    }

    [[nodiscard]] bool supports(AdapterFeature feature) const;

private:
    using ColumnMap = std::map<std::string, std::vector<Column>>;

    [[nodiscard]] Result<ColumnMap> load_columns();
};

} // namespace dbsurvey
