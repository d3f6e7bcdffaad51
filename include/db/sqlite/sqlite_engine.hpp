#pragma once

#include "db/sql_engine_base.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace dbsurvey {

/**
 * @brief SQLite engine: sqlite_master + PRAGMA introspection
 *
 * One file is one database ("main"); there is nothing to enumerate
 * beyond it, no schemas, no routines and no user-defined types.
 */
class SqliteEngine : public SqlEngineBase {
public:
    static constexpr DatabaseType kType = DatabaseType::SQLITE;

    SqliteEngine() : SqlEngineBase(SqlDialect::SQLITE) {}

    [[nodiscard]] Result<void> open(const ConnectionParams& params);

    /// The attached file as a single database
    [[nodiscard]] Result<std::vector<DatabaseInfo>> enumerate_databases();
    [[nodiscard]] Result<ServerInfo> describe_server();
    [[nodiscard]] Result<DatabaseInfo> describe_database();

    [[nodiscard]] Result<std::vector<Table>> load_tables();
    [[nodiscard]] Result<std::vector<View>> load_views();
    [[nodiscard]] Result<std::vector<Index>> load_indexes();

    /**
     * @brief PRIMARY KEY, FOREIGN KEY and UNIQUE constraints
     *
     * Built from the tables and indexes this engine last loaded; the
     * catalog is only read again when they have not been loaded yet.
     * CHECK constraints live only in the CREATE TABLE text and are not
     * reported.
     */
    [[nodiscard]] Result<std::vector<Constraint>> load_constraints();

    [[nodiscard]] static std::vector<Constraint> build_constraints(const std::vector<Table>& tables,
                                                                   const std::vector<Index>& indexes);

    [[nodiscard]] Result<std::vector<Routine>> load_routines() {
        return Result<std::vector<Routine>>::ok({});
    }

    [[nodiscard]] Result<std::vector<Trigger>> load_triggers();

    [[nodiscard]] Result<std::vector<CustomType>> load_custom_types() {
        return Result<std::vector<CustomType>>::ok({});
    }

    [[nodiscard]] bool supports(AdapterFeature feature) const;

    /**
     * @brief Timing and events of a CREATE TRIGGER statement
     *
     * SQLite defaults to BEFORE when no timing keyword is present.
     */
    [[nodiscard]] static Trigger parse_trigger_sql(std::string_view sql);

    /// Name reported for the attached database
    [[nodiscard]] std::string database_name() const;

private:
    /**
     * @brief Columns from table_info; fills primary_key when given and the relation has one
     */
    [[nodiscard]] Result<std::vector<Column>> load_columns(const std::string& relation,
                                                           const std::string& create_sql,
                                                           std::optional<PrimaryKey>* primary_key = nullptr);
    [[nodiscard]] Result<std::vector<ForeignKey>> load_foreign_keys(const std::string& table);

    /**
     * @brief Whether the table exposes rowid (false for WITHOUT ROWID tables)
     */
    [[nodiscard]] bool has_rowid(const Table& table);

    std::optional<std::vector<Table>> loaded_tables_;
    std::optional<std::vector<Index>> loaded_indexes_;
};

} // namespace dbsurvey
