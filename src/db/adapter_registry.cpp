#include "db/adapter_registry.hpp"
#include "db/adapter_bridge.hpp"

#ifdef DBSURVEY_ENABLE_POSTGRESQL
#include "db/postgresql/pg_engine.hpp"
#endif
#ifdef DBSURVEY_ENABLE_MYSQL
#include "db/mysql/mysql_engine.hpp"
#endif
#ifdef DBSURVEY_ENABLE_SQLITE
#include "db/sqlite/sqlite_engine.hpp"
#endif
#ifdef DBSURVEY_ENABLE_MONGODB
#include "db/mongodb/mongo_engine.hpp"
#endif

#include <format>

namespace dbsurvey {

Result<std::unique_ptr<IDatabaseAdapter>> AdapterRegistry::create(DatabaseType type) const {
    const auto it = factories_.find(type);
    if (it == factories_.end()) {
        return Result<std::unique_ptr<IDatabaseAdapter>>::error(ErrorCode::ADAPTER_NOT_FOUND,
            std::format("No adapter available for {} (not enabled in this build)",
                        database_type_to_string(type)));
    }
    return Result<std::unique_ptr<IDatabaseAdapter>>::ok(it->second());
}

std::vector<DatabaseType> AdapterRegistry::available() const {
    std::vector<DatabaseType> types;
    types.reserve(factories_.size());
    for (const auto& [type, factory] : factories_) {
        types.push_back(type);
    }
    return types;
}

AdapterRegistry make_default_registry() {
    AdapterRegistry::Builder builder;
#ifdef DBSURVEY_ENABLE_POSTGRESQL
    builder.add(DatabaseType::POSTGRESQL, [] { return std::make_unique<AdapterBridge<PgEngine>>(); });
#endif
#ifdef DBSURVEY_ENABLE_MYSQL
    builder.add(DatabaseType::MYSQL, [] { return std::make_unique<AdapterBridge<MysqlEngine>>(); });
#endif
#ifdef DBSURVEY_ENABLE_SQLITE
    builder.add(DatabaseType::SQLITE, [] { return std::make_unique<AdapterBridge<SqliteEngine>>(); });
#endif
#ifdef DBSURVEY_ENABLE_MONGODB
    builder.add(DatabaseType::MONGODB, [] { return std::make_unique<AdapterBridge<MongoEngine>>(); });
#endif
    return builder.build();
}

} // namespace dbsurvey
