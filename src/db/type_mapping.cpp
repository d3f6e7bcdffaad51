#include "db/type_mapping.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "db/mysql/mysql_type_map.hpp"
#include "db/sqlite/sqlite_type_map.hpp"
#include "db/mongodb/bson_type_map.hpp"

namespace dbsurvey {

UnifiedDataType map_type(DatabaseType engine, const NativeTypeDescriptor& native) {
    switch (engine) {
        case DatabaseType::POSTGRESQL: return PgTypeMap::to_unified(native);
        case DatabaseType::MYSQL: return MysqlTypeMap::to_unified(native);
        case DatabaseType::SQLITE: return SqliteTypeMap::to_unified(native);
        case DatabaseType::MONGODB: return BsonTypeMap::to_unified(native);
        default:
            return UnifiedDataType::custom(native.type_name, std::string(database_type_to_string(engine)));
    }
}

} // namespace dbsurvey
