#pragma once

#include "core/data_type.hpp"
#include "core/database_type.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace dbsurvey {

/**
 * @brief Engine-native type as reported by the catalog
 *
 * PostgreSQL: type_name = information_schema data_type, full_type = udt_name
 * MySQL:      type_name = DATA_TYPE, full_type = COLUMN_TYPE
 * SQLite:     type_name = declared type
 * MongoDB:    type_name = BSON type alias ("string", "objectId", ...)
 */
struct NativeTypeDescriptor {
    std::string type_name;
    std::string full_type;
    std::optional<uint32_t> max_length;
    std::optional<uint32_t> numeric_precision;
    std::optional<uint32_t> numeric_scale;
};

/**
 * @brief Map an engine-native type to the unified representation
 *
 * Deterministic and total: anything not recognised becomes
 * Custom{original name, engine}. Metadata the engine does not expose
 * stays unset.
 */
[[nodiscard]] UnifiedDataType map_type(DatabaseType engine, const NativeTypeDescriptor& native);

} // namespace dbsurvey
