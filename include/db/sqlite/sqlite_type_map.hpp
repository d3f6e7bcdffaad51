#pragma once

#include "db/type_mapping.hpp"

namespace dbsurvey {

/**
 * @brief SQLite declared-type mapping
 *
 * Recognises common explicit declarations (BOOLEAN, DATETIME, DATE, TIME,
 * JSON) first, then applies SQLite's column affinity rules so every
 * declaration maps somewhere.
 */
class SqliteTypeMap {
public:
    [[nodiscard]] static UnifiedDataType to_unified(const NativeTypeDescriptor& native);
};

} // namespace dbsurvey
