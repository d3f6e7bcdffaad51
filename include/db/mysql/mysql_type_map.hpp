#pragma once

#include "db/type_mapping.hpp"
#include <string>

namespace dbsurvey {

/**
 * @brief MySQL/MariaDB type mapping utilities
 *
 * Works from INFORMATION_SCHEMA.COLUMNS (DATA_TYPE + COLUMN_TYPE), so it
 * needs no client library headers.
 */
class MysqlTypeMap {
public:
    /**
     * @brief Map DATA_TYPE/COLUMN_TYPE to UnifiedDataType
     *
     * COLUMN_TYPE supplies signedness ("int(10) unsigned") and the
     * tinyint(1) boolean convention.
     */
    [[nodiscard]] static UnifiedDataType to_unified(const NativeTypeDescriptor& native);
};

} // namespace dbsurvey
