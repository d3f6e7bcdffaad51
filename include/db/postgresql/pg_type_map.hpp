#pragma once

#include "db/idb_connection.hpp"
#include "db/type_mapping.hpp"
#include <cstdint>
#include <string>

namespace dbsurvey {

/**
 * @brief PostgreSQL type mapping utilities
 *
 * Maps catalog type names to UnifiedDataType, and result-column OIDs to
 * the cell storage class used when encoding sampled values.
 */
class PgTypeMap {
public:
    /**
     * @brief Map a PostgreSQL column type (data_type + udt_name) to UnifiedDataType
     *
     * ARRAY columns resolve their element from udt_name ("_int4" -> int4).
     */
    [[nodiscard]] static UnifiedDataType to_unified(const NativeTypeDescriptor& native);

    /**
     * @brief Storage class for values of a result column with the given OID
     */
    [[nodiscard]] static CellKind oid_to_cell_kind(uint32_t oid);

    static constexpr uint32_t kByteaOid = 17;
};

} // namespace dbsurvey
