#pragma once

#include "db/type_mapping.hpp"

namespace dbsurvey {

/**
 * @brief BSON type alias mapping ("string", "objectId", "date", ...)
 *
 * Object and Array come back without fields/element; the schema
 * inference fills those in from sampled documents.
 */
class BsonTypeMap {
public:
    [[nodiscard]] static UnifiedDataType to_unified(const NativeTypeDescriptor& native);
};

} // namespace dbsurvey
