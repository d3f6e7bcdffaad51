#include "db/mongodb/bson_type_map.hpp"

namespace dbsurvey {

UnifiedDataType BsonTypeMap::to_unified(const NativeTypeDescriptor& native) {
    using namespace types;
    const std::string& t = native.type_name;

    if (t == "double") return {Float{53}};
    if (t == "string") return UnifiedDataType::string();
    if (t == "object") return {Object{}};
    if (t == "array") return {Array{}};
    if (t == "binData") return {Binary{}};
    if (t == "bool") return {Boolean{}};
    if (t == "date") return {DateTime{true}};
    if (t == "int") return UnifiedDataType::integer(32);
    if (t == "long") return UnifiedDataType::integer(64);
    if (t == "decimal") return {Decimal{}};

    // objectId, timestamp, regex, javascript, minKey, maxKey, null, ...
    return UnifiedDataType::custom(t, "mongodb");
}

} // namespace dbsurvey
