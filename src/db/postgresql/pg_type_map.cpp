#include "db/postgresql/pg_type_map.hpp"
#include "core/utils.hpp"

namespace dbsurvey {

namespace {

constexpr const char* kEngine = "postgresql";

UnifiedDataType scalar_to_unified(const std::string& name, const NativeTypeDescriptor& native) {
    using namespace types;

    if (name == "smallint" || name == "int2" || name == "smallserial") return UnifiedDataType::integer(16);
    if (name == "integer" || name == "int" || name == "int4" || name == "serial") return UnifiedDataType::integer(32);
    if (name == "bigint" || name == "int8" || name == "bigserial") return UnifiedDataType::integer(64);
    if (name == "oid") return UnifiedDataType::integer(32, false);

    if (name == "real" || name == "float4") return {Float{24}};
    if (name == "double precision" || name == "float8") return {Float{53}};
    if (name == "numeric" || name == "decimal") {
        return {Decimal{native.numeric_precision, native.numeric_scale}};
    }

    if (name == "character varying" || name == "varchar") {
        return UnifiedDataType::string(native.max_length);
    }
    if (name == "character" || name == "char" || name == "bpchar") {
        return UnifiedDataType::string(native.max_length, true);
    }
    if (name == "text" || name == "name" || name == "citext") return UnifiedDataType::string();

    if (name == "boolean" || name == "bool") return {Boolean{}};

    if (name == "timestamp" || name == "timestamp without time zone") return {DateTime{false}};
    if (name == "timestamptz" || name == "timestamp with time zone") return {DateTime{true}};
    if (name == "date") return {Date{}};
    if (name == "time" || name == "time without time zone" ||
        name == "timetz" || name == "time with time zone") {
        return {Time{}};
    }

    if (name == "bytea") return {Binary{}};
    if (name == "json" || name == "jsonb") return {Json{}};

    return UnifiedDataType::custom(name, kEngine);
}

} // namespace

UnifiedDataType PgTypeMap::to_unified(const NativeTypeDescriptor& native) {
    const std::string data_type = utils::to_lower(native.type_name);
    const std::string udt = utils::to_lower(native.full_type);

    if (data_type == "array" || (data_type.empty() && udt.starts_with("_"))) {
        const std::string element = udt.starts_with("_") ? udt.substr(1) : udt;
        if (element.empty()) {
            return UnifiedDataType::array_of(UnifiedDataType::custom("unknown", kEngine));
        }
        return UnifiedDataType::array_of(scalar_to_unified(element, NativeTypeDescriptor{}));
    }

    if (data_type == "user-defined") {
        // Enums, domains, extension types: keep the real type name
        return UnifiedDataType::custom(udt.empty() ? native.type_name : native.full_type, kEngine);
    }

    if (data_type.empty()) {
        return scalar_to_unified(udt, native);
    }
    return scalar_to_unified(data_type, native);
}

CellKind PgTypeMap::oid_to_cell_kind(uint32_t oid) {
    switch (oid) {
        case 20: case 21: case 23: case 26:
            return CellKind::INTEGER;
        case 700: case 701:
            return CellKind::REAL;
        case 1700:
            return CellKind::DECIMAL;
        case 16:
            return CellKind::BOOLEAN;
        case kByteaOid:
            return CellKind::BLOB;
        default:
            return CellKind::TEXT;
    }
}

} // namespace dbsurvey
