#include "db/mysql/mysql_type_map.hpp"
#include "core/utils.hpp"
#include <unordered_map>

namespace dbsurvey {

namespace {

constexpr const char* kEngine = "mysql";

enum class MysqlFamily {
    INTEGER, BOOLEAN, FLOAT, DOUBLE, DECIMAL, CHAR, VARCHAR, TEXT,
    BINARY, BLOB, DATE, TIME, DATETIME, TIMESTAMP, YEAR, JSON,
};

const std::unordered_map<std::string, MysqlFamily>& family_map() {
    static const std::unordered_map<std::string, MysqlFamily> TYPE_MAP = {
        {"tinyint", MysqlFamily::INTEGER},
        {"smallint", MysqlFamily::INTEGER},
        {"mediumint", MysqlFamily::INTEGER},
        {"int", MysqlFamily::INTEGER},
        {"integer", MysqlFamily::INTEGER},
        {"bigint", MysqlFamily::INTEGER},
        {"bool", MysqlFamily::BOOLEAN},
        {"boolean", MysqlFamily::BOOLEAN},
        {"float", MysqlFamily::FLOAT},
        {"double", MysqlFamily::DOUBLE},
        {"real", MysqlFamily::DOUBLE},
        {"decimal", MysqlFamily::DECIMAL},
        {"numeric", MysqlFamily::DECIMAL},
        {"char", MysqlFamily::CHAR},
        {"varchar", MysqlFamily::VARCHAR},
        {"tinytext", MysqlFamily::TEXT},
        {"text", MysqlFamily::TEXT},
        {"mediumtext", MysqlFamily::TEXT},
        {"longtext", MysqlFamily::TEXT},
        {"binary", MysqlFamily::BINARY},
        {"varbinary", MysqlFamily::BINARY},
        {"tinyblob", MysqlFamily::BLOB},
        {"blob", MysqlFamily::BLOB},
        {"mediumblob", MysqlFamily::BLOB},
        {"longblob", MysqlFamily::BLOB},
        {"date", MysqlFamily::DATE},
        {"time", MysqlFamily::TIME},
        {"datetime", MysqlFamily::DATETIME},
        {"timestamp", MysqlFamily::TIMESTAMP},
        {"year", MysqlFamily::YEAR},
        {"json", MysqlFamily::JSON},
    };
    return TYPE_MAP;
}

uint8_t integer_bits(const std::string& data_type) {
    if (data_type == "tinyint") return 8;
    if (data_type == "smallint") return 16;
    if (data_type == "mediumint") return 24;
    if (data_type == "bigint") return 64;
    return 32;
}

} // namespace

UnifiedDataType MysqlTypeMap::to_unified(const NativeTypeDescriptor& native) {
    using namespace types;

    const std::string data_type = utils::to_lower(native.type_name);
    const std::string column_type = utils::to_lower(native.full_type);

    const auto it = family_map().find(data_type);
    if (it == family_map().end()) {
        // enum('a','b'), set(...), bit(n), geometry, ...: keep the full declaration
        return UnifiedDataType::custom(
            native.full_type.empty() ? native.type_name : native.full_type, kEngine);
    }

    switch (it->second) {
        case MysqlFamily::INTEGER:
            if (column_type.starts_with("tinyint(1)")) {
                return {Boolean{}};
            }
            return UnifiedDataType::integer(integer_bits(data_type),
                                            column_type.find("unsigned") == std::string::npos);
        case MysqlFamily::BOOLEAN: return {Boolean{}};
        case MysqlFamily::FLOAT: return {Float{24}};
        case MysqlFamily::DOUBLE: return {Float{53}};
        case MysqlFamily::DECIMAL: return {Decimal{native.numeric_precision, native.numeric_scale}};
        case MysqlFamily::CHAR: return UnifiedDataType::string(native.max_length, true);
        case MysqlFamily::VARCHAR:
        case MysqlFamily::TEXT:
            return UnifiedDataType::string(native.max_length);
        case MysqlFamily::BINARY:
        case MysqlFamily::BLOB:
            return {Binary{native.max_length}};
        case MysqlFamily::DATE: return {Date{}};
        case MysqlFamily::TIME: return {Time{}};
        case MysqlFamily::DATETIME: return {DateTime{false}};
        // TIMESTAMP values are stored as UTC and converted to the session zone
        case MysqlFamily::TIMESTAMP: return {DateTime{true}};
        case MysqlFamily::YEAR: return UnifiedDataType::integer(16, false);
        case MysqlFamily::JSON: return {Json{}};
        default:
            return UnifiedDataType::custom(native.type_name, kEngine);
    }
}

} // namespace dbsurvey
