#include "db/sqlite/sqlite_type_map.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>

namespace dbsurvey {

namespace {

std::string upper(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

/**
 * @brief "VARCHAR(255)" -> {255}, "DECIMAL(10,2)" -> {10, 2}
 */
std::pair<std::optional<uint32_t>, std::optional<uint32_t>> parse_type_args(const std::string& decl) {
    const auto open = decl.find('(');
    const auto close = decl.find(')', open == std::string::npos ? 0 : open);
    if (open == std::string::npos || close == std::string::npos) return {};

    const auto args = utils::split(decl.substr(open + 1, close - open - 1), ',');
    std::pair<std::optional<uint32_t>, std::optional<uint32_t>> out;
    if (!args.empty()) out.first = utils::try_parse_int<uint32_t>(utils::trim(args[0]));
    if (args.size() > 1) out.second = utils::try_parse_int<uint32_t>(utils::trim(args[1]));
    return out;
}

std::string base_name(const std::string& decl) {
    return utils::trim(decl.substr(0, decl.find('(')));
}

} // namespace

UnifiedDataType SqliteTypeMap::to_unified(const NativeTypeDescriptor& native) {
    using namespace types;

    const std::string decl = upper(utils::trim(native.type_name));
    const std::string base = base_name(decl);
    const auto [arg1, arg2] = parse_type_args(decl);

    if (base == "BOOLEAN" || base == "BOOL") return {Boolean{}};
    if (base == "DATETIME" || base == "TIMESTAMP") return {DateTime{false}};
    if (base == "DATE") return {Date{}};
    if (base == "TIME") return {Time{}};
    if (base == "JSON") return {Json{}};

    // Affinity rules, in SQLite's own precedence order
    if (decl.find("INT") != std::string::npos) {
        return UnifiedDataType::integer(64);
    }
    if (decl.find("CHAR") != std::string::npos || decl.find("CLOB") != std::string::npos ||
        decl.find("TEXT") != std::string::npos) {
        const bool fixed = base == "CHAR" || base == "CHARACTER" || base == "NCHAR";
        return UnifiedDataType::string(arg1, fixed);
    }
    if (decl.empty() || decl.find("BLOB") != std::string::npos) {
        return {Binary{}};
    }
    if (decl.find("REAL") != std::string::npos || decl.find("FLOA") != std::string::npos ||
        decl.find("DOUB") != std::string::npos) {
        return {Float{53}};
    }
    return {Decimal{arg1, arg2}};
}

} // namespace dbsurvey
