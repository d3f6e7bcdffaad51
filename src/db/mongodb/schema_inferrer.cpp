#include "db/mongodb/schema_inferrer.hpp"
#include "db/type_mapping.hpp"

#include <algorithm>
#include <format>
#include <memory>

namespace dbsurvey {

std::string_view SchemaInferrer::type_alias(bson_type_t type) {
    switch (type) {
        case BSON_TYPE_DOUBLE: return "double";
        case BSON_TYPE_UTF8: return "string";
        case BSON_TYPE_DOCUMENT: return "object";
        case BSON_TYPE_ARRAY: return "array";
        case BSON_TYPE_BINARY: return "binData";
        case BSON_TYPE_UNDEFINED: return "undefined";
        case BSON_TYPE_OID: return "objectId";
        case BSON_TYPE_BOOL: return "bool";
        case BSON_TYPE_DATE_TIME: return "date";
        case BSON_TYPE_NULL: return "null";
        case BSON_TYPE_REGEX: return "regex";
        case BSON_TYPE_DBPOINTER: return "dbPointer";
        case BSON_TYPE_CODE: return "javascript";
        case BSON_TYPE_SYMBOL: return "symbol";
        case BSON_TYPE_CODEWSCOPE: return "javascriptWithScope";
        case BSON_TYPE_INT32: return "int";
        case BSON_TYPE_TIMESTAMP: return "timestamp";
        case BSON_TYPE_INT64: return "long";
        case BSON_TYPE_DECIMAL128: return "decimal";
        case BSON_TYPE_MINKEY: return "minKey";
        case BSON_TYPE_MAXKEY: return "maxKey";
        default: return "unknown";
    }
}

void SchemaInferrer::observe(const bson_t* document) {
    bson_iter_t iter;
    if (document == nullptr || !bson_iter_init(&iter, document)) {
        return;
    }
    ++documents_;
    observe_fields(iter, {});
}

void SchemaInferrer::observe_fields(bson_iter_t& iter, const std::string& prefix) {
    while (bson_iter_next(&iter)) {
        const std::string path = prefix.empty()
            ? std::string(bson_iter_key(&iter))
            : std::format("{}.{}", prefix, bson_iter_key(&iter));
        record(path, iter);

        if (BSON_ITER_HOLDS_DOCUMENT(&iter)) {
            bson_iter_t child;
            if (bson_iter_recurse(&iter, &child)) {
                observe_fields(child, path);
            }
        }
    }
}

void SchemaInferrer::record(const std::string& path, bson_iter_t& iter) {
    auto [it, inserted] = fields_.try_emplace(path);
    auto& stats = it->second;
    if (inserted) {
        stats.first_seen = next_position_++;
    }
    ++stats.occurrences;

    const bson_type_t type = bson_iter_type(&iter);
    if (type == BSON_TYPE_NULL || type == BSON_TYPE_UNDEFINED) {
        stats.saw_null = true;
        return;
    }
    stats.types.emplace(type_alias(type));

    if (type == BSON_TYPE_ARRAY) {
        bson_iter_t element;
        if (bson_iter_recurse(&iter, &element)) {
            while (bson_iter_next(&element)) {
                const bson_type_t et = bson_iter_type(&element);
                if (et != BSON_TYPE_NULL && et != BSON_TYPE_UNDEFINED) {
                    stats.element_types.emplace(type_alias(et));
                }
            }
        }
    }
}

std::vector<std::string> SchemaInferrer::children_of(const std::string& path) const {
    const std::string prefix = path + ".";
    std::vector<std::pair<uint32_t, std::string>> found;
    for (auto it = fields_.lower_bound(prefix); it != fields_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) break;
        if (it->first.find('.', prefix.size()) != std::string::npos) continue;
        found.emplace_back(it->second.first_seen, it->first);
    }
    std::sort(found.begin(), found.end());

    std::vector<std::string> children;
    children.reserve(found.size());
    for (auto& [pos, name] : found) {
        children.push_back(std::move(name));
    }
    return children;
}

UnifiedDataType SchemaInferrer::type_of(const std::string& path) const {
    const auto& stats = fields_.at(path);
    if (stats.types.size() > 1) {
        return UnifiedDataType::custom("mixed", "mongodb");
    }
    if (stats.types.empty()) {
        // Only ever null
        return UnifiedDataType::custom("null", "mongodb");
    }

    const std::string& alias = *stats.types.begin();
    if (alias == "object") {
        types::Object object;
        for (const auto& child : children_of(path)) {
            object.fields.push_back(types::Field{
                child.substr(path.size() + 1),
                std::make_shared<const UnifiedDataType>(type_of(child))});
        }
        return {std::move(object)};
    }
    if (alias == "array") {
        if (stats.element_types.size() > 1) {
            return UnifiedDataType::array_of(UnifiedDataType::custom("mixed", "mongodb"));
        }
        if (stats.element_types.empty()) {
            return UnifiedDataType::array_of(UnifiedDataType::custom("unknown", "mongodb"));
        }
        NativeTypeDescriptor element;
        element.type_name = *stats.element_types.begin();
        return UnifiedDataType::array_of(map_type(DatabaseType::MONGODB, element));
    }

    NativeTypeDescriptor native;
    native.type_name = alias;
    return map_type(DatabaseType::MONGODB, native);
}

std::vector<Column> SchemaInferrer::columns() const {
    std::vector<std::pair<uint32_t, const std::string*>> order;
    order.reserve(fields_.size());
    for (const auto& [path, stats] : fields_) {
        order.emplace_back(stats.first_seen, &path);
    }
    std::sort(order.begin(), order.end());

    std::vector<Column> columns;
    columns.reserve(order.size());
    for (const auto& [pos, path] : order) {
        const auto& stats = fields_.at(*path);

        Column col;
        col.name = *path;
        col.data_type = type_of(*path);
        col.ordinal_position = pos;
        col.is_nullable = stats.saw_null || stats.occurrences < documents_;
        // ObjectId _id is generated by the driver or server
        col.is_primary_key = *path == "_id";
        col.is_auto_increment = *path == "_id" && stats.types == std::set<std::string>{"objectId"};

        if (stats.types.size() > 1) {
            std::string joined;
            for (const auto& t : stats.types) {
                if (!joined.empty()) joined += ", ";
                joined += t;
            }
            col.native_type = "mixed";
            col.comment = std::format("Mixed types: {}", joined);
        } else {
            col.native_type = stats.types.empty() ? "null" : *stats.types.begin();
        }
        columns.push_back(std::move(col));
    }
    return columns;
}

} // namespace dbsurvey
