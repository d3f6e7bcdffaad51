#pragma once

#include "core/schema_types.hpp"

#include <bson/bson.h>

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace dbsurvey {

/**
 * @brief Infers a column list from sampled BSON documents
 *
 * Every field path is reported, nested ones in dot notation
 * ("address.city"), in first-seen order. A field seen with more than one
 * non-null BSON type becomes Custom{"mixed"}; an Object carries its
 * direct children as fields; an Array carries the type of its elements.
 * A field is nullable when some document lacks it or holds null.
 */
class SchemaInferrer {
public:
    static constexpr uint32_t kDefaultDocumentLimit = 100;

    void observe(const bson_t* document);

    [[nodiscard]] std::vector<Column> columns() const;

    [[nodiscard]] uint64_t document_count() const { return documents_; }

    /// BSON type alias as used by $type ("string", "objectId", "date", ...)
    [[nodiscard]] static std::string_view type_alias(bson_type_t type);

private:
    struct FieldStats {
        uint32_t first_seen = 0;
        uint64_t occurrences = 0;
        bool saw_null = false;
        std::set<std::string> types;           // non-null aliases
        std::set<std::string> element_types;   // non-null aliases inside arrays
    };

    void observe_fields(bson_iter_t& iter, const std::string& prefix);
    void record(const std::string& path, bson_iter_t& iter);

    [[nodiscard]] UnifiedDataType type_of(const std::string& path) const;
    [[nodiscard]] std::vector<std::string> children_of(const std::string& path) const;

    std::map<std::string, FieldStats> fields_;
    uint32_t next_position_ = 1;
    uint64_t documents_ = 0;
};

} // namespace dbsurvey
