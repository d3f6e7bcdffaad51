#include <catch2/catch_test_macros.hpp>
#include "db/mongodb/mongo_engine.hpp"
#include "db/mongodb/schema_inferrer.hpp"

#include <algorithm>

using namespace dbsurvey;

namespace {

BsonPtr from_json(const char* json) {
    bson_error_t error{};
    BsonPtr doc(bson_new_from_json(reinterpret_cast<const uint8_t*>(json), -1, &error));
    INFO(error.message);
    REQUIRE(doc != nullptr);
    return doc;
}

const Column* column(const std::vector<Column>& columns, const std::string& name) {
    const auto it = std::find_if(columns.begin(), columns.end(),
                                 [&](const Column& c) { return c.name == name; });
    return it == columns.end() ? nullptr : &*it;
}

std::vector<Column> infer(std::initializer_list<const char*> documents) {
    SchemaInferrer inferrer;
    for (const char* json : documents) {
        auto doc = from_json(json);
        inferrer.observe(doc.get());
    }
    return inferrer.columns();
}

int32_t sort_value(const BsonPtr& sort, const char* key) {
    bson_iter_t iter;
    REQUIRE(bson_iter_init_find(&iter, sort.get(), key));
    REQUIRE(BSON_ITER_HOLDS_INT32(&iter));
    return bson_iter_int32(&iter);
}

} // namespace

TEST_CASE("SchemaInferrer: scalar fields in first-seen order", "[mongodb][inference]") {
    const auto cols = infer({
        R"({"_id": {"$oid": "65a1f0c2e4b0a1b2c3d4e5f6"}, "name": "ada", "age": 36,
            "score": 1.5, "active": true, "joined": {"$date": "2024-01-01T00:00:00Z"}})",
    });

    REQUIRE(cols.size() == 6);
    CHECK(cols[0].name == "_id");
    CHECK(cols[5].name == "joined");
    CHECK(cols[1].ordinal_position < cols[2].ordinal_position);

    CHECK(column(cols, "name")->data_type.is<types::String>());
    CHECK(column(cols, "age")->data_type == UnifiedDataType::integer(32));
    CHECK(column(cols, "score")->data_type.is<types::Float>());
    CHECK(column(cols, "active")->data_type.is<types::Boolean>());
    CHECK(column(cols, "joined")->data_type.is_date_like());
}

TEST_CASE("SchemaInferrer: _id is the key", "[mongodb][inference]") {
    const auto cols = infer({R"({"_id": {"$oid": "65a1f0c2e4b0a1b2c3d4e5f6"}, "n": 1})"});
    const auto* id = column(cols, "_id");
    REQUIRE(id != nullptr);
    CHECK(id->is_primary_key);
    CHECK(id->is_auto_increment);
    CHECK(id->native_type == "objectId");
    CHECK_FALSE(column(cols, "n")->is_primary_key);

    // Application-assigned keys are not generated
    const auto custom = infer({R"({"_id": "order-1"})"});
    CHECK(custom[0].is_primary_key);
    CHECK_FALSE(custom[0].is_auto_increment);
}

TEST_CASE("SchemaInferrer: nested documents use dot paths", "[mongodb][inference]") {
    const auto cols = infer({R"({"address": {"city": "Oslo", "geo": {"lat": 59.9}}})"});

    REQUIRE(column(cols, "address") != nullptr);
    REQUIRE(column(cols, "address.city") != nullptr);
    REQUIRE(column(cols, "address.geo.lat") != nullptr);

    const auto* object = column(cols, "address")->data_type.get_if<types::Object>();
    REQUIRE(object != nullptr);
    REQUIRE(object->fields.size() == 2);
    CHECK(object->fields[0].name == "city");
    CHECK(object->fields[1].name == "geo");
    CHECK(object->fields[1].type->is<types::Object>());
}

TEST_CASE("SchemaInferrer: arrays carry their element type", "[mongodb][inference]") {
    const auto cols = infer({
        R"({"tags": ["a", "b"], "mixed": [1, "x"], "empty": []})",
    });

    CHECK(column(cols, "tags")->data_type == UnifiedDataType::array_of(UnifiedDataType::string()));
    CHECK(column(cols, "mixed")->data_type ==
          UnifiedDataType::array_of(UnifiedDataType::custom("mixed", "mongodb")));
    CHECK(column(cols, "empty")->data_type.is<types::Array>());
}

TEST_CASE("SchemaInferrer: conflicting types become mixed", "[mongodb][inference]") {
    const auto cols = infer({R"({"v": 1})", R"({"v": "one"})"});

    const auto* v = column(cols, "v");
    REQUIRE(v != nullptr);
    CHECK(v->data_type == UnifiedDataType::custom("mixed", "mongodb"));
    CHECK(v->native_type == "mixed");
    REQUIRE(v->comment.has_value());
    CHECK(v->comment->find("int") != std::string::npos);
    CHECK(v->comment->find("string") != std::string::npos);
}

TEST_CASE("SchemaInferrer: nullability", "[mongodb][inference]") {
    SchemaInferrer inferrer;
    for (const char* json : {R"({"a": 1, "b": 1, "c": null})", R"({"a": 2, "c": 3})"}) {
        auto doc = from_json(json);
        inferrer.observe(doc.get());
    }
    const auto cols = inferrer.columns();

    CHECK(inferrer.document_count() == 2);
    CHECK_FALSE(column(cols, "a")->is_nullable);
    CHECK(column(cols, "b")->is_nullable);       // missing from one document
    CHECK(column(cols, "c")->is_nullable);       // explicit null
    // null does not count as a competing type
    CHECK(column(cols, "c")->data_type == UnifiedDataType::integer(32));
}

TEST_CASE("SchemaInferrer: type aliases", "[mongodb][inference]") {
    CHECK(SchemaInferrer::type_alias(BSON_TYPE_OID) == "objectId");
    CHECK(SchemaInferrer::type_alias(BSON_TYPE_INT64) == "long");
    CHECK(SchemaInferrer::type_alias(BSON_TYPE_DECIMAL128) == "decimal");
}

TEST_CASE("MongoEngine: sort documents per strategy", "[mongodb][sampling]") {
    SECTION("primary key") {
        const auto sort = MongoEngine::build_sort_document(ordering::PrimaryKey{{"_id"}});
        REQUIRE(sort != nullptr);
        CHECK(sort_value(sort, "_id") == -1);
    }
    SECTION("timestamp") {
        const auto sort = MongoEngine::build_sort_document(
            ordering::Timestamp{"created_at", SortDirection::DESCENDING});
        REQUIRE(sort != nullptr);
        CHECK(sort_value(sort, "created_at") == -1);
    }
    SECTION("system row id uses natural order") {
        const auto sort = MongoEngine::build_sort_document(ordering::SystemRowId{"$natural"});
        REQUIRE(sort != nullptr);
        CHECK(sort_value(sort, "$natural") == -1);
    }
    SECTION("unordered has no sort") {
        CHECK(MongoEngine::build_sort_document(ordering::Unordered{}) == nullptr);
    }
}

TEST_CASE("MongoEngine: feature set", "[mongodb]") {
    MongoEngine engine;
    CHECK(engine.supports(AdapterFeature::MULTI_DATABASE));
    CHECK(engine.supports(AdapterFeature::SCHEMA_INFERENCE));
    CHECK_FALSE(engine.supports(AdapterFeature::ROUTINES));
}

TEST_CASE("MongoEngine: count taken while loading is reused", "[mongodb][sampling]") {
    MongoEngine engine;  // not connected; any server round trip would yield nullopt

    Table counted;
    counted.name = "orders";
    counted.row_count = 1250;
    CHECK(engine.count_rows(counted) == std::optional<uint64_t>{1250});

    Table uncounted;
    uncounted.name = "orders";
    CHECK_FALSE(engine.count_rows(uncounted).has_value());
}
