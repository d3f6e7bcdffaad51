#pragma once

#include <bson/bson.h>
#include <mongoc/mongoc.h>

#include <memory>
#include <string>

namespace dbsurvey {

// ============================================================================
// RAII ownership for libmongoc / libbson handles
// ============================================================================

struct BsonDeleter {
    void operator()(bson_t* p) const noexcept { bson_destroy(p); }
};

struct MongocUriDeleter {
    void operator()(mongoc_uri_t* p) const noexcept { mongoc_uri_destroy(p); }
};

struct MongocClientDeleter {
    void operator()(mongoc_client_t* p) const noexcept { mongoc_client_destroy(p); }
};

struct MongocDatabaseDeleter {
    void operator()(mongoc_database_t* p) const noexcept { mongoc_database_destroy(p); }
};

struct MongocCollectionDeleter {
    void operator()(mongoc_collection_t* p) const noexcept { mongoc_collection_destroy(p); }
};

struct MongocCursorDeleter {
    void operator()(mongoc_cursor_t* p) const noexcept { mongoc_cursor_destroy(p); }
};

/// Heap bson_t (bson_new / bson_copy / BCON_NEW)
using BsonPtr = std::unique_ptr<bson_t, BsonDeleter>;
using MongocUriPtr = std::unique_ptr<mongoc_uri_t, MongocUriDeleter>;
using MongocClientPtr = std::unique_ptr<mongoc_client_t, MongocClientDeleter>;
using MongocDatabasePtr = std::unique_ptr<mongoc_database_t, MongocDatabaseDeleter>;
using MongocCollectionPtr = std::unique_ptr<mongoc_collection_t, MongocCollectionDeleter>;
using MongocCursorPtr = std::unique_ptr<mongoc_cursor_t, MongocCursorDeleter>;

/**
 * @brief Stack bson_t, initialized on construction and destroyed on scope exit
 *
 * Used for out-parameters that libmongoc initializes itself (command replies);
 * an empty inline bson_t owns no heap storage, so being overwritten is safe.
 */
class ScopedBson {
public:
    ScopedBson() noexcept { bson_init(&bson_); }
    ~ScopedBson() { bson_destroy(&bson_); }

    ScopedBson(const ScopedBson&) = delete;
    ScopedBson& operator=(const ScopedBson&) = delete;

    [[nodiscard]] bson_t* get() noexcept { return &bson_; }
    [[nodiscard]] const bson_t* get() const noexcept { return &bson_; }

private:
    bson_t bson_;
};

/**
 * @brief Relaxed extended JSON rendering of a document
 */
[[nodiscard]] inline std::string bson_to_json(const bson_t* doc) {
    size_t length = 0;
    char* text = bson_as_relaxed_extended_json(doc, &length);
    if (text == nullptr) {
        return "{}";
    }
    std::string out(text, length);
    bson_free(text);
    return out;
}

} // namespace dbsurvey
