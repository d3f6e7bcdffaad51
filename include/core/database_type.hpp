#pragma once

#include <string>
#include <string_view>
#include <stdexcept>
#include <algorithm>
#include <format>
#include <optional>
#include <unordered_map>
#include <vector>
#include <cctype>

namespace dbsurvey {

namespace keys {
    inline constexpr std::string_view POSTGRES = "postgres";
    inline constexpr std::string_view POSTGRESQL = "postgresql";
    inline constexpr std::string_view PG = "pg";
    inline constexpr std::string_view MYSQL = "mysql";
    inline constexpr std::string_view MARIADB = "mariadb";
    inline constexpr std::string_view SQLITE = "sqlite";
    inline constexpr std::string_view SQLITE3 = "sqlite3";
    inline constexpr std::string_view MONGODB = "mongodb";
    inline constexpr std::string_view MONGO = "mongo";
}

enum class DatabaseType {
    POSTGRESQL,
    MYSQL,
    SQLITE,
    MONGODB,
};

[[nodiscard]] inline std::string_view database_type_to_string(DatabaseType type) {
    switch (type) {
        case DatabaseType::POSTGRESQL: return keys::POSTGRESQL;
        case DatabaseType::MYSQL: return keys::MYSQL;
        case DatabaseType::SQLITE: return keys::SQLITE;
        case DatabaseType::MONGODB: return keys::MONGODB;
        default: return "unknown";
    }
}

/**
 * @brief Parse an engine name or alias
 * @throws std::invalid_argument for unknown names
 */
[[nodiscard]] inline DatabaseType parse_database_type(std::string_view type_str) {
    static const std::unordered_map<std::string_view, DatabaseType> lookup = {
        {keys::POSTGRESQL, DatabaseType::POSTGRESQL},
        {keys::POSTGRES,   DatabaseType::POSTGRESQL},
        {keys::PG,         DatabaseType::POSTGRESQL},
        {keys::MYSQL,      DatabaseType::MYSQL},
        {keys::MARIADB,    DatabaseType::MYSQL},
        {keys::SQLITE,     DatabaseType::SQLITE},
        {keys::SQLITE3,    DatabaseType::SQLITE},
        {keys::MONGODB,    DatabaseType::MONGODB},
        {keys::MONGO,      DatabaseType::MONGODB}
    };

    if (const auto it = lookup.find(type_str); it != lookup.end()) {
        return it->second;
    }

    // Case-insensitive fallback, only taken when the direct lookup misses
    for (const auto& [key, value] : lookup) {
        if (key.size() == type_str.size()) {
            const bool match = std::equal(key.begin(), key.end(), type_str.begin(),
                [](char a, char b) {
                    return std::tolower(static_cast<unsigned char>(a)) ==
                           std::tolower(static_cast<unsigned char>(b));
                });
            if (match) return value;
        }
    }

    throw std::invalid_argument(std::format("Unknown database type: {}", type_str));
}

/**
 * @brief Detect the engine from a connection URL scheme or a file path suffix
 */
[[nodiscard]] inline std::optional<DatabaseType> detect_database_type(std::string_view url) {
    const auto scheme_end = url.find("://");
    if (scheme_end != std::string_view::npos) {
        std::string_view scheme = url.substr(0, scheme_end);
        if (scheme == "mongodb+srv") {
            return DatabaseType::MONGODB;
        }
        try {
            return parse_database_type(scheme);
        } catch (const std::invalid_argument&) {
            return std::nullopt;
        }
    }

    if (url == ":memory:" || url.ends_with(".db") || url.ends_with(".sqlite") ||
        url.ends_with(".sqlite3")) {
        return DatabaseType::SQLITE;
    }
    return std::nullopt;
}

/**
 * @brief Names each engine reserves for its own bookkeeping databases
 */
[[nodiscard]] inline std::vector<std::string_view> known_system_databases(DatabaseType type) {
    switch (type) {
        case DatabaseType::POSTGRESQL: return {"template0", "template1"};
        case DatabaseType::MYSQL: return {"mysql", "information_schema", "performance_schema", "sys"};
        case DatabaseType::MONGODB: return {"admin", "config", "local"};
        default: return {};
    }
}

/**
 * @brief Known-name check; MySQL names compare case-insensitively
 */
[[nodiscard]] inline bool is_known_system_database(DatabaseType type, std::string_view name) {
    for (const auto known : known_system_databases(type)) {
        if (type == DatabaseType::MYSQL) {
            const bool match = known.size() == name.size() &&
                std::equal(known.begin(), known.end(), name.begin(), [](char a, char b) {
                    return std::tolower(static_cast<unsigned char>(a)) ==
                           std::tolower(static_cast<unsigned char>(b));
                });
            if (match) return true;
        } else if (known == name) {
            return true;
        }
    }
    return false;
}

} // namespace dbsurvey
