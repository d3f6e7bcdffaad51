#pragma once

#include "core/database_type.hpp"
#include "core/error.hpp"
#include "config/config_types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dbsurvey {

/**
 * @brief Parsed connection descriptor
 *
 * Holds the password only for the lifetime of the owning adapter, which
 * needs it to open sibling databases. It is never written to logs, error
 * messages or output; use display() for anything user-visible.
 */
struct ConnectionParams {
    DatabaseType type = DatabaseType::POSTGRESQL;
    std::string scheme;
    std::string host;                      // may be a comma-separated host list (MongoDB)
    std::optional<uint16_t> port;
    std::string user;
    std::string password;
    std::string database;                  // SQLite: file path or ":memory:"
    std::vector<std::pair<std::string, std::string>> options;

    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds query_timeout{30000};
    uint32_t max_connections = 10;
    bool read_only = true;
    std::string application_name = "dbsurvey";

    /**
     * @brief Parse a connection URL (postgres://, mysql://, sqlite://, mongodb://, bare file path)
     *
     * Errors never echo the input; the URL may carry a password.
     */
    [[nodiscard]] static Result<ConnectionParams> parse(std::string_view url);

    /**
     * @brief Parse config.url and apply the remaining connection settings
     */
    [[nodiscard]] static Result<ConnectionParams> from_config(const ConnectionConfig& config);

    /**
     * @brief Descriptor for a sibling database on the same server
     *
     * The name is validated first (INVALID_CONNECTION_TARGET on rejection).
     */
    [[nodiscard]] Result<ConnectionParams> with_database(std::string_view name) const;

    /**
     * @brief Structural checks: host present for network engines, non-zero port,
     *        max_connections within 1..100
     */
    [[nodiscard]] Result<void> validate() const;

    /**
     * @brief Rebuild a URL including credentials (for drivers that take URIs)
     */
    [[nodiscard]] std::string to_url() const;

    /**
     * @brief "engine://host:port/database", without user or password
     */
    [[nodiscard]] std::string display() const;

    [[nodiscard]] uint16_t effective_port() const;

    [[nodiscard]] std::optional<std::string> option(std::string_view key) const;

    [[nodiscard]] bool is_in_memory() const {
        return type == DatabaseType::SQLITE && database == ":memory:";
    }
};

[[nodiscard]] uint16_t default_port(DatabaseType type);

/**
 * @brief Allow-list check applied before a database name reaches any query
 *
 * Accepts letters, digits, '_' and '-' (plus '$' on MySQL) within the
 * engine's identifier length limit; everything else is rejected.
 */
[[nodiscard]] Result<void> validate_database_name(std::string_view name, DatabaseType type);

/**
 * @brief Replace the password in a URL with "****"
 * @return "<redacted>" when the input cannot be parsed as a URL
 */
[[nodiscard]] std::string redact_connection_string(std::string_view url);

[[nodiscard]] std::string percent_decode(std::string_view s);
[[nodiscard]] std::string percent_encode(std::string_view s);

} // namespace dbsurvey
