#include "db/connection_params.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <format>

namespace dbsurvey {

namespace {

// Identifier limits: NAMEDATALEN - 1 for PostgreSQL, 64 for MySQL and MongoDB
size_t max_database_name_length(DatabaseType type) {
    return type == DatabaseType::POSTGRESQL ? 63 : 64;
}

/**
 * @brief Characters a database name may contain on the given engine
 *
 * Bytes above 0x7F are UTF-8 sequences (accented or non-Latin letters);
 * none of them can close a quoted identifier.
 */
bool is_database_name_char(DatabaseType type, unsigned char c) {
    if (std::isalnum(c) || c == '_' || c == '-' || c >= 0x80) {
        return true;
    }
    // MySQL permits $ in unquoted identifiers
    return type == DatabaseType::MYSQL && c == '$';
}

bool is_unreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/**
 * @brief Split "scheme://rest" (returns nullopt when there is no scheme separator)
 */
std::optional<std::pair<std::string_view, std::string_view>> split_scheme(std::string_view url) {
    const auto pos = url.find("://");
    if (pos == std::string_view::npos || pos == 0) return std::nullopt;
    return std::make_pair(url.substr(0, pos), url.substr(pos + 3));
}

} // namespace

// ============================================================================
// Free helpers
// ============================================================================

std::string percent_decode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            const int hi = hex_value(s[i + 1]);
            const int lo = hex_value(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += s[i];
    }
    return out;
}

std::string percent_encode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (const char c : s) {
        if (is_unreserved(static_cast<unsigned char>(c))) {
            out += c;
        } else {
            out += std::format("%{:02X}", static_cast<unsigned char>(c));
        }
    }
    return out;
}

uint16_t default_port(DatabaseType type) {
    switch (type) {
        case DatabaseType::POSTGRESQL: return 5432;
        case DatabaseType::MYSQL: return 3306;
        case DatabaseType::MONGODB: return 27017;
        case DatabaseType::SQLITE: return 0;
        default: return 0;
    }
}

Result<void> validate_database_name(std::string_view name, DatabaseType type) {
    const size_t max_length = max_database_name_length(type);
    if (name.empty() || name.size() > max_length) {
        return Result<void>::error(ErrorCode::INVALID_CONNECTION_TARGET,
            std::format("Invalid database name length: must be 1-{} characters, got {}",
                        max_length, name.size()));
    }
    for (const char c : name) {
        if (!is_database_name_char(type, static_cast<unsigned char>(c))) {
            return Result<void>::error(ErrorCode::INVALID_CONNECTION_TARGET,
                "Database name contains invalid characters");
        }
    }
    return Result<void>::ok();
}

std::string redact_connection_string(std::string_view url) {
    const auto parts = split_scheme(url);
    if (!parts) {
        // Bare SQLite paths carry no credentials
        return detect_database_type(url) == DatabaseType::SQLITE
            ? std::string(url) : std::string("<redacted>");
    }
    const auto [scheme, rest] = *parts;

    const auto authority_end = rest.find_first_of("/?");
    const std::string_view authority = rest.substr(0, authority_end);
    const auto at = authority.rfind('@');
    if (at == std::string_view::npos) {
        return std::string(url);
    }

    const std::string_view userinfo = authority.substr(0, at);
    const auto colon = userinfo.find(':');
    if (colon == std::string_view::npos) {
        return std::string(url);
    }

    std::string out;
    out.reserve(url.size());
    out += scheme;
    out += "://";
    out += userinfo.substr(0, colon);
    out += ":****";
    out += rest.substr(at);
    return out;
}

// ============================================================================
// ConnectionParams
// ============================================================================

Result<ConnectionParams> ConnectionParams::parse(std::string_view url) {
    if (url.empty()) {
        return Result<ConnectionParams>::error(ErrorCode::CONFIGURATION_ERROR,
            "Connection URL is empty");
    }

    const auto detected = detect_database_type(url);
    if (!detected) {
        return Result<ConnectionParams>::error(ErrorCode::ADAPTER_NOT_FOUND,
            "Unsupported connection URL scheme");
    }

    ConnectionParams params;
    params.type = *detected;

    const auto parts = split_scheme(url);
    if (!parts) {
        // Bare SQLite file path
        params.scheme = "sqlite";
        params.database = std::string(url);
        return Result<ConnectionParams>::ok(std::move(params));
    }

    auto [scheme, rest] = *parts;
    params.scheme = std::string(scheme);

    // Query options
    if (const auto q = rest.find('?'); q != std::string_view::npos) {
        for (const auto& kv : utils::split(std::string(rest.substr(q + 1)), '&')) {
            if (kv.empty()) continue;
            const auto eq = kv.find('=');
            if (eq == std::string::npos) {
                params.options.emplace_back(percent_decode(kv), "");
            } else {
                params.options.emplace_back(percent_decode(kv.substr(0, eq)),
                                            percent_decode(kv.substr(eq + 1)));
            }
        }
        rest = rest.substr(0, q);
    }

    if (params.type == DatabaseType::SQLITE) {
        // sqlite://relative.db, sqlite:///abs/path.db, sqlite://:memory:
        params.database = percent_decode(rest);
        if (params.database.empty()) {
            return Result<ConnectionParams>::error(ErrorCode::CONFIGURATION_ERROR,
                "SQLite URL must name a database file");
        }
        return Result<ConnectionParams>::ok(std::move(params));
    }

    const auto slash = rest.find('/');
    const std::string_view authority = rest.substr(0, slash);
    if (slash != std::string_view::npos) {
        params.database = percent_decode(rest.substr(slash + 1));
    }

    std::string_view hostport = authority;
    if (const auto at = authority.rfind('@'); at != std::string_view::npos) {
        const std::string_view userinfo = authority.substr(0, at);
        hostport = authority.substr(at + 1);
        const auto colon = userinfo.find(':');
        if (colon == std::string_view::npos) {
            params.user = percent_decode(userinfo);
        } else {
            params.user = percent_decode(userinfo.substr(0, colon));
            params.password = percent_decode(userinfo.substr(colon + 1));
        }
    }

    if (hostport.find(',') != std::string_view::npos) {
        // Replica-set host list: the driver resolves ports per host
        params.host = std::string(hostport);
    } else if (hostport.starts_with('[')) {
        const auto close = hostport.find(']');
        if (close == std::string_view::npos) {
            return Result<ConnectionParams>::error(ErrorCode::CONFIGURATION_ERROR,
                "Malformed IPv6 host in connection URL");
        }
        params.host = std::string(hostport.substr(1, close - 1));
        hostport.remove_prefix(close + 1);
        if (hostport.starts_with(':')) {
            const auto port = utils::try_parse_int<uint16_t>(hostport.substr(1));
            if (!port) {
                return Result<ConnectionParams>::error(ErrorCode::CONFIGURATION_ERROR,
                    "Invalid port in connection URL");
            }
            params.port = *port;
        }
    } else {
        const auto colon = hostport.rfind(':');
        if (colon != std::string_view::npos) {
            const auto port = utils::try_parse_int<uint16_t>(hostport.substr(colon + 1));
            if (!port) {
                return Result<ConnectionParams>::error(ErrorCode::CONFIGURATION_ERROR,
                    "Invalid port in connection URL");
            }
            params.port = *port;
            params.host = std::string(hostport.substr(0, colon));
        } else {
            params.host = std::string(hostport);
        }
    }

    auto valid = params.validate();
    if (valid.is_error()) {
        return Result<ConnectionParams>::propagate(valid);
    }
    return Result<ConnectionParams>::ok(std::move(params));
}

Result<ConnectionParams> ConnectionParams::from_config(const ConnectionConfig& config) {
    auto parsed = parse(config.url);
    if (parsed.is_error()) return parsed;

    auto params = parsed.take_value();
    params.connect_timeout = config.connect_timeout;
    params.query_timeout = config.query_timeout;
    params.max_connections = config.max_connections;
    params.read_only = config.read_only;
    params.application_name = config.application_name;

    auto valid = params.validate();
    if (valid.is_error()) {
        return Result<ConnectionParams>::propagate(valid);
    }
    return Result<ConnectionParams>::ok(std::move(params));
}

Result<ConnectionParams> ConnectionParams::with_database(std::string_view name) const {
    auto valid = validate_database_name(name, type);
    if (valid.is_error()) {
        return Result<ConnectionParams>::propagate(valid);
    }
    if (type == DatabaseType::SQLITE) {
        return Result<ConnectionParams>::error(ErrorCode::UNSUPPORTED_FEATURE,
            "SQLite connections target a single database file");
    }
    ConnectionParams copy = *this;
    copy.database = std::string(name);
    return Result<ConnectionParams>::ok(std::move(copy));
}

Result<void> ConnectionParams::validate() const {
    if (type != DatabaseType::SQLITE) {
        if (host.empty()) {
            return Result<void>::error(ErrorCode::CONFIGURATION_ERROR,
                "Connection URL must include a host");
        }
        if (port && *port == 0) {
            return Result<void>::error(ErrorCode::CONFIGURATION_ERROR,
                "Port must be non-zero");
        }
    } else if (database.empty()) {
        return Result<void>::error(ErrorCode::CONFIGURATION_ERROR,
            "SQLite connection must name a database file");
    }
    if (!utils::in_range<1, 100>(max_connections)) {
        return Result<void>::error(ErrorCode::CONFIGURATION_ERROR,
            std::format("max_connections must be 1-100, got {}", max_connections));
    }
    return Result<void>::ok();
}

std::string ConnectionParams::to_url() const {
    if (type == DatabaseType::SQLITE) {
        return database;
    }

    std::string url = scheme + "://";
    if (!user.empty()) {
        url += percent_encode(user);
        if (!password.empty()) {
            url += ':';
            url += percent_encode(password);
        }
        url += '@';
    }
    if (host.find(':') != std::string::npos && host.find(',') == std::string::npos) {
        url += std::format("[{}]", host);
    } else {
        url += host;
    }
    if (port) {
        url += std::format(":{}", *port);
    }
    url += '/';
    url += percent_encode(database);
    for (size_t i = 0; i < options.size(); ++i) {
        url += (i == 0) ? '?' : '&';
        url += percent_encode(options[i].first);
        url += '=';
        url += percent_encode(options[i].second);
    }
    return url;
}

std::string ConnectionParams::display() const {
    if (type == DatabaseType::SQLITE) {
        return std::format("sqlite://{}", database);
    }
    if (host.find(',') != std::string::npos) {
        return std::format("{}://{}/{}", database_type_to_string(type), host, database);
    }
    return std::format("{}://{}:{}/{}", database_type_to_string(type), host,
                       effective_port(), database);
}

uint16_t ConnectionParams::effective_port() const {
    return port.value_or(default_port(type));
}

std::optional<std::string> ConnectionParams::option(std::string_view key) const {
    for (const auto& [k, v] : options) {
        if (k == key) return v;
    }
    return std::nullopt;
}

} // namespace dbsurvey
