#pragma once

#include "db/database_adapter.hpp"
#include "core/database_type.hpp"

#include <functional>
#include <map>
#include <memory>
#include <vector>

namespace dbsurvey {

/**
 * @brief Immutable map from engine to adapter factory
 *
 * Built once at startup from whatever engines were compiled in; nothing
 * registers itself and nothing changes after construction. Extra entries
 * (tests, external adapters) go through the same Builder.
 *
 * Usage:
 *   auto registry = AdapterRegistry::Builder()
 *       .add(DatabaseType::POSTGRESQL, [] { return std::make_unique<AdapterBridge<PgEngine>>(); })
 *       .build();
 *   auto adapter = registry.create(DatabaseType::POSTGRESQL);
 */
class AdapterRegistry {
public:
    using Factory = std::function<std::unique_ptr<IDatabaseAdapter>()>;

    class Builder {
    public:
        /// A later add() for the same engine replaces the earlier one
        Builder& add(DatabaseType type, Factory factory) {
            factories_[type] = std::move(factory);
            return *this;
        }

        [[nodiscard]] AdapterRegistry build() { return AdapterRegistry(std::move(factories_)); }

    private:
        std::map<DatabaseType, Factory> factories_;
    };

    /**
     * @brief Fresh, unconnected adapter for the engine
     * @return ADAPTER_NOT_FOUND when the engine was not compiled in
     */
    [[nodiscard]] Result<std::unique_ptr<IDatabaseAdapter>> create(DatabaseType type) const;

    [[nodiscard]] bool has_adapter(DatabaseType type) const {
        return factories_.contains(type);
    }

    [[nodiscard]] std::vector<DatabaseType> available() const;

private:
    explicit AdapterRegistry(std::map<DatabaseType, Factory> factories)
        : factories_(std::move(factories)) {}

    const std::map<DatabaseType, Factory> factories_;
};

/**
 * @brief Registry holding exactly the engines enabled at build time
 */
[[nodiscard]] AdapterRegistry make_default_registry();

} // namespace dbsurvey
