#pragma once

#include "config/config_types.hpp"
#include "core/collection_types.hpp"
#include "core/error.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace dbsurvey {

/**
 * @brief JSON value tree for a collection result
 *
 * Keys keep insertion order so "format_version" is always the first key.
 * Variants are externally tagged: a unit variant is a bare string
 * ("Success", "Boolean"), any other is {"Tag": {...}}.
 */
[[nodiscard]] nlohmann::ordered_json to_json(const CollectionResult& result);

[[nodiscard]] nlohmann::ordered_json to_json(const UnifiedDataType& type);
[[nodiscard]] nlohmann::ordered_json to_json(const CollectionStatus& status);
[[nodiscard]] nlohmann::ordered_json to_json(const OrderingStrategy& strategy);

/**
 * @brief Render and write the result to output.path
 * @return INTERNAL_ERROR when the file cannot be written
 */
[[nodiscard]] Result<void> write_result(const CollectionResult& result, const OutputConfig& output);

} // namespace dbsurvey
