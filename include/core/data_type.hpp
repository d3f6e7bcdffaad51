#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dbsurvey {

struct UnifiedDataType;
using DataTypePtr = std::shared_ptr<const UnifiedDataType>;

/**
 * @brief Variants of the engine-independent type representation
 *
 * Optional metadata (precision, scale, length) is left unset when the
 * source engine does not expose it.
 */
namespace types {

struct Integer {
    uint8_t bits = 32;
    bool is_signed = true;
    bool operator==(const Integer&) const = default;
};

struct Float {
    std::optional<uint8_t> precision;
    bool operator==(const Float&) const = default;
};

struct Decimal {
    std::optional<uint32_t> precision;
    std::optional<uint32_t> scale;
    bool operator==(const Decimal&) const = default;
};

struct String {
    std::optional<uint32_t> max_length;
    bool fixed = false;
    bool operator==(const String&) const = default;
};

struct Boolean {
    bool operator==(const Boolean&) const = default;
};

struct DateTime {
    bool tz_aware = false;
    bool operator==(const DateTime&) const = default;
};

struct Date {
    bool operator==(const Date&) const = default;
};

struct Time {
    bool operator==(const Time&) const = default;
};

struct Binary {
    std::optional<uint32_t> max_length;
    bool operator==(const Binary&) const = default;
};

// Element and field types compare by value, not by pointer
struct Array {
    DataTypePtr element_type;
    bool operator==(const Array& other) const;
};

struct Field {
    std::string name;
    DataTypePtr type;
    bool operator==(const Field& other) const;
};

struct Object {
    std::vector<Field> fields;
    bool operator==(const Object&) const = default;
};

struct Json {
    bool operator==(const Json&) const = default;
};

struct Custom {
    std::string type_name;
    std::string engine;
    bool operator==(const Custom&) const = default;
};

} // namespace types

/**
 * @brief Engine-independent column/field type
 */
struct UnifiedDataType {
    using Variant = std::variant<
        types::Integer, types::Float, types::Decimal, types::String,
        types::Boolean, types::DateTime, types::Date, types::Time,
        types::Binary, types::Array, types::Object, types::Json, types::Custom>;

    Variant value;

    UnifiedDataType() : value(types::Custom{"unknown", ""}) {}
    UnifiedDataType(Variant v) : value(std::move(v)) {}

    template<typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(value); }

    template<typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&value); }

    /**
     * @brief True for DateTime and Date (candidates for timestamp ordering)
     */
    [[nodiscard]] bool is_date_like() const {
        return is<types::DateTime>() || is<types::Date>();
    }

    /**
     * @brief Variant tag name ("Integer", "String", ...)
     */
    [[nodiscard]] std::string_view kind_name() const;

    /**
     * @brief Compact human-readable form, e.g. "Integer(64, signed)"
     */
    [[nodiscard]] std::string to_string() const;

    bool operator==(const UnifiedDataType&) const = default;

    // Convenience constructors for the common variants
    static UnifiedDataType integer(uint8_t bits, bool is_signed = true) {
        return {types::Integer{bits, is_signed}};
    }
    static UnifiedDataType string(std::optional<uint32_t> max_length = std::nullopt,
                                  bool fixed = false) {
        return {types::String{max_length, fixed}};
    }
    static UnifiedDataType custom(std::string type_name, std::string engine) {
        return {types::Custom{std::move(type_name), std::move(engine)}};
    }
    static UnifiedDataType array_of(UnifiedDataType element) {
        return {types::Array{std::make_shared<const UnifiedDataType>(std::move(element))}};
    }
};

} // namespace dbsurvey
