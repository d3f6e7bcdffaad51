#include "core/data_type.hpp"

#include <format>

namespace dbsurvey {

namespace {

bool same_type(const DataTypePtr& a, const DataTypePtr& b) {
    if (a == b) return true;
    if (!a || !b) return false;
    return *a == *b;
}

template<typename T>
std::string opt_to_string(const std::optional<T>& v) {
    return v ? std::to_string(*v) : "?";
}

} // namespace

namespace types {

bool Array::operator==(const Array& other) const {
    return same_type(element_type, other.element_type);
}

bool Field::operator==(const Field& other) const {
    return name == other.name && same_type(type, other.type);
}

} // namespace types

std::string_view UnifiedDataType::kind_name() const {
    static constexpr std::string_view kNames[] = {
        "Integer", "Float", "Decimal", "String", "Boolean", "DateTime",
        "Date", "Time", "Binary", "Array", "Object", "Json", "Custom"
    };
    return kNames[value.index()];
}

std::string UnifiedDataType::to_string() const {
    return std::visit([this](const auto& t) -> std::string {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, types::Integer>) {
            return std::format("Integer({}, {})", t.bits, t.is_signed ? "signed" : "unsigned");
        } else if constexpr (std::is_same_v<T, types::Float>) {
            return t.precision ? std::format("Float({})", *t.precision) : "Float";
        } else if constexpr (std::is_same_v<T, types::Decimal>) {
            return std::format("Decimal({}, {})",
                opt_to_string(t.precision), opt_to_string(t.scale));
        } else if constexpr (std::is_same_v<T, types::String>) {
            return std::format("{}({})", t.fixed ? "Char" : "String", opt_to_string(t.max_length));
        } else if constexpr (std::is_same_v<T, types::DateTime>) {
            return t.tz_aware ? "DateTime(tz)" : "DateTime";
        } else if constexpr (std::is_same_v<T, types::Binary>) {
            return std::format("Binary({})", opt_to_string(t.max_length));
        } else if constexpr (std::is_same_v<T, types::Array>) {
            return std::format("Array<{}>",
                t.element_type ? t.element_type->to_string() : "?");
        } else if constexpr (std::is_same_v<T, types::Object>) {
            std::string out = "Object{";
            for (size_t i = 0; i < t.fields.size(); ++i) {
                if (i > 0) out += ", ";
                out += t.fields[i].name;
                out += ": ";
                out += t.fields[i].type ? t.fields[i].type->to_string() : "?";
            }
            out += "}";
            return out;
        } else if constexpr (std::is_same_v<T, types::Custom>) {
            return std::format("Custom({}, {})", t.type_name, t.engine);
        } else {
            return std::string(kind_name());
        }
    }, value);
}

} // namespace dbsurvey
