#include "sampling/value_encoder.hpp"
#include "core/base64.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>

namespace dbsurvey {

namespace {

nlohmann::json encode_integer(const std::string& text) {
    if (const auto v = utils::try_parse_int<int64_t>(text)) {
        return *v;
    }
    if (const auto v = utils::try_parse_int<uint64_t>(text)) {
        return *v;
    }
    return text;
}

nlohmann::json encode_real(const std::string& text) {
    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || !std::isfinite(value)) {
        return text;
    }
    return value;
}

nlohmann::json encode_boolean(const std::string& text) {
    const std::string lower = utils::to_lower(text);
    if (lower == "t" || lower == "true" || lower == "1") return true;
    if (lower == "f" || lower == "false" || lower == "0") return false;
    return text;
}

// Structural UTF-8 check (overlongs and surrogates are not rejected)
bool is_valid_utf8(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        const auto c = static_cast<unsigned char>(s[i]);
        size_t extra = 0;
        if (c < 0x80) extra = 0;
        else if ((c & 0xE0) == 0xC0) extra = 1;
        else if ((c & 0xF0) == 0xE0) extra = 2;
        else if ((c & 0xF8) == 0xF0) extra = 3;
        else return false;
        if (i + extra >= s.size()) return false;
        for (size_t k = 1; k <= extra; ++k) {
            if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) return false;
        }
        i += extra + 1;
    }
    return true;
}

} // namespace

nlohmann::json encode_cell(const DbCell& cell) {
    switch (cell.kind) {
        case CellKind::NULL_VALUE: return nullptr;
        case CellKind::INTEGER: return encode_integer(cell.data);
        case CellKind::REAL: return encode_real(cell.data);
        case CellKind::BOOLEAN: return encode_boolean(cell.data);
        case CellKind::BLOB: return base64::encode(cell.data);
        case CellKind::DECIMAL: return cell.data;
        case CellKind::TEXT:
        default:
            // Text in a non-UTF-8 encoding cannot be a JSON string as-is
            return is_valid_utf8(cell.data) ? nlohmann::json(cell.data)
                                            : nlohmann::json(base64::encode(cell.data));
    }
}

nlohmann::json encode_row(const std::vector<std::string>& column_names,
                          const std::vector<DbCell>& row) {
    nlohmann::json obj = nlohmann::json::object();
    const size_t n = std::min(column_names.size(), row.size());
    for (size_t i = 0; i < n; ++i) {
        obj[column_names[i]] = encode_cell(row[i]);
    }
    return obj;
}

} // namespace dbsurvey
