/**
 * @file Json.cpp
 * @brief Conversion of parsed trees to nlohmann::json
 */

#include "boml/Json.hpp"

#include <charconv>
#include <cmath>
#include <string>
#include <system_error>
#include <utility>

namespace boml {

std::string format_float(double value) {
    if (std::isnan(value)) return "nan";
    if (std::isinf(value)) return value < 0 ? "-inf" : "inf";

    char buffer[64];
    const auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (ec != std::errc()) {
        return std::to_string(value);
    }
    return std::string(buffer, ptr);
}

namespace {

std::string_view tagged_type(ValueKind kind) {
    switch (kind) {
        case ValueKind::String:         return "string";
        case ValueKind::Integer:        return "integer";
        case ValueKind::Float:          return "float";
        case ValueKind::Boolean:        return "bool";
        case ValueKind::OffsetDateTime: return "datetime";
        case ValueKind::LocalDateTime:  return "datetime-local";
        case ValueKind::LocalDate:      return "date-local";
        case ValueKind::LocalTime:      return "time-local";
        default:                        return "";
    }
}

// RFC 3339 spelling: 'T' between date and time, uppercase 'Z'.
std::string normalize_datetime(std::string_view text) {
    std::string out(text);
    if (out.size() > 10 && (out[10] == ' ' || out[10] == 't')) out[10] = 'T';
    if (!out.empty() && out.back() == 'z') out.back() = 'Z';
    return out;
}

nlohmann::json tagged(std::string_view type, std::string value) {
    return nlohmann::json{{"type", std::string(type)}, {"value", std::move(value)}};
}

} // anonymous namespace

nlohmann::json to_json(const Value& value, JsonStyle style) {
    const bool tag = style == JsonStyle::Tagged;
    switch (value.kind()) {
        case ValueKind::String: {
            std::string s(*value.as_string());
            return tag ? tagged("string", std::move(s)) : nlohmann::json(std::move(s));
        }

        case ValueKind::Integer: {
            const std::int64_t i = *value.as_integer();
            return tag ? tagged("integer", std::to_string(i)) : nlohmann::json(i);
        }

        case ValueKind::Float: {
            const double d = *value.as_float();
            if (tag) return tagged("float", format_float(d));
            // JSON has no spelling for inf and nan.
            if (!std::isfinite(d)) return nlohmann::json(format_float(d));
            return nlohmann::json(d);
        }

        case ValueKind::Boolean: {
            const bool b = *value.as_boolean();
            return tag ? tagged("bool", b ? "true" : "false") : nlohmann::json(b);
        }

        case ValueKind::OffsetDateTime:
        case ValueKind::LocalDateTime:
        case ValueKind::LocalDate:
        case ValueKind::LocalTime: {
            const DateTime& dt = *value.as_datetime();
            if (tag) return tagged(tagged_type(dt.kind), normalize_datetime(dt.text));
            return nlohmann::json(std::string(dt.text));
        }

        case ValueKind::Array: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& elem : *value.as_array()) {
                arr.push_back(to_json(elem, style));
            }
            return arr;
        }

        case ValueKind::Table:
            return to_json(*value.as_table(), style);
    }
    return nullptr;
}

nlohmann::json to_json(const Table& table, JsonStyle style) {
    nlohmann::json obj = nlohmann::json::object();
    for (const auto& entry : table) {
        obj[entry.key.str()] = to_json(entry.value, style);
    }
    return obj;
}

} // namespace boml
