/**
 * @file Value.cpp
 * @brief Value kind queries, conversions and equality
 */

#include "boml/Value.hpp"

namespace boml {

std::string_view kind_name(ValueKind kind) noexcept {
    switch (kind) {
        case ValueKind::String:         return "string";
        case ValueKind::Integer:        return "integer";
        case ValueKind::Float:          return "float";
        case ValueKind::Boolean:        return "boolean";
        case ValueKind::OffsetDateTime: return "offset date-time";
        case ValueKind::LocalDateTime:  return "local date-time";
        case ValueKind::LocalDate:      return "local date";
        case ValueKind::LocalTime:      return "local time";
        case ValueKind::Array:          return "array";
        case ValueKind::Table:          return "table";
    }
    return "unknown";
}

ValueKind Value::kind() const noexcept {
    switch (data_.index()) {
        case 0: return ValueKind::String;
        case 1: return ValueKind::Integer;
        case 2: return ValueKind::Float;
        case 3: return ValueKind::Boolean;
        case 4: return std::get<DateTime>(data_).kind;
        case 5: return ValueKind::Array;
        default: return ValueKind::Table;
    }
}

std::optional<std::string_view> Value::as_string() const noexcept {
    if (const auto* s = std::get_if<TomlString>(&data_)) return s->view();
    return std::nullopt;
}

std::optional<std::int64_t> Value::as_integer() const noexcept {
    if (const auto* i = std::get_if<std::int64_t>(&data_)) return *i;
    return std::nullopt;
}

std::optional<double> Value::as_float() const noexcept {
    if (const auto* d = std::get_if<double>(&data_)) return *d;
    return std::nullopt;
}

std::optional<bool> Value::as_boolean() const noexcept {
    if (const auto* b = std::get_if<bool>(&data_)) return *b;
    return std::nullopt;
}

std::optional<bool> Value::coerce_boolean() const noexcept {
    if (const auto* b = std::get_if<bool>(&data_)) {
        return *b;
    }
    if (const auto* s = std::get_if<TomlString>(&data_)) {
        if (*s == "true" || *s == "True") return true;
        if (*s == "false" || *s == "False") return false;
        return std::nullopt;
    }
    if (const auto* i = std::get_if<std::int64_t>(&data_)) {
        if (*i == 1) return true;
        if (*i == 0) return false;
        return std::nullopt;
    }
    if (const auto* d = std::get_if<double>(&data_)) {
        if (*d == 1.0) return true;
        if (*d == 0.0) return false;
    }
    return std::nullopt;
}

bool operator==(const Value& a, const Value& b) {
    if (a.kind() != b.kind()) return false;
    // Floats compare by value; nan equals nothing, as in C++.
    return a.storage() == b.storage();
}

bool operator!=(const Value& a, const Value& b) {
    return !(a == b);
}

} // namespace boml
