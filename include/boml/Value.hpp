/**
 * @file Value.hpp
 * @brief Value type for parsed TOML data
 *
 * A closed sum over the TOML value kinds:
 * - String (TomlString, borrowed from the source or owned when decoded)
 * - Integer (std::int64_t)
 * - Float (double)
 * - Boolean (bool)
 * - Date/time placeholders (DateTime, raw text only)
 * - Array (std::vector<Value>)
 * - Table (boml::Table)
 *
 * Values that borrow from the source must not outlive it.
 */

#ifndef BOML_VALUE_HPP
#define BOML_VALUE_HPP

#include "boml/Span.hpp"
#include "boml/Table.hpp"
#include "boml/TomlString.hpp"
#include "boml/ValueKind.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace boml {

/**
 * @brief Unvalidated date, time or date-time
 *
 * Only the lexical shape has been checked; field ranges have not. Use the
 * helpers in boml/DateTime.hpp to obtain a validated calendar value.
 */
struct DateTime {
    /// One of OffsetDateTime, LocalDateTime, LocalDate, LocalTime.
    ValueKind kind = ValueKind::LocalDate;
    /// The literal exactly as written.
    std::string_view text;
    Span span;
};

inline bool operator==(const DateTime& a, const DateTime& b) noexcept {
    return a.kind == b.kind && a.text == b.text;
}
inline bool operator!=(const DateTime& a, const DateTime& b) noexcept {
    return !(a == b);
}

class Value {
public:
    using Storage = std::variant<TomlString, std::int64_t, double, bool, DateTime, Array, Table>;

    explicit Value(TomlString s) : data_(std::move(s)) {}
    Value(std::int64_t i) noexcept : data_(i) {}
    Value(int i) noexcept : data_(static_cast<std::int64_t>(i)) {}
    Value(double d) noexcept : data_(d) {}
    Value(bool b) noexcept : data_(b) {}
    Value(DateTime dt) noexcept : data_(dt) {}
    Value(Array a) : data_(std::move(a)) {}
    Value(Table t) : data_(std::move(t)) {}

    // Would silently become a bool.
    Value(const char*) = delete;

    ValueKind kind() const noexcept;

    bool is_string() const noexcept { return std::holds_alternative<TomlString>(data_); }
    bool is_integer() const noexcept { return std::holds_alternative<std::int64_t>(data_); }
    bool is_float() const noexcept { return std::holds_alternative<double>(data_); }
    bool is_boolean() const noexcept { return std::holds_alternative<bool>(data_); }
    bool is_datetime() const noexcept { return std::holds_alternative<DateTime>(data_); }
    bool is_array() const noexcept { return std::holds_alternative<Array>(data_); }
    bool is_table() const noexcept { return std::holds_alternative<Table>(data_); }

    std::optional<std::string_view> as_string() const noexcept;
    std::optional<std::int64_t> as_integer() const noexcept;
    std::optional<double> as_float() const noexcept;
    std::optional<bool> as_boolean() const noexcept;

    const TomlString* as_toml_string() const noexcept { return std::get_if<TomlString>(&data_); }
    const DateTime* as_datetime() const noexcept { return std::get_if<DateTime>(&data_); }
    const Array* as_array() const noexcept { return std::get_if<Array>(&data_); }
    const Table* as_table() const noexcept { return std::get_if<Table>(&data_); }

    /**
     * @brief Loose boolean conversion
     *
     * Booleans convert as-is; "true"/"True" and "false"/"False" strings,
     * and integers or floats equal to 1 or 0, convert to the matching
     * boolean. Anything else yields std::nullopt.
     */
    std::optional<bool> coerce_boolean() const noexcept;

    /**
     * @brief True for arrays built from repeated [[header]] tables
     */
    bool is_array_of_tables() const noexcept { return table_array_; }

    /**
     * @brief Underlying variant, for std::visit
     */
    const Storage& storage() const noexcept { return data_; }

private:
    friend class Parser;

    Array* as_array_mut() noexcept { return std::get_if<Array>(&data_); }
    Table* as_table_mut() noexcept { return std::get_if<Table>(&data_); }

    Storage data_;
    bool table_array_ = false;
};

bool operator==(const Value& a, const Value& b);
bool operator!=(const Value& a, const Value& b);

/**
 * @brief One key/value pair of a Table
 */
struct TableEntry {
    TomlString key;
    Value value;
};

} // namespace boml

#endif // BOML_VALUE_HPP
