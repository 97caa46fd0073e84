/**
 * @file DateTime.cpp
 * @brief Date/time validation through toml++
 */

#include "boml/DateTime.hpp"

#include <string_view>

namespace boml {

namespace {

// toml++ parses whole documents, so the literal is wrapped in a one-line
// key/value pair and the value read back with the expected type.
template <typename T>
T convert(const DateTime& value, ValueKind wanted, ValueKind also_ok, std::string_view what) {
    const std::string text(value.text);
    if (value.kind != wanted && value.kind != also_ok) {
        throw DateTimeError(text, "not a " + std::string(what));
    }

    const std::string source = "v = " + text;
    toml::table doc;
    try {
        doc = toml::parse(source);
    } catch (const toml::parse_error& e) {
        throw DateTimeError(text, std::string(e.description()));
    }

    if (const auto* node = doc.get_as<T>("v")) {
        return node->get();
    }
    throw DateTimeError(text, "not a " + std::string(what));
}

} // anonymous namespace

toml::date to_date(const DateTime& value) {
    return convert<toml::date>(value, ValueKind::LocalDate, ValueKind::LocalDate, "local date");
}

toml::time to_time(const DateTime& value) {
    return convert<toml::time>(value, ValueKind::LocalTime, ValueKind::LocalTime, "local time");
}

toml::date_time to_date_time(const DateTime& value) {
    return convert<toml::date_time>(value, ValueKind::LocalDateTime, ValueKind::OffsetDateTime,
                                    "date-time");
}

} // namespace boml
