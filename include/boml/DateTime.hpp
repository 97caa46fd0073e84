/**
 * @file DateTime.hpp
 * @brief Validated calendar values for date/time placeholders
 *
 * The parser keeps date/times as raw text. These helpers hand that text to
 * toml++, which checks field ranges and returns its own value types:
 *
 * ```cpp
 * const auto& dt = doc.get_datetime("released");
 * toml::date_time when = boml::to_date_time(dt);
 * ```
 */

#ifndef BOML_DATETIME_HPP
#define BOML_DATETIME_HPP

#include "boml/Value.hpp"

#include <toml++/toml.hpp>

#include <stdexcept>
#include <string>
#include <utility>

namespace boml {

/**
 * @brief A date/time placeholder could not be converted
 */
class DateTimeError : public std::runtime_error {
public:
    DateTimeError(std::string text, const std::string& reason)
        : std::runtime_error("Invalid date/time '" + text + "': " + reason)
        , text_(std::move(text))
    {}

    /**
     * @brief Get the literal that was rejected
     */
    const std::string& text() const noexcept {
        return text_;
    }

private:
    std::string text_;
};

/**
 * @brief Convert a LocalDate
 * @throws DateTimeError for other kinds or out-of-range fields
 */
toml::date to_date(const DateTime& value);

/**
 * @brief Convert a LocalTime
 * @throws DateTimeError for other kinds or out-of-range fields
 */
toml::time to_time(const DateTime& value);

/**
 * @brief Convert a LocalDateTime or OffsetDateTime
 *
 * The offset is present in the result only for OffsetDateTime.
 *
 * @throws DateTimeError for other kinds or out-of-range fields
 */
toml::date_time to_date_time(const DateTime& value);

} // namespace boml

#endif // BOML_DATETIME_HPP
