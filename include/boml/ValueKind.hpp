/**
 * @file ValueKind.hpp
 * @brief Discriminator for the alternatives of boml::Value
 */

#ifndef BOML_VALUEKIND_HPP
#define BOML_VALUEKIND_HPP

#include <cstdint>
#include <string_view>

namespace boml {

/**
 * @brief The kind of value held by a boml::Value
 *
 * The four date/time kinds are placeholders: they are chosen from the
 * lexical shape of the literal and carry only its raw text.
 */
enum class ValueKind : std::uint8_t {
    String,
    Integer,
    Float,
    Boolean,
    OffsetDateTime,
    LocalDateTime,
    LocalDate,
    LocalTime,
    Array,
    Table,
};

/**
 * @brief Lowercase name of a value kind ("string", "integer", ...)
 */
std::string_view kind_name(ValueKind kind) noexcept;

} // namespace boml

#endif // BOML_VALUEKIND_HPP
