/**
 * @file Diagnostics.hpp
 * @brief Human-readable rendering of parse errors
 *
 * ParseError only knows byte offsets. These helpers resolve them against
 * the source to produce line/column positions and a short excerpt:
 *
 * ```
 * DuplicateKey at line 3, column 1: 'name'
 *   2 | name = "x"
 *   3 | name = "y"
 *     | ^^^^
 * ```
 */

#ifndef BOML_DIAGNOSTICS_HPP
#define BOML_DIAGNOSTICS_HPP

#include "boml/Errors.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace boml {

/**
 * @brief 1-based position in a source buffer
 *
 * The column counts bytes, not characters.
 */
struct SourceLocation {
    std::size_t line = 1;
    std::size_t column = 1;
};

/**
 * @brief Resolve a byte offset to a line and column
 *
 * Offsets past the end resolve to the position just after the last byte.
 */
SourceLocation locate(std::string_view source, std::size_t offset) noexcept;

/**
 * @brief Format @p error with its location and an excerpt of @p source
 *
 * @p source must be the buffer the error was raised for.
 */
std::string describe(std::string_view source, const ParseError& error);

} // namespace boml

#endif // BOML_DIAGNOSTICS_HPP
