/**
 * @file Decode.hpp
 * @brief Turn lexer tokens into values
 *
 * The lexer only classifies; these functions interpret the matched text.
 * All of them take the full source plus a token and report failures as
 * ParseError with a span inside that token.
 */

#ifndef BOML_DECODE_HPP
#define BOML_DECODE_HPP

#include "boml/Lexer.hpp"
#include "boml/TomlString.hpp"
#include "boml/Value.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace boml {

/// Longest number literal (underscores included) the decoders accept.
inline constexpr std::size_t kNumberScratchSize = 768;

/**
 * @brief Decode any of the four string token kinds
 *
 * Literal strings and basic strings without escapes borrow from @p source;
 * only basic strings flagged with an escape are copied.
 *
 * @throws ParseError InvalidEscape, InvalidUnicodeScalar
 */
TomlString decode_string(std::string_view source, const Token& token);

/**
 * @brief Decode an Integer token
 * @throws ParseError InvalidNumber, NumberTooLarge, NumberHasLeadingZero,
 *         NumberHasInvalidBase
 */
std::int64_t decode_integer(std::string_view source, const Token& token);

/**
 * @brief Decode a Float token (including inf and nan)
 * @throws ParseError InvalidNumber, NumberHasLeadingZero
 */
double decode_float(std::string_view source, const Token& token);

/**
 * @brief Classify a DateTime token by shape
 *
 * Field ranges are not checked (month 13 passes); only the layout of
 * digits and separators is.
 *
 * @throws ParseError InvalidDateTime
 */
DateTime decode_datetime(std::string_view source, const Token& token);

} // namespace boml

#endif // BOML_DECODE_HPP
