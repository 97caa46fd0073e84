/**
 * @file Errors.hpp
 * @brief Exception types for boml parse and lookup failures
 *
 * Two independent taxonomies:
 * - ParseError: structural failure while parsing; carries a kind and the
 *   span of the offending text. The first one aborts the parse.
 * - AccessorError: failed lookup on an already parsed tree. Subclasses are
 *   InvalidKey (absent key) and TypeMismatch (present key, other kind).
 *   Accessor errors carry no span.
 */

#ifndef BOML_ERRORS_HPP
#define BOML_ERRORS_HPP

#include "boml/Span.hpp"
#include "boml/ValueKind.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace boml {

class Value;

/**
 * @brief Reason a parse failed
 */
enum class ParseErrorKind : std::uint8_t {
    /// The source is not valid UTF-8.
    InvalidEncoding,
    /// A character that cannot start or continue any token here.
    UnexpectedCharacter,
    /// A bare key contains a character outside [A-Za-z0-9_-].
    InvalidBareKey,
    /// A string has no closing delimiter on its line (or before end of input).
    UnterminatedString,
    /// A basic string contains an unknown escape sequence.
    InvalidEscape,
    /// A \u or \U escape does not name a Unicode scalar value.
    InvalidUnicodeScalar,
    /// A number is malformed.
    InvalidNumber,
    /// An integer does not fit in 64 signed bits.
    NumberTooLarge,
    /// A decimal integer starts with 0.
    NumberHasLeadingZero,
    /// A 0-prefixed integer uses a base other than 0x, 0o or 0b.
    NumberHasInvalidBase,
    /// A value shaped like a date or time is malformed.
    InvalidDateTime,
    /// A key or table was defined twice.
    DuplicateKey,
    /// A key was required.
    ExpectedKey,
    /// A key was not followed by '='.
    ExpectedEquals,
    /// A value was required.
    ExpectedValue,
    /// Values in an array or inline table were not separated by ','.
    ExpectedComma,
    /// A statement was not followed by a newline.
    ExpectedNewline,
    /// An array has no closing ']'.
    UnclosedArray,
    /// An inline table has no closing '}'.
    UnclosedInlineTable,
    /// A [table] or [[array]] header has no closing bracket.
    UnclosedTableHeader,
    /// Input ended where more was required.
    UnexpectedEndOfInput,
    /// Arrays or inline tables are nested deeper than the parser allows.
    NestingTooDeep,
};

/**
 * @brief Name of a parse error kind ("DuplicateKey", ...)
 */
std::string_view to_string(ParseErrorKind kind) noexcept;

/**
 * @brief Structural error raised while parsing
 *
 * Thrown by boml::parse at the first malformed construct. The span points
 * into the source that was being parsed; use boml::describe to render it.
 */
class ParseError : public std::runtime_error {
public:
    /**
     * @brief Construct with kind and originating span
     * @param kind What went wrong
     * @param span Byte range of the offending text
     */
    ParseError(ParseErrorKind kind, Span span);

    /**
     * @brief Get the error kind
     */
    ParseErrorKind kind() const noexcept {
        return kind_;
    }

    /**
     * @brief Get the byte range of the offending text
     */
    const Span& span() const noexcept {
        return span_;
    }

private:
    ParseErrorKind kind_;
    Span span_;
};

/**
 * @brief Base class for failed lookups on a parsed tree
 */
class AccessorError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief The requested key is not present
 */
class InvalidKey : public AccessorError {
public:
    /**
     * @brief Construct with the missing key
     * @param key Key (or dot path) that was looked up
     */
    explicit InvalidKey(std::string key)
        : AccessorError("Key not found: '" + key + "'")
        , key_(std::move(key))
    {}

    /**
     * @brief Get the key that was not found
     */
    const std::string& key() const noexcept {
        return key_;
    }

private:
    std::string key_;
};

/**
 * @brief The key is present but holds a different kind of value
 *
 * Keeps a reference to the value that was actually found, so callers can
 * retry with the right type. The reference is valid as long as the tree it
 * came from.
 */
class TypeMismatch : public AccessorError {
public:
    /**
     * @brief Construct with the value found and the kind requested
     * @param found Value stored under the key
     * @param expected Kind the caller asked for
     * @param note Optional detail appended to the message
     */
    TypeMismatch(const Value& found, ValueKind expected, std::string_view note = {});

    /**
     * @brief Get the value that was found
     */
    const Value& found() const noexcept {
        return *found_;
    }

    /**
     * @brief Get the kind of the value that was found
     */
    ValueKind found_kind() const noexcept {
        return found_kind_;
    }

    /**
     * @brief Get the kind that was requested
     */
    ValueKind expected() const noexcept {
        return expected_;
    }

private:
    const Value* found_;
    ValueKind found_kind_;
    ValueKind expected_;
};

} // namespace boml

#endif // BOML_ERRORS_HPP
