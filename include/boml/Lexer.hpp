/**
 * @file Lexer.hpp
 * @brief On-demand tokenizer for TOML source text
 *
 * The lexer never copies or decodes; it only classifies byte ranges of the
 * source. Because the same characters mean different things on either side
 * of '=' (a bare key "1234" versus the integer 1234), the caller selects a
 * mode for every token it requests:
 * - LexMode::Key   bare keys, quoted keys and header/structure punctuation
 * - LexMode::Value strings, numbers, booleans, date/times, '[' '{' ',' ...
 *
 * Whitespace and comments are skipped before every token. Line endings are
 * significant and come back as TokenKind::Newline.
 */

#ifndef BOML_LEXER_HPP
#define BOML_LEXER_HPP

#include "boml/Errors.hpp"
#include "boml/Span.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace boml {

enum class LexMode : std::uint8_t {
    Key,
    Value,
};

enum class TokenKind : std::uint8_t {
    BareKey,
    BasicString,
    LiteralString,
    MultilineBasicString,
    MultilineLiteralString,
    Integer,
    Float,
    Boolean,
    DateTime,
    Equals,
    Dot,
    Comma,
    LeftBracket,
    RightBracket,
    DoubleLeftBracket,
    DoubleRightBracket,
    LeftBrace,
    RightBrace,
    Newline,
    EndOfInput,
};

struct Token {
    TokenKind kind = TokenKind::EndOfInput;
    /// Full lexeme, delimiters included.
    Span span;
    /// String contents without delimiters; equal to span for other tokens.
    Span content;
    /// Basic strings only: a backslash occurs in the contents.
    bool has_escape = false;
    /// Numbers only: the literal contains '_' separators.
    bool has_underscore = false;

    bool is_string() const noexcept {
        return kind == TokenKind::BasicString || kind == TokenKind::LiteralString
            || kind == TokenKind::MultilineBasicString
            || kind == TokenKind::MultilineLiteralString;
    }
};

/**
 * @brief Reject anything that is not well-formed UTF-8
 *
 * Overlong encodings, surrogate code points and values above U+10FFFF are
 * rejected as well.
 *
 * @throws ParseError (InvalidEncoding) spanning the first bad sequence
 */
void validate_utf8(std::string_view source);

class Lexer {
public:
    /**
     * @brief Tokenize @p source, which must already be valid UTF-8
     *
     * The lexer keeps a view; the buffer must outlive it.
     */
    explicit Lexer(std::string_view source) noexcept : source_(source) {}

    /**
     * @brief Consume and return the next token
     * @throws ParseError on malformed strings, control characters or
     *         unrecognised values
     */
    Token next(LexMode mode);

    /**
     * @brief Return the next token without consuming it
     */
    Token peek(LexMode mode);

    /**
     * @brief Consume the end of a statement
     *
     * Skips trailing whitespace and a comment, then requires a line ending
     * or the end of input.
     *
     * @throws ParseError (ExpectedNewline) at the first byte of anything else
     */
    void expect_line_end();

    std::size_t position() const noexcept { return pos_; }
    std::string_view source() const noexcept { return source_; }

private:
    bool at_end() const noexcept { return pos_ >= source_.size(); }
    char char_at(std::size_t offset) const noexcept {
        return offset < source_.size() ? source_[offset] : '\0';
    }

    void skip_blank();
    Token make(TokenKind kind, std::size_t start, std::size_t end);
    Token lex_bare_key();
    Token lex_basic_string(bool allow_multiline);
    Token lex_literal_string(bool allow_multiline);
    Token lex_multiline(std::size_t start, char quote);
    Token lex_value_word();

    [[noreturn]] void fail(ParseErrorKind kind, std::size_t start, std::size_t end) const;

    std::string_view source_;
    std::size_t pos_ = 0;
};

} // namespace boml

#endif // BOML_LEXER_HPP
