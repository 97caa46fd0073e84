/**
 * @file Lexer.cpp
 * @brief Tokenizer and UTF-8 validation
 */

#include "boml/Lexer.hpp"

#include <cstdint>

namespace boml {

namespace {

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool is_alpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool is_bare_key_char(char c) {
    return is_alpha(c) || is_digit(c) || c == '_' || c == '-';
}

// Characters that may appear in a number, boolean, inf/nan or date/time.
bool is_value_word_char(char c) {
    return is_alpha(c) || is_digit(c) || c == '_' || c == '+' || c == '-'
        || c == '.' || c == ':';
}

// Control characters are forbidden everywhere except tab (and line endings,
// which callers handle first).
bool is_control(unsigned char c) {
    return (c < 0x20 && c != '\t') || c == 0x7F;
}

bool is_full_date(std::string_view word) {
    if (word.size() != 10) return false;
    for (std::size_t i = 0; i < 10; ++i) {
        const bool dash = (i == 4 || i == 7);
        if (dash ? word[i] != '-' : !is_digit(word[i])) return false;
    }
    return true;
}

bool is_special_float(std::string_view word) {
    if (!word.empty() && (word[0] == '+' || word[0] == '-')) {
        word.remove_prefix(1);
    }
    return word == "inf" || word == "nan";
}

} // namespace

// ============================================================================
// UTF-8 validation
// ============================================================================

void validate_utf8(std::string_view source) {
    const std::size_t n = source.size();
    std::size_t i = 0;
    while (i < n) {
        const auto lead = static_cast<unsigned char>(source[i]);
        if (lead < 0x80) {
            ++i;
            continue;
        }

        std::size_t len;
        std::uint32_t cp;
        std::uint32_t min;
        if ((lead & 0xE0) == 0xC0) {
            len = 2; cp = lead & 0x1F; min = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            len = 3; cp = lead & 0x0F; min = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            len = 4; cp = lead & 0x07; min = 0x10000;
        } else {
            throw ParseError(ParseErrorKind::InvalidEncoding, Span(i, i + 1));
        }

        if (i + len > n) {
            throw ParseError(ParseErrorKind::InvalidEncoding, Span(i, n));
        }
        for (std::size_t k = 1; k < len; ++k) {
            const auto cont = static_cast<unsigned char>(source[i + k]);
            if ((cont & 0xC0) != 0x80) {
                throw ParseError(ParseErrorKind::InvalidEncoding, Span(i, i + k + 1));
            }
            cp = (cp << 6) | (cont & 0x3F);
        }
        if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            throw ParseError(ParseErrorKind::InvalidEncoding, Span(i, i + len));
        }
        i += len;
    }
}

// ============================================================================
// Lexer
// ============================================================================

void Lexer::fail(ParseErrorKind kind, std::size_t start, std::size_t end) const {
    throw ParseError(kind, Span(start, end));
}

Token Lexer::make(TokenKind kind, std::size_t start, std::size_t end) {
    Token token;
    token.kind = kind;
    token.span = Span(start, end);
    token.content = token.span;
    pos_ = end;
    return token;
}

void Lexer::skip_blank() {
    while (!at_end()) {
        const char c = source_[pos_];
        if (c == ' ' || c == '\t') {
            ++pos_;
            continue;
        }
        if (c != '#') break;

        // Comment runs to the line ending, which is left for the caller.
        ++pos_;
        while (!at_end()) {
            const auto d = static_cast<unsigned char>(source_[pos_]);
            if (d == '\n') break;
            if (d == '\r' && char_at(pos_ + 1) == '\n') break;
            if (is_control(d)) fail(ParseErrorKind::UnexpectedCharacter, pos_, pos_ + 1);
            ++pos_;
        }
    }
}

Token Lexer::peek(LexMode mode) {
    const std::size_t saved = pos_;
    Token token = next(mode);
    pos_ = saved;
    return token;
}

Token Lexer::next(LexMode mode) {
    skip_blank();
    const std::size_t start = pos_;
    if (at_end()) {
        return make(TokenKind::EndOfInput, start, start);
    }

    const char c = source_[start];
    switch (c) {
        case '\n':
            return make(TokenKind::Newline, start, start + 1);
        case '\r':
            if (char_at(start + 1) == '\n') return make(TokenKind::Newline, start, start + 2);
            fail(ParseErrorKind::UnexpectedCharacter, start, start + 1);
        case '[':
            if (mode == LexMode::Key && char_at(start + 1) == '[') {
                return make(TokenKind::DoubleLeftBracket, start, start + 2);
            }
            return make(TokenKind::LeftBracket, start, start + 1);
        case ']':
            if (mode == LexMode::Key && char_at(start + 1) == ']') {
                return make(TokenKind::DoubleRightBracket, start, start + 2);
            }
            return make(TokenKind::RightBracket, start, start + 1);
        case '{':
            return make(TokenKind::LeftBrace, start, start + 1);
        case '}':
            return make(TokenKind::RightBrace, start, start + 1);
        case ',':
            return make(TokenKind::Comma, start, start + 1);
        case '=':
            return make(TokenKind::Equals, start, start + 1);
        case '"':
            return lex_basic_string(mode == LexMode::Value);
        case '\'':
            return lex_literal_string(mode == LexMode::Value);
        default:
            break;
    }

    if (mode == LexMode::Key) {
        if (c == '.') return make(TokenKind::Dot, start, start + 1);
        if (is_bare_key_char(c)) return lex_bare_key();

        const auto u = static_cast<unsigned char>(c);
        if (u >= 0x80 || (u > 0x20 && u < 0x7F)) {
            // Printable, so probably meant as part of a key.
            std::size_t end = start + 1;
            while (end < source_.size() && (static_cast<unsigned char>(source_[end]) & 0xC0) == 0x80) {
                ++end;
            }
            fail(ParseErrorKind::InvalidBareKey, start, end);
        }
        fail(ParseErrorKind::UnexpectedCharacter, start, start + 1);
    }

    if (is_value_word_char(c)) return lex_value_word();
    fail(ParseErrorKind::UnexpectedCharacter, start, start + 1);
}

void Lexer::expect_line_end() {
    skip_blank();
    if (at_end()) return;
    if (source_[pos_] == '\n') {
        ++pos_;
        return;
    }
    if (source_[pos_] == '\r') {
        if (char_at(pos_ + 1) != '\n') fail(ParseErrorKind::UnexpectedCharacter, pos_, pos_ + 1);
        pos_ += 2;
        return;
    }
    std::size_t end = pos_ + 1;
    while (end < source_.size() && (static_cast<unsigned char>(source_[end]) & 0xC0) == 0x80) {
        ++end;
    }
    fail(ParseErrorKind::ExpectedNewline, pos_, end);
}

Token Lexer::lex_bare_key() {
    const std::size_t start = pos_;
    std::size_t end = start;
    while (end < source_.size() && is_bare_key_char(source_[end])) ++end;
    return make(TokenKind::BareKey, start, end);
}

// ----------------------------------------------------------------------------
// Strings
// ----------------------------------------------------------------------------

Token Lexer::lex_basic_string(bool allow_multiline) {
    const std::size_t start = pos_;
    if (allow_multiline && char_at(start + 1) == '"' && char_at(start + 2) == '"') {
        return lex_multiline(start, '"');
    }

    const std::size_t n = source_.size();
    bool escape = false;
    std::size_t i = start + 1;
    while (true) {
        if (i >= n) fail(ParseErrorKind::UnterminatedString, start, n);
        const auto c = static_cast<unsigned char>(source_[i]);
        if (c == '"') break;
        if (c == '\n' || c == '\r') fail(ParseErrorKind::UnterminatedString, start, i);
        if (c == '\\') {
            // Skip the escaped byte so \" does not close the string.
            escape = true;
            const char escaped = char_at(i + 1);
            if (i + 1 >= n || escaped == '\n' || escaped == '\r') {
                fail(ParseErrorKind::UnterminatedString, start, i + 1);
            }
            i += 2;
            continue;
        }
        if (is_control(c)) fail(ParseErrorKind::UnexpectedCharacter, i, i + 1);
        ++i;
    }

    Token token = make(TokenKind::BasicString, start, i + 1);
    token.content = Span(start + 1, i);
    token.has_escape = escape;
    return token;
}

Token Lexer::lex_literal_string(bool allow_multiline) {
    const std::size_t start = pos_;
    if (allow_multiline && char_at(start + 1) == '\'' && char_at(start + 2) == '\'') {
        return lex_multiline(start, '\'');
    }

    const std::size_t n = source_.size();
    std::size_t i = start + 1;
    while (true) {
        if (i >= n) fail(ParseErrorKind::UnterminatedString, start, n);
        const auto c = static_cast<unsigned char>(source_[i]);
        if (c == '\'') break;
        if (c == '\n' || c == '\r') fail(ParseErrorKind::UnterminatedString, start, i);
        if (is_control(c)) fail(ParseErrorKind::UnexpectedCharacter, i, i + 1);
        ++i;
    }

    Token token = make(TokenKind::LiteralString, start, i + 1);
    token.content = Span(start + 1, i);
    return token;
}

Token Lexer::lex_multiline(std::size_t start, char quote) {
    const std::size_t n = source_.size();

    // A line ending right after the opening delimiter is not content.
    std::size_t content_start = start + 3;
    if (char_at(content_start) == '\n') {
        content_start += 1;
    } else if (char_at(content_start) == '\r' && char_at(content_start + 1) == '\n') {
        content_start += 2;
    }

    bool escape = false;
    std::size_t i = start + 3;
    while (true) {
        if (i >= n) fail(ParseErrorKind::UnterminatedString, start, n);
        const auto c = static_cast<unsigned char>(source_[i]);

        if (c == static_cast<unsigned char>(quote) && char_at(i + 1) == quote && char_at(i + 2) == quote) {
            // Up to two quotes in front of the closing delimiter are content.
            std::size_t run = 3;
            while (char_at(i + run) == quote) ++run;
            std::size_t extra = run - 3;
            if (extra > 2) extra = 2;

            const std::size_t content_end = i + extra;
            Token token = make(quote == '"' ? TokenKind::MultilineBasicString
                                            : TokenKind::MultilineLiteralString,
                               start, content_end + 3);
            token.content = Span(content_start, content_end);
            token.has_escape = escape;
            return token;
        }

        if (quote == '"' && c == '\\') {
            escape = true;
            if (i + 1 >= n) fail(ParseErrorKind::UnterminatedString, start, n);
            i += 2;
            continue;
        }
        if (c == '\r') {
            if (char_at(i + 1) != '\n') fail(ParseErrorKind::UnexpectedCharacter, i, i + 1);
            i += 2;
            continue;
        }
        if (c != '\n' && is_control(c)) fail(ParseErrorKind::UnexpectedCharacter, i, i + 1);
        ++i;
    }
}

// ----------------------------------------------------------------------------
// Numbers, booleans, date/times
// ----------------------------------------------------------------------------

Token Lexer::lex_value_word() {
    const std::size_t start = pos_;
    const std::size_t n = source_.size();
    std::size_t end = start;
    while (end < n && is_value_word_char(source_[end])) ++end;

    // "1979-05-27 07:32:00" is one value.
    if (is_full_date(source_.substr(start, end - start)) && char_at(end) == ' '
        && is_digit(char_at(end + 1))) {
        end += 1;
        while (end < n && is_value_word_char(source_[end])) ++end;
    }

    const std::string_view word = source_.substr(start, end - start);
    if (word == "true" || word == "false") {
        return make(TokenKind::Boolean, start, end);
    }
    if (is_special_float(word)) {
        return make(TokenKind::Float, start, end);
    }

    const std::size_t first = (word[0] == '+' || word[0] == '-') ? 1 : 0;
    if (first >= word.size() || !is_digit(word[first])) {
        fail(ParseErrorKind::ExpectedValue, start, end);
    }

    if (first == 0) {
        bool datetime = word.find(':') != std::string_view::npos;
        if (!datetime && word.size() >= 5 && word[4] == '-') {
            datetime = is_digit(word[0]) && is_digit(word[1]) && is_digit(word[2]) && is_digit(word[3]);
        }
        if (datetime) return make(TokenKind::DateTime, start, end);
    }

    TokenKind kind = TokenKind::Integer;
    const bool prefixed = word.size() > first + 1 && word[first] == '0' && is_alpha(word[first + 1])
        && word[first + 1] != 'e' && word[first + 1] != 'E';
    if (!prefixed && word.find_first_of(".eE") != std::string_view::npos) {
        kind = TokenKind::Float;
    }

    Token token = make(kind, start, end);
    token.has_underscore = word.find('_') != std::string_view::npos;
    return token;
}

} // namespace boml
