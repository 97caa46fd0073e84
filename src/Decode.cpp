/**
 * @file Decode.cpp
 * @brief String escapes, number literals and date/time shapes
 */

#include "boml/Decode.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>
#include <string>
#include <system_error>

namespace boml {

namespace {

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool is_alpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Decimal exponent of the leading significant digit of a stripped float
// literal ("0.05e3" gives 1); out-of-range literals at or above zero
// overflow, below it they underflow.
long decimal_magnitude(std::string_view digits) {
    constexpr long kExponentCap = 100000;
    std::size_t i = digits[0] == '-' ? 1 : 0;

    long magnitude = 0;
    bool found = false;
    long int_digits = 0;
    for (; i < digits.size() && is_digit(digits[i]); ++i, ++int_digits) {
        if (!found && digits[i] != '0') {
            found = true;
            magnitude = -int_digits;
        }
    }
    if (found) {
        magnitude += int_digits - 1;
    }
    if (i < digits.size() && digits[i] == '.') {
        long position = 0;
        for (++i; i < digits.size() && is_digit(digits[i]); ++i) {
            --position;
            if (!found && digits[i] != '0') {
                found = true;
                magnitude = position;
            }
        }
    }

    long exponent = 0;
    if (i < digits.size() && digits[i] == 'e') {
        ++i;
        const bool minus = i < digits.size() && digits[i] == '-';
        if (i < digits.size() && (digits[i] == '+' || digits[i] == '-')) ++i;
        for (; i < digits.size(); ++i) {
            exponent = std::min(exponent * 10 + (digits[i] - '0'), kExponentCap);
        }
        if (minus) exponent = -exponent;
    }
    return magnitude + exponent;
}

bool is_base_digit(char c, int base) {
    switch (base) {
        case 2:  return c == '0' || c == '1';
        case 8:  return c >= '0' && c <= '7';
        case 16: return hex_value(c) >= 0;
        default: return is_digit(c);
    }
}

std::size_t utf8_length(char lead) {
    const auto c = static_cast<unsigned char>(lead);
    if (c < 0x80) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    return 4;
}

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// Copies the digits of a run to out, dropping underscores. Each underscore
// must sit between two digits of the base.
std::size_t strip_underscores(std::string_view digits, int base, char* out, const Span& span) {
    std::size_t len = 0;
    for (std::size_t k = 0; k < digits.size(); ++k) {
        const char c = digits[k];
        if (c == '_') {
            if (k == 0 || k + 1 == digits.size() || !is_base_digit(digits[k - 1], base)
                || !is_base_digit(digits[k + 1], base)) {
                throw ParseError(ParseErrorKind::InvalidNumber, span);
            }
            continue;
        }
        if (!is_base_digit(c, base)) {
            throw ParseError(ParseErrorKind::InvalidNumber, span);
        }
        out[len++] = c;
    }
    return len;
}

} // namespace

// ============================================================================
// Strings
// ============================================================================

TomlString decode_string(std::string_view source, const Token& token) {
    const std::string_view text = token.content.text(source);
    const bool basic = token.kind == TokenKind::BasicString
        || token.kind == TokenKind::MultilineBasicString;
    if (!basic || !token.has_escape) {
        return TomlString::borrowed(text, token.span);
    }

    const bool multiline = token.kind == TokenKind::MultilineBasicString;
    const std::size_t base = token.content.start;
    const std::size_t size = text.size();

    std::string out;
    out.reserve(size);

    std::size_t i = 0;
    while (i < size) {
        const std::size_t slash = text.find('\\', i);
        if (slash == std::string_view::npos) {
            out.append(text.substr(i));
            break;
        }
        out.append(text.substr(i, slash - i));
        i = slash;

        const char e = i + 1 < size ? text[i + 1] : '\0';
        switch (e) {
            case 'b':  out += '\b'; i += 2; continue;
            case 't':  out += '\t'; i += 2; continue;
            case 'n':  out += '\n'; i += 2; continue;
            case 'f':  out += '\f'; i += 2; continue;
            case 'r':  out += '\r'; i += 2; continue;
            case '"':  out += '"';  i += 2; continue;
            case '\\': out += '\\'; i += 2; continue;
            case 'u':
            case 'U': {
                const std::size_t count = e == 'u' ? 4 : 8;
                const std::size_t end = i + 2 + count;
                if (end > size) {
                    throw ParseError(ParseErrorKind::InvalidUnicodeScalar, Span(base + i, base + size));
                }
                std::uint32_t cp = 0;
                for (std::size_t k = i + 2; k < end; ++k) {
                    const int digit = hex_value(text[k]);
                    if (digit < 0) {
                        throw ParseError(ParseErrorKind::InvalidUnicodeScalar, Span(base + i, base + end));
                    }
                    cp = (cp << 4) | static_cast<std::uint32_t>(digit);
                }
                if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
                    throw ParseError(ParseErrorKind::InvalidUnicodeScalar, Span(base + i, base + end));
                }
                append_utf8(out, cp);
                i = end;
                continue;
            }
            default:
                break;
        }

        if (multiline && (e == ' ' || e == '\t' || e == '\n' || e == '\r')) {
            // Line-ending backslash: trailing blanks, then a line ending, then
            // every blank and line ending up to the next content.
            std::size_t j = i + 1;
            while (j < size && (text[j] == ' ' || text[j] == '\t')) ++j;
            if (j >= size || (text[j] != '\n' && text[j] != '\r')) {
                throw ParseError(ParseErrorKind::InvalidEscape, Span(base + i, base + j));
            }
            while (j < size && (text[j] == ' ' || text[j] == '\t' || text[j] == '\n' || text[j] == '\r')) {
                ++j;
            }
            i = j;
            continue;
        }

        const std::size_t len = i + 1 < size ? utf8_length(e) : 0;
        throw ParseError(ParseErrorKind::InvalidEscape, Span(base + i, base + i + 1 + len));
    }

    return TomlString::owned(std::move(out), token.span);
}

// ============================================================================
// Numbers
// ============================================================================

std::int64_t decode_integer(std::string_view source, const Token& token) {
    const Span span = token.span;
    const std::string_view text = span.text(source);
    if (text.empty() || text.size() > kNumberScratchSize) {
        throw ParseError(ParseErrorKind::InvalidNumber, span);
    }

    std::size_t i = 0;
    const bool signed_literal = text[0] == '+' || text[0] == '-';
    const bool negative = text[0] == '-';
    if (signed_literal) ++i;

    std::string_view body = text.substr(i);
    int base = 10;
    if (body.size() >= 2 && body[0] == '0' && is_alpha(body[1])) {
        switch (body[1]) {
            case 'x': base = 16; break;
            case 'o': base = 8;  break;
            case 'b': base = 2;  break;
            default:
                throw ParseError(ParseErrorKind::NumberHasInvalidBase, span);
        }
        // 0x, 0o and 0b literals are unsigned in TOML.
        if (signed_literal) {
            throw ParseError(ParseErrorKind::InvalidNumber, span);
        }
        body.remove_prefix(2);
    } else if (body.size() > 1 && body[0] == '0') {
        throw ParseError(ParseErrorKind::NumberHasLeadingZero, span);
    }

    char scratch[kNumberScratchSize + 1];
    std::size_t len = 0;
    if (negative) scratch[len++] = '-';

    std::size_t digits;
    if (token.has_underscore) {
        digits = strip_underscores(body, base, scratch + len, span);
    } else {
        for (std::size_t k = 0; k < body.size(); ++k) {
            if (!is_base_digit(body[k], base)) throw ParseError(ParseErrorKind::InvalidNumber, span);
            scratch[len + k] = body[k];
        }
        digits = body.size();
    }
    if (digits == 0) {
        throw ParseError(ParseErrorKind::InvalidNumber, span);
    }
    len += digits;

    std::int64_t value = 0;
    const auto [ptr, ec] = std::from_chars(scratch, scratch + len, value, base);
    if (ec == std::errc::result_out_of_range) {
        throw ParseError(ParseErrorKind::NumberTooLarge, span);
    }
    if (ec != std::errc() || ptr != scratch + len) {
        throw ParseError(ParseErrorKind::InvalidNumber, span);
    }
    return value;
}

double decode_float(std::string_view source, const Token& token) {
    const Span span = token.span;
    const std::string_view text = span.text(source);
    if (text.empty() || text.size() > kNumberScratchSize) {
        throw ParseError(ParseErrorKind::InvalidNumber, span);
    }

    const bool negative = text[0] == '-';
    std::string_view unsigned_text = text;
    if (text[0] == '+' || text[0] == '-') unsigned_text.remove_prefix(1);

    if (unsigned_text == "inf") {
        return negative ? -std::numeric_limits<double>::infinity()
                        : std::numeric_limits<double>::infinity();
    }
    if (unsigned_text == "nan") {
        return std::copysign(std::numeric_limits<double>::quiet_NaN(), negative ? -1.0 : 1.0);
    }

    char scratch[kNumberScratchSize + 1];
    std::size_t len = 0;
    std::size_t i = 0;
    const std::size_t size = text.size();

    // Copies one run of decimal digits (with separators) and returns the
    // index just past it.
    auto copy_digits = [&](std::size_t from) {
        std::size_t k = from;
        while (k < size && (is_digit(text[k]) || text[k] == '_')) ++k;
        if (k == from) {
            throw ParseError(ParseErrorKind::InvalidNumber, span);
        }
        len += strip_underscores(text.substr(from, k - from), 10, scratch + len, span);
        return k;
    };

    if (text[i] == '+') {
        ++i;
    } else if (text[i] == '-') {
        scratch[len++] = '-';
        ++i;
    }

    const std::size_t int_start = i;
    i = copy_digits(i);
    if (text[int_start] == '0' && i - int_start > 1) {
        throw ParseError(ParseErrorKind::NumberHasLeadingZero, span);
    }

    bool fraction = false;
    bool exponent = false;
    if (i < size && text[i] == '.') {
        scratch[len++] = '.';
        i = copy_digits(i + 1);
        fraction = true;
    }
    if (i < size && (text[i] == 'e' || text[i] == 'E')) {
        scratch[len++] = 'e';
        ++i;
        if (i < size && (text[i] == '+' || text[i] == '-')) {
            scratch[len++] = text[i++];
        }
        i = copy_digits(i);
        exponent = true;
    }
    if (i != size || (!fraction && !exponent)) {
        throw ParseError(ParseErrorKind::InvalidNumber, span);
    }

    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(scratch, scratch + len, value);
    if (ec == std::errc::result_out_of_range && ptr == scratch + len
        && decimal_magnitude(std::string_view(scratch, len)) < 0) {
        // Too small for a subnormal.
        return negative ? -0.0 : 0.0;
    }
    if (ec != std::errc() || ptr != scratch + len) {
        throw ParseError(ParseErrorKind::InvalidNumber, span);
    }
    return value;
}

// ============================================================================
// Date/time
// ============================================================================

DateTime decode_datetime(std::string_view source, const Token& token) {
    const std::string_view text = token.span.text(source);
    const std::size_t size = text.size();
    std::size_t i = 0;

    auto digits = [&](std::size_t count) {
        for (std::size_t k = 0; k < count; ++k) {
            if (i + k >= size || !is_digit(text[i + k])) return false;
        }
        i += count;
        return true;
    };
    auto literal = [&](char c) {
        if (i < size && text[i] == c) {
            ++i;
            return true;
        }
        return false;
    };
    auto time = [&]() {
        if (!digits(2) || !literal(':') || !digits(2) || !literal(':') || !digits(2)) return false;
        if (literal('.')) {
            if (!digits(1)) return false;
            while (i < size && is_digit(text[i])) ++i;
        }
        return true;
    };
    auto fail = [&]() {
        throw ParseError(ParseErrorKind::InvalidDateTime, token.span);
    };

    ValueKind kind = ValueKind::LocalDate;
    if (size >= 3 && text[2] == ':') {
        if (!time()) fail();
        kind = ValueKind::LocalTime;
    } else {
        if (!digits(4) || !literal('-') || !digits(2) || !literal('-') || !digits(2)) fail();
        if (i == size) {
            kind = ValueKind::LocalDate;
        } else {
            if (!literal('T') && !literal('t') && !literal(' ')) fail();
            if (!time()) fail();
            if (i == size) {
                kind = ValueKind::LocalDateTime;
            } else {
                if (!literal('Z') && !literal('z')) {
                    if (!literal('+') && !literal('-')) fail();
                    if (!digits(2) || !literal(':') || !digits(2)) fail();
                }
                kind = ValueKind::OffsetDateTime;
            }
        }
    }
    if (i != size) fail();

    DateTime dt;
    dt.kind = kind;
    dt.text = text;
    dt.span = token.span;
    return dt;
}

} // namespace boml
