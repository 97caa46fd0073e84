/**
 * @file Errors.cpp
 * @brief Messages for parse and accessor errors
 */

#include "boml/Errors.hpp"
#include "boml/Value.hpp"

#include <sstream>

namespace boml {

std::string_view to_string(ParseErrorKind kind) noexcept {
    switch (kind) {
        case ParseErrorKind::InvalidEncoding:      return "InvalidEncoding";
        case ParseErrorKind::UnexpectedCharacter:  return "UnexpectedCharacter";
        case ParseErrorKind::InvalidBareKey:       return "InvalidBareKey";
        case ParseErrorKind::UnterminatedString:   return "UnterminatedString";
        case ParseErrorKind::InvalidEscape:        return "InvalidEscape";
        case ParseErrorKind::InvalidUnicodeScalar: return "InvalidUnicodeScalar";
        case ParseErrorKind::InvalidNumber:        return "InvalidNumber";
        case ParseErrorKind::NumberTooLarge:       return "NumberTooLarge";
        case ParseErrorKind::NumberHasLeadingZero: return "NumberHasLeadingZero";
        case ParseErrorKind::NumberHasInvalidBase: return "NumberHasInvalidBase";
        case ParseErrorKind::InvalidDateTime:      return "InvalidDateTime";
        case ParseErrorKind::DuplicateKey:         return "DuplicateKey";
        case ParseErrorKind::ExpectedKey:          return "ExpectedKey";
        case ParseErrorKind::ExpectedEquals:       return "ExpectedEquals";
        case ParseErrorKind::ExpectedValue:        return "ExpectedValue";
        case ParseErrorKind::ExpectedComma:        return "ExpectedComma";
        case ParseErrorKind::ExpectedNewline:      return "ExpectedNewline";
        case ParseErrorKind::UnclosedArray:        return "UnclosedArray";
        case ParseErrorKind::UnclosedInlineTable:  return "UnclosedInlineTable";
        case ParseErrorKind::UnclosedTableHeader:  return "UnclosedTableHeader";
        case ParseErrorKind::UnexpectedEndOfInput: return "UnexpectedEndOfInput";
        case ParseErrorKind::NestingTooDeep:       return "NestingTooDeep";
    }
    return "Unknown";
}

namespace {

std::string format_parse_error(ParseErrorKind kind, const Span& span) {
    std::ostringstream oss;
    oss << "TOML parse error: " << to_string(kind)
        << " at bytes " << span.start << ".." << span.end;
    return oss.str();
}

std::string format_type_mismatch(ValueKind found, ValueKind expected, std::string_view note) {
    std::ostringstream oss;
    oss << "Type mismatch: expected " << kind_name(expected)
        << ", found " << kind_name(found);
    if (!note.empty()) {
        oss << " (" << note << ")";
    }
    return oss.str();
}

} // namespace

ParseError::ParseError(ParseErrorKind kind, Span span)
    : std::runtime_error(format_parse_error(kind, span))
    , kind_(kind)
    , span_(span)
{}

TypeMismatch::TypeMismatch(const Value& found, ValueKind expected, std::string_view note)
    : AccessorError(format_type_mismatch(found.kind(), expected, note))
    , found_(&found)
    , found_kind_(found.kind())
    , expected_(expected)
{}

} // namespace boml
