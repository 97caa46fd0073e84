/**
 * @file Parser.cpp
 * @brief Recursive-descent construction of the value tree
 */

#include "boml/Parser.hpp"
#include "boml/Decode.hpp"

#include <string>
#include <utility>

namespace boml {

Parser::Parser(std::string_view source) noexcept
    : source_(source)
    , lexer_(source)
    , current_(&root_)
{}

void Parser::fail(ParseErrorKind kind, Span span) const {
    throw ParseError(kind, span);
}

// Every container, however it was opened, counts towards kMaxDepth so that
// walking or destroying the finished tree stays within a bounded recursion.
std::size_t Parser::nested_depth(std::size_t depth, Span span) const {
    if (depth > kMaxDepth) {
        fail(ParseErrorKind::NestingTooDeep, span);
    }
    return depth;
}

Document Parser::parse() {
    validate_utf8(source_);

    while (true) {
        const Token token = lexer_.peek(LexMode::Key);
        switch (token.kind) {
            case TokenKind::EndOfInput:
                return Document(source_, std::move(root_));
            case TokenKind::Newline:
                lexer_.next(LexMode::Key);
                continue;
            case TokenKind::LeftBracket:
            case TokenKind::DoubleLeftBracket:
                lexer_.next(LexMode::Key);
                parse_header(token);
                break;
            default:
                parse_key_value(*current_);
                break;
        }
        lexer_.expect_line_end();
    }
}

// ============================================================================
// Keys and headers
// ============================================================================

Parser::KeyPath Parser::parse_key() {
    KeyPath path;
    while (true) {
        const Token token = lexer_.next(LexMode::Key);
        switch (token.kind) {
            case TokenKind::BareKey:
                path.push_back({TomlString::borrowed(token.span.text(source_), token.span), token.span});
                break;
            case TokenKind::BasicString:
            case TokenKind::LiteralString:
                path.push_back({decode_string(source_, token), token.span});
                break;
            case TokenKind::EndOfInput:
                fail(ParseErrorKind::UnexpectedEndOfInput, token.span);
            default:
                fail(ParseErrorKind::ExpectedKey, token.span);
        }

        if (lexer_.peek(LexMode::Key).kind != TokenKind::Dot) {
            return path;
        }
        lexer_.next(LexMode::Key);
    }
}

void Parser::parse_header(const Token& open) {
    const bool array = open.kind == TokenKind::DoubleLeftBracket;
    KeyPath path = parse_key();

    const Token close = lexer_.next(LexMode::Key);
    const TokenKind wanted = array ? TokenKind::DoubleRightBracket : TokenKind::RightBracket;
    if (close.kind != wanted) {
        fail(ParseErrorKind::UnclosedTableHeader, Span(open.span.start, close.span.end));
    }

    Table& parent = resolve_path(root_, path, array ? PathMode::ArrayHeader : PathMode::TableHeader);
    KeySegment& last = path.back();
    Value* existing = parent.find(last.name.view());

    if (!array) {
        if (!existing) {
            Table table;
            table.origin_ = Table::Origin::Header;
            table.depth_ = nested_depth(parent.depth_ + 1, last.span);
            current_ = parent.insert(std::move(last.name), Value(std::move(table))).as_table_mut();
            return;
        }
        Table* table = existing->as_table_mut();
        if (!table || table->origin_ != Table::Origin::Implicit) {
            fail(ParseErrorKind::DuplicateKey, last.span);
        }
        table->origin_ = Table::Origin::Header;
        current_ = table;
        return;
    }

    // The array itself is one level, its tables the next.
    Table element;
    element.origin_ = Table::Origin::Header;
    element.depth_ = nested_depth(parent.depth_ + 2, last.span);
    if (!existing) {
        Array tables;
        tables.push_back(Value(std::move(element)));
        Value value(std::move(tables));
        value.table_array_ = true;
        existing = &parent.insert(std::move(last.name), std::move(value));
    } else if (existing->is_array_of_tables()) {
        existing->as_array_mut()->push_back(Value(std::move(element)));
    } else {
        fail(ParseErrorKind::DuplicateKey, last.span);
    }
    current_ = existing->as_array_mut()->back().as_table_mut();
}

// Walks every segment but the last, creating missing tables, and returns
// the table that will receive the last segment.
Table& Parser::resolve_path(Table& base, const KeyPath& path, PathMode mode) {
    Table* table = &base;
    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        const KeySegment& segment = path[i];
        Value* value = table->find(segment.name.view());

        if (!value) {
            Table child;
            child.origin_ = mode == PathMode::DottedKey ? Table::Origin::Dotted : Table::Origin::Implicit;
            child.depth_ = nested_depth(table->depth_ + 1, segment.span);
            value = &table->insert(segment.name, Value(std::move(child)));
            table = value->as_table_mut();
            continue;
        }

        if (Table* child = value->as_table_mut()) {
            if (child->origin_ == Table::Origin::Inline) {
                fail(ParseErrorKind::DuplicateKey, segment.span);
            }
            // Dotted keys may only extend tables other dotted keys created.
            if (mode == PathMode::DottedKey && child->origin_ != Table::Origin::Dotted) {
                fail(ParseErrorKind::DuplicateKey, segment.span);
            }
            table = child;
            continue;
        }

        if (mode != PathMode::DottedKey && value->is_array_of_tables()) {
            table = value->as_array_mut()->back().as_table_mut();
            continue;
        }

        fail(ParseErrorKind::DuplicateKey, segment.span);
    }
    return *table;
}

// ============================================================================
// Key/value pairs and values
// ============================================================================

void Parser::parse_key_value(Table& target) {
    KeyPath path = parse_key();

    const Token equals = lexer_.next(LexMode::Key);
    if (equals.kind != TokenKind::Equals) {
        fail(ParseErrorKind::ExpectedEquals, equals.span);
    }

    // Each dotted segment before the last opens one more table.
    const std::size_t depth = target.depth_ + path.size() - 1;
    Value value = parse_value(lexer_.next(LexMode::Value), depth);

    Table& parent = resolve_path(target, path, PathMode::DottedKey);
    KeySegment& last = path.back();
    if (parent.find(last.name.view())) {
        fail(ParseErrorKind::DuplicateKey, last.span);
    }
    parent.insert(std::move(last.name), std::move(value));
}

Value Parser::parse_value(const Token& token, std::size_t depth) {
    switch (token.kind) {
        case TokenKind::BasicString:
        case TokenKind::LiteralString:
        case TokenKind::MultilineBasicString:
        case TokenKind::MultilineLiteralString:
            return Value(decode_string(source_, token));
        case TokenKind::Integer:
            return Value(decode_integer(source_, token));
        case TokenKind::Float:
            return Value(decode_float(source_, token));
        case TokenKind::Boolean:
            return Value(token.span.text(source_) == "true");
        case TokenKind::DateTime:
            return Value(decode_datetime(source_, token));
        case TokenKind::LeftBracket:
            return parse_array(token, depth + 1);
        case TokenKind::LeftBrace:
            return parse_inline_table(token, depth + 1);
        default:
            fail(ParseErrorKind::ExpectedValue, token.span);
    }
}

Value Parser::parse_array(const Token& open, std::size_t depth) {
    nested_depth(depth, open.span);

    // Line endings (and so comments) may appear anywhere between elements.
    auto next_significant = [this]() {
        Token token = lexer_.next(LexMode::Value);
        while (token.kind == TokenKind::Newline) {
            token = lexer_.next(LexMode::Value);
        }
        return token;
    };

    Array items;
    while (true) {
        Token token = next_significant();
        if (token.kind == TokenKind::RightBracket) break;
        if (token.kind == TokenKind::EndOfInput) {
            fail(ParseErrorKind::UnclosedArray, Span(open.span.start, token.span.end));
        }
        items.push_back(parse_value(token, depth));

        token = next_significant();
        if (token.kind == TokenKind::RightBracket) break;
        if (token.kind == TokenKind::EndOfInput) {
            fail(ParseErrorKind::UnclosedArray, Span(open.span.start, token.span.end));
        }
        if (token.kind != TokenKind::Comma) {
            fail(ParseErrorKind::ExpectedComma, token.span);
        }
    }
    return Value(std::move(items));
}

Value Parser::parse_inline_table(const Token& open, std::size_t depth) {
    Table table;
    table.depth_ = nested_depth(depth, open.span);
    const Token first = lexer_.peek(LexMode::Key);
    if (first.kind == TokenKind::RightBrace) {
        lexer_.next(LexMode::Key);
    } else {
        while (true) {
            const Token key = lexer_.peek(LexMode::Key);
            if (key.kind == TokenKind::Newline || key.kind == TokenKind::EndOfInput) {
                fail(ParseErrorKind::UnclosedInlineTable, Span(open.span.start, key.span.start));
            }
            parse_key_value(table);

            const Token token = lexer_.next(LexMode::Key);
            if (token.kind == TokenKind::RightBrace) break;
            if (token.kind == TokenKind::Newline || token.kind == TokenKind::EndOfInput) {
                fail(ParseErrorKind::UnclosedInlineTable, Span(open.span.start, token.span.start));
            }
            if (token.kind != TokenKind::Comma) {
                fail(ParseErrorKind::ExpectedComma, token.span);
            }
        }
    }

    table.origin_ = Table::Origin::Inline;
    return Value(std::move(table));
}

// ============================================================================
// Entry points
// ============================================================================

Document parse(std::string_view source) {
    Parser parser(source);
    return parser.parse();
}

Document parse(const char* source) {
    return parse(std::string_view(source));
}

} // namespace boml
