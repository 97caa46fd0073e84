/**
 * @file Parser.hpp
 * @brief Recursive-descent TOML parser and the parse() entry points
 *
 * Usage:
 * ```cpp
 * std::string text = read_file("Cargo.toml");
 * boml::Document doc = boml::parse(text);
 * auto name = doc.get_table("package").get_string("name");
 * ```
 *
 * The returned Document borrows from @c text: keep the buffer alive (and
 * unmodified) for as long as the document is used. Passing a temporary
 * std::string does not compile for that reason.
 */

#ifndef BOML_PARSER_HPP
#define BOML_PARSER_HPP

#include "boml/Lexer.hpp"
#include "boml/Table.hpp"
#include "boml/TomlString.hpp"
#include "boml/Value.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace boml {

/**
 * @brief Root table of a parsed source, plus the source it borrows from
 */
class Document : public Table {
public:
    /**
     * @brief The text this document was parsed from
     */
    std::string_view source() const noexcept { return source_; }

private:
    friend class Parser;

    Document(std::string_view source, Table root)
        : Table(std::move(root))
        , source_(source)
    {}

    std::string_view source_;
};

class Parser {
public:
    /// Deepest allowed nesting of tables and arrays, counted from the root.
    static constexpr std::size_t kMaxDepth = 256;

    explicit Parser(std::string_view source) noexcept;

    /**
     * @brief Parse the whole source
     *
     * A Parser is single-use.
     *
     * @throws ParseError at the first malformed construct
     */
    Document parse();

private:
    struct KeySegment {
        TomlString name;
        Span span;
    };
    using KeyPath = std::vector<KeySegment>;

    // What a key path is being resolved for; decides which existing
    // tables may be walked through and what the last segment may hit.
    enum class PathMode {
        DottedKey,
        TableHeader,
        ArrayHeader,
    };

    void parse_header(const Token& open);
    void parse_key_value(Table& target);
    KeyPath parse_key();
    Value parse_value(const Token& token, std::size_t depth);
    Value parse_array(const Token& open, std::size_t depth);
    Value parse_inline_table(const Token& open, std::size_t depth);

    Table& resolve_path(Table& base, const KeyPath& path, PathMode mode);

    [[noreturn]] void fail(ParseErrorKind kind, Span span) const;
    std::size_t nested_depth(std::size_t depth, Span span) const;

    std::string_view source_;
    Lexer lexer_;
    Table root_;
    Table* current_;
};

/**
 * @brief Parse TOML text into a Document
 *
 * @param source UTF-8 TOML text; must outlive the returned Document
 * @throws ParseError on the first error (nothing partial is returned)
 */
Document parse(std::string_view source);

/**
 * @brief Parse a NUL-terminated TOML string
 */
Document parse(const char* source);

// The document would borrow from a temporary.
Document parse(std::string&& source) = delete;

} // namespace boml

#endif // BOML_PARSER_HPP
