/**
 * @file Table.hpp
 * @brief Ordered key/value mapping produced by the parser
 *
 * A Table is both the root of a parsed document and the value type of every
 * [table], [[array]] element, inline table and dotted-key intermediate.
 * Keys are unique; iteration follows insertion order. The public interface
 * is read-only: tables are filled by the parser and immutable afterwards.
 */

#ifndef BOML_TABLE_HPP
#define BOML_TABLE_HPP

#include "boml/TomlString.hpp"
#include "boml/ValueKind.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace boml {

class Value;
class Parser;
struct TableEntry;
struct DateTime;

/// Ordered sequence of values; TOML arrays may mix kinds.
using Array = std::vector<Value>;

class Table {
public:
    using Entry = TableEntry;
    using const_iterator = const TableEntry*;

    Table();
    Table(const Table& other);
    Table(Table&& other) noexcept;
    Table& operator=(const Table& other);
    Table& operator=(Table&& other) noexcept;
    ~Table();

    /**
     * @brief Single-level lookup
     * @param key Key text (already unquoted/decoded)
     * @return Pointer to the value, or nullptr when the key is absent
     */
    const Value* get(std::string_view key) const noexcept;

    bool contains(std::string_view key) const noexcept;

    std::size_t size() const noexcept;
    bool empty() const noexcept;

    const_iterator begin() const noexcept;
    const_iterator end() const noexcept;

    // ------------------------------------------------------------------------
    // Typed accessors
    //
    // Each throws InvalidKey when the key is absent and TypeMismatch when the
    // stored value is of another kind. Returned references point into this
    // table.
    // ------------------------------------------------------------------------

    std::string_view get_string(std::string_view key) const;
    std::int64_t get_integer(std::string_view key) const;
    double get_float(std::string_view key) const;
    bool get_boolean(std::string_view key) const;
    const Array& get_array(std::string_view key) const;
    const Table& get_table(std::string_view key) const;

    /**
     * @brief Get a date/time placeholder of any of the four date/time kinds
     *
     * TypeMismatch reports ValueKind::OffsetDateTime as the expected kind
     * when the value is not a date/time at all.
     */
    const DateTime& get_datetime(std::string_view key) const;

private:
    friend class Parser;

    // How the parser brought this table into existence; governs which later
    // definitions may reopen it.
    enum class Origin : std::uint8_t {
        Implicit,   // intermediate of a [a.b] header, may still be defined once
        Header,     // defined by a [header] or [[header]]
        Dotted,     // created by a dotted key
        Inline,     // { ... }, sealed
    };

    Value* find(std::string_view key) noexcept;
    Value& insert(TomlString key, Value value);
    const Value& require(std::string_view key, ValueKind expected) const;
    void rebuild_index();

    std::vector<TableEntry> entries_;
    std::unordered_map<std::string_view, std::size_t> index_;
    Origin origin_ = Origin::Implicit;
    // Containers between the root and this table; root is 0.
    std::size_t depth_ = 0;
};

/**
 * @brief Key-wise equality; entry order is not significant
 */
bool operator==(const Table& a, const Table& b);
bool operator!=(const Table& a, const Table& b);

} // namespace boml

#endif // BOML_TABLE_HPP
