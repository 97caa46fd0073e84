/**
 * @file Table.cpp
 * @brief Ordered key/value storage and typed accessors
 */

#include "boml/Table.hpp"
#include "boml/Errors.hpp"
#include "boml/Value.hpp"

#include <string>
#include <utility>

namespace boml {

Table::Table() = default;
Table::~Table() = default;

Table::Table(const Table& other)
    : entries_(other.entries_)
    , origin_(other.origin_)
    , depth_(other.depth_)
{
    rebuild_index();
}

Table::Table(Table&& other) noexcept
    : entries_(std::move(other.entries_))
    , index_(std::move(other.index_))
    , origin_(other.origin_)
    , depth_(other.depth_)
{
    other.entries_.clear();
    other.index_.clear();
}

Table& Table::operator=(const Table& other) {
    if (this != &other) {
        entries_ = other.entries_;
        origin_ = other.origin_;
        depth_ = other.depth_;
        rebuild_index();
    }
    return *this;
}

Table& Table::operator=(Table&& other) noexcept {
    if (this != &other) {
        entries_ = std::move(other.entries_);
        index_ = std::move(other.index_);
        origin_ = other.origin_;
        depth_ = other.depth_;
        other.entries_.clear();
        other.index_.clear();
    }
    return *this;
}

// Index keys view into the entries' TomlStrings, whose text never moves
// (borrowed from the source, or heap-owned), so only a copy needs this.
void Table::rebuild_index() {
    index_.clear();
    index_.reserve(entries_.size());
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        index_.emplace(entries_[i].key.view(), i);
    }
}

// ============================================================================
// Lookup
// ============================================================================

const Value* Table::get(std::string_view key) const noexcept {
    auto it = index_.find(key);
    if (it == index_.end()) return nullptr;
    return &entries_[it->second].value;
}

Value* Table::find(std::string_view key) noexcept {
    auto it = index_.find(key);
    if (it == index_.end()) return nullptr;
    return &entries_[it->second].value;
}

bool Table::contains(std::string_view key) const noexcept {
    return index_.count(key) != 0;
}

std::size_t Table::size() const noexcept {
    return entries_.size();
}

bool Table::empty() const noexcept {
    return entries_.empty();
}

Table::const_iterator Table::begin() const noexcept {
    return entries_.data();
}

Table::const_iterator Table::end() const noexcept {
    return entries_.data() + entries_.size();
}

Value& Table::insert(TomlString key, Value value) {
    const std::size_t slot = entries_.size();
    entries_.push_back(TableEntry{std::move(key), std::move(value)});
    index_.emplace(entries_.back().key.view(), slot);
    return entries_.back().value;
}

// ============================================================================
// Typed accessors
// ============================================================================

const Value& Table::require(std::string_view key, ValueKind expected) const {
    const Value* value = get(key);
    if (!value) {
        throw InvalidKey(std::string(key));
    }
    if (value->kind() != expected) {
        throw TypeMismatch(*value, expected);
    }
    return *value;
}

std::string_view Table::get_string(std::string_view key) const {
    return require(key, ValueKind::String).as_toml_string()->view();
}

std::int64_t Table::get_integer(std::string_view key) const {
    return *require(key, ValueKind::Integer).as_integer();
}

double Table::get_float(std::string_view key) const {
    return *require(key, ValueKind::Float).as_float();
}

bool Table::get_boolean(std::string_view key) const {
    return *require(key, ValueKind::Boolean).as_boolean();
}

const Array& Table::get_array(std::string_view key) const {
    return *require(key, ValueKind::Array).as_array();
}

const Table& Table::get_table(std::string_view key) const {
    return *require(key, ValueKind::Table).as_table();
}

const DateTime& Table::get_datetime(std::string_view key) const {
    const Value* value = get(key);
    if (!value) {
        throw InvalidKey(std::string(key));
    }
    const DateTime* dt = value->as_datetime();
    if (!dt) {
        throw TypeMismatch(*value, ValueKind::OffsetDateTime);
    }
    return *dt;
}

// ============================================================================
// Comparison
// ============================================================================

bool operator==(const Table& a, const Table& b) {
    if (a.size() != b.size()) return false;
    for (const auto& entry : a) {
        const Value* other = b.get(entry.key.view());
        if (!other || *other != entry.value) return false;
    }
    return true;
}

bool operator!=(const Table& a, const Table& b) {
    return !(a == b);
}

} // namespace boml
