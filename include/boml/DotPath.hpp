/**
 * @file DotPath.hpp
 * @brief Dot-notation lookups across nested tables and arrays
 *
 * A path like "servers.0.ip" walks tables by key and arrays by index.
 * Path segments are split on every '.', so keys that themselves contain a
 * dot cannot be addressed this way; use Table::get for those.
 *
 * Rules:
 * - find_by_dot returns nullptr when a segment is absent
 * - get_by_dot throws InvalidKey (with the full path) when a segment is absent
 * - both throw TypeMismatch when a segment would have to look inside a
 *   string, number, boolean or date/time
 */

#ifndef BOML_DOTPATH_HPP
#define BOML_DOTPATH_HPP

#include "boml/Errors.hpp"
#include "boml/Table.hpp"
#include "boml/Value.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace boml {

/**
 * @brief Split a dot-path into segments
 *
 * Segments view into @p path. Empty segments (leading, trailing or doubled
 * dots) are dropped.
 *
 * Examples:
 * - "package.name" → ["package", "name"]
 * - "servers.0.ip" → ["servers", "0", "ip"]
 * - "" → []
 */
std::vector<std::string_view> split_dot_path(std::string_view path);

/**
 * @brief Resolve a dot-path, or nullptr when any segment is absent
 *
 * An empty path resolves to nothing.
 *
 * @throws TypeMismatch if traversal hits a scalar before the last segment
 */
const Value* find_by_dot(const Table& root, std::string_view path);

/**
 * @brief Resolve a dot-path that must exist
 *
 * @throws InvalidKey naming @p path if any segment is absent
 * @throws TypeMismatch if traversal hits a scalar before the last segment
 */
const Value& get_by_dot(const Table& root, std::string_view path);

/**
 * @brief True when @p path resolves
 * @throws TypeMismatch as for find_by_dot
 */
bool contains_dot(const Table& root, std::string_view path);

} // namespace boml

#endif // BOML_DOTPATH_HPP
