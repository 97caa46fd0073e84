/**
 * @file Json.hpp
 * @brief Export a parsed tree as nlohmann::json
 */

#ifndef BOML_JSON_HPP
#define BOML_JSON_HPP

#include "boml/Table.hpp"
#include "boml/Value.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace boml {

enum class JsonStyle {
    /// Native JSON: numbers, booleans and strings; date/times and
    /// non-finite floats become strings.
    Plain,
    /// toml-test decoder format: every scalar is {"type": ..., "value": ...}
    /// with the value as a string.
    Tagged,
};

nlohmann::json to_json(const Table& table, JsonStyle style = JsonStyle::Plain);
nlohmann::json to_json(const Value& value, JsonStyle style = JsonStyle::Plain);

/**
 * @brief Shortest text that reads back as the same double
 *
 * Non-finite values are spelled "inf", "-inf" and "nan".
 */
std::string format_float(double value);

} // namespace boml

#endif // BOML_JSON_HPP
