/**
 * @file Convert.hpp
 * @brief Extract parsed values into ordinary C++ types
 *
 * Supported targets:
 * - bool, integral types (range-checked), float/double
 * - std::string (copied), std::string_view (borrowed from the document)
 * - std::vector<T>, std::optional<T>, std::map<std::string, T>
 * - any type with a static `T from_toml(const boml::Table&)` member
 *
 * ```cpp
 * struct Server {
 *     std::string ip;
 *     std::optional<std::int64_t> port;
 *     static Server from_toml(const boml::Table& t) {
 *         return {boml::get_as<std::string>(t, "ip"),
 *                 boml::get_as<std::optional<std::int64_t>>(t, "port")};
 *     }
 * };
 * auto servers = boml::get_as<std::vector<Server>>(doc, "servers");
 * ```
 *
 * Failures use the accessor errors: InvalidKey for absent keys,
 * TypeMismatch for values of the wrong kind or out of range.
 */

#ifndef BOML_CONVERT_HPP
#define BOML_CONVERT_HPP

#include "boml/Errors.hpp"
#include "boml/Table.hpp"
#include "boml/Value.hpp"

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace boml {

namespace detail {

template <typename T>
struct always_false : std::false_type {};

template <typename T>
struct is_vector : std::false_type {};
template <typename T, typename A>
struct is_vector<std::vector<T, A>> : std::true_type {};

template <typename T>
struct is_optional : std::false_type {};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template <typename T>
struct is_string_map : std::false_type {};
template <typename T, typename C, typename A>
struct is_string_map<std::map<std::string, T, C, A>> : std::true_type {};

template <typename T, typename = void>
struct has_from_toml : std::false_type {};
template <typename T>
struct has_from_toml<T, std::void_t<decltype(T::from_toml(std::declval<const Table&>()))>>
    : std::true_type {};

} // namespace detail

/**
 * @brief Convert a present value to @p T
 * @throws TypeMismatch when the value cannot represent a @p T
 */
template <typename T>
T from_toml(const Value& value) {
    if constexpr (std::is_same_v<T, bool>) {
        if (auto b = value.as_boolean()) return *b;
        throw TypeMismatch(value, ValueKind::Boolean);
    } else if constexpr (std::is_integral_v<T>) {
        auto i = value.as_integer();
        if (!i) throw TypeMismatch(value, ValueKind::Integer);
        if constexpr (std::is_signed_v<T>) {
            if (*i < static_cast<std::int64_t>(std::numeric_limits<T>::min())
                || *i > static_cast<std::int64_t>(std::numeric_limits<T>::max())) {
                throw TypeMismatch(value, ValueKind::Integer, "out of range for target type");
            }
        } else {
            if (*i < 0 || static_cast<std::uint64_t>(*i) > std::numeric_limits<T>::max()) {
                throw TypeMismatch(value, ValueKind::Integer, "out of range for target type");
            }
        }
        return static_cast<T>(*i);
    } else if constexpr (std::is_floating_point_v<T>) {
        if (auto d = value.as_float()) return static_cast<T>(*d);
        throw TypeMismatch(value, ValueKind::Float);
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (auto s = value.as_string()) return std::string(*s);
        throw TypeMismatch(value, ValueKind::String);
    } else if constexpr (std::is_same_v<T, std::string_view>) {
        if (auto s = value.as_string()) return *s;
        throw TypeMismatch(value, ValueKind::String);
    } else if constexpr (detail::is_optional<T>::value) {
        return T(from_toml<typename T::value_type>(value));
    } else if constexpr (detail::is_vector<T>::value) {
        const Array* array = value.as_array();
        if (!array) throw TypeMismatch(value, ValueKind::Array);
        T out;
        out.reserve(array->size());
        for (const auto& element : *array) {
            out.push_back(from_toml<typename T::value_type>(element));
        }
        return out;
    } else if constexpr (detail::is_string_map<T>::value) {
        const Table* table = value.as_table();
        if (!table) throw TypeMismatch(value, ValueKind::Table);
        T out;
        for (const auto& entry : *table) {
            out.emplace(entry.key.str(), from_toml<typename T::mapped_type>(entry.value));
        }
        return out;
    } else if constexpr (detail::has_from_toml<T>::value) {
        const Table* table = value.as_table();
        if (!table) throw TypeMismatch(value, ValueKind::Table);
        return T::from_toml(*table);
    } else {
        static_assert(detail::always_false<T>::value, "no TOML conversion for this type");
    }
}

/**
 * @brief Convert a possibly absent value to @p T
 *
 * An absent value becomes std::nullopt for optional targets and InvalidKey
 * (naming @p key) otherwise.
 */
template <typename T>
T from_toml(const Value* value, std::string_view key = {}) {
    if (value == nullptr) {
        if constexpr (detail::is_optional<T>::value) {
            return std::nullopt;
        } else {
            throw InvalidKey(std::string(key));
        }
    }
    return from_toml<T>(*value);
}

/**
 * @brief Look up @p key in @p table and convert it to @p T
 */
template <typename T>
T get_as(const Table& table, std::string_view key) {
    return from_toml<T>(table.get(key), key);
}

} // namespace boml

#endif // BOML_CONVERT_HPP
