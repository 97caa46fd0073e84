/**
 * @file DotPath.cpp
 * @brief Implementation of dot-path lookups
 */

#include "boml/DotPath.hpp"

#include <charconv>
#include <system_error>

namespace boml {

std::vector<std::string_view> split_dot_path(std::string_view path) {
    std::vector<std::string_view> segments;
    std::size_t start = 0;
    while (start <= path.size()) {
        std::size_t stop = path.find('.', start);
        if (stop == std::string_view::npos) stop = path.size();
        if (stop > start) {
            segments.push_back(path.substr(start, stop - start));
        }
        start = stop + 1;
    }
    return segments;
}

namespace {
    // Decimal index without sign or leading zeros; npos otherwise.
    std::size_t array_index(std::string_view segment) {
        if (segment.empty() || (segment[0] == '0' && segment.size() > 1)) {
            return std::string_view::npos;
        }
        std::size_t index = 0;
        const char* end = segment.data() + segment.size();
        const auto [ptr, ec] = std::from_chars(segment.data(), end, index);
        if (ec != std::errc() || ptr != end) {
            return std::string_view::npos;
        }
        return index;
    }

    // One lookup below @p current; @p walked is the path that led to it.
    const Value* step(const Value& current, std::string_view segment, std::string_view walked) {
        if (const Table* table = current.as_table()) {
            return table->get(segment);
        }
        if (const Array* array = current.as_array()) {
            const std::size_t index = array_index(segment);
            return index < array->size() ? &(*array)[index] : nullptr;
        }
        throw TypeMismatch(current, ValueKind::Table,
                           "cannot look up '" + std::string(segment) + "' inside '"
                               + std::string(walked) + "'");
    }
}

const Value* find_by_dot(const Table& root, std::string_view path) {
    const auto segments = split_dot_path(path);
    if (segments.empty()) {
        return nullptr;
    }

    const Value* current = root.get(segments[0]);
    for (std::size_t i = 1; i < segments.size() && current; ++i) {
        // Segments view into path, so the walked prefix is a slice of it.
        const auto& previous = segments[i - 1];
        const std::size_t walked = static_cast<std::size_t>(previous.data() - path.data())
                                   + previous.size();
        current = step(*current, segments[i], path.substr(0, walked));
    }

    return current;
}

const Value& get_by_dot(const Table& root, std::string_view path) {
    const Value* value = find_by_dot(root, path);
    if (!value) {
        throw InvalidKey(std::string(path));
    }
    return *value;
}

bool contains_dot(const Table& root, std::string_view path) {
    return find_by_dot(root, path) != nullptr;
}

} // namespace boml
