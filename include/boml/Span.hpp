/**
 * @file Span.hpp
 * @brief Byte-offset ranges into a TOML source buffer
 *
 * Every token, error and string value remembers where it came from as a
 * half-open [start, end) pair of byte offsets. Spans never own or modify the
 * text; they are resolved against the source buffer on demand.
 */

#ifndef BOML_SPAN_HPP
#define BOML_SPAN_HPP

#include <cstddef>
#include <string_view>

namespace boml {

/**
 * @brief Half-open byte range [start, end) into the parsed source
 */
struct Span {
    std::size_t start = 0;
    std::size_t end = 0;

    constexpr Span() noexcept = default;
    constexpr Span(std::size_t s, std::size_t e) noexcept : start(s), end(e) {}

    /**
     * @brief Number of bytes covered
     */
    constexpr std::size_t size() const noexcept {
        return end > start ? end - start : 0;
    }

    constexpr bool empty() const noexcept { return size() == 0; }

    /**
     * @brief Resolve the span against its source
     *
     * Offsets past the end of @p source are clamped, so a span produced for
     * "end of input" resolves to an empty view instead of reading past the
     * buffer.
     */
    std::string_view text(std::string_view source) const noexcept {
        if (start >= source.size()) return {};
        return source.substr(start, size());
    }
};

inline constexpr bool operator==(const Span& a, const Span& b) noexcept {
    return a.start == b.start && a.end == b.end;
}

inline constexpr bool operator!=(const Span& a, const Span& b) noexcept {
    return !(a == b);
}

} // namespace boml

#endif // BOML_SPAN_HPP
