/**
 * @file TomlString.hpp
 * @brief Borrow-or-own string used for TOML keys and string values
 *
 * Literal strings and basic strings without escapes are stored as a view
 * into the source buffer. Basic strings that contain at least one escape
 * are decoded into an owned buffer. Either way the string behaves like a
 * std::string_view.
 *
 * The owned buffer lives on the heap, so its address is stable when the
 * TomlString is moved; views handed out (and table indexes keyed on them)
 * stay valid for the lifetime of the owning tree.
 */

#ifndef BOML_TOMLSTRING_HPP
#define BOML_TOMLSTRING_HPP

#include "boml/Span.hpp"

#include <memory>
#include <ostream>
#include <string>
#include <string_view>

namespace boml {

class TomlString {
public:
    TomlString() noexcept = default;

    /**
     * @brief Make a string that aliases the source buffer
     * @param text Slice of the source
     * @param span Where @p text sits in the source
     */
    static TomlString borrowed(std::string_view text, Span span) noexcept;

    /**
     * @brief Make a string that owns decoded text
     * @param text Decoded contents
     * @param span Where the undecoded text sits in the source
     */
    static TomlString owned(std::string text, Span span);

    TomlString(const TomlString& other);
    TomlString& operator=(const TomlString& other);
    TomlString(TomlString&& other) noexcept;
    TomlString& operator=(TomlString&& other) noexcept;
    ~TomlString() = default;

    std::string_view view() const noexcept { return view_; }
    operator std::string_view() const noexcept { return view_; }

    std::string str() const { return std::string(view_); }

    const char* data() const noexcept { return view_.data(); }
    std::size_t size() const noexcept { return view_.size(); }
    bool empty() const noexcept { return view_.empty(); }

    /**
     * @brief True when the contents alias the source buffer
     */
    bool is_borrowed() const noexcept { return owned_ == nullptr; }

    /**
     * @brief Span of the undecoded text
     */
    const Span& span() const noexcept { return span_; }

private:
    std::string_view view_;
    std::unique_ptr<std::string> owned_;
    Span span_;
};

inline bool operator==(const TomlString& a, const TomlString& b) noexcept {
    return a.view() == b.view();
}
inline bool operator!=(const TomlString& a, const TomlString& b) noexcept {
    return a.view() != b.view();
}
inline bool operator==(const TomlString& a, std::string_view b) noexcept {
    return a.view() == b;
}
inline bool operator==(std::string_view a, const TomlString& b) noexcept {
    return a == b.view();
}
inline bool operator!=(const TomlString& a, std::string_view b) noexcept {
    return a.view() != b;
}
inline bool operator!=(std::string_view a, const TomlString& b) noexcept {
    return a != b.view();
}
inline bool operator==(const TomlString& a, const char* b) noexcept {
    return a.view() == std::string_view(b);
}
inline bool operator!=(const TomlString& a, const char* b) noexcept {
    return a.view() != std::string_view(b);
}

inline std::ostream& operator<<(std::ostream& os, const TomlString& s) {
    return os << s.view();
}

} // namespace boml

#endif // BOML_TOMLSTRING_HPP
