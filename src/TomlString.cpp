/**
 * @file TomlString.cpp
 * @brief Borrowed and owned string storage
 */

#include "boml/TomlString.hpp"

#include <utility>

namespace boml {

TomlString TomlString::borrowed(std::string_view text, Span span) noexcept {
    TomlString s;
    s.view_ = text;
    s.span_ = span;
    return s;
}

TomlString TomlString::owned(std::string text, Span span) {
    TomlString s;
    s.owned_ = std::make_unique<std::string>(std::move(text));
    s.view_ = *s.owned_;
    s.span_ = span;
    return s;
}

TomlString::TomlString(const TomlString& other)
    : view_(other.view_)
    , span_(other.span_)
{
    if (other.owned_) {
        owned_ = std::make_unique<std::string>(*other.owned_);
        view_ = *owned_;
    }
}

TomlString& TomlString::operator=(const TomlString& other) {
    if (this != &other) {
        TomlString copy(other);
        *this = std::move(copy);
    }
    return *this;
}

TomlString::TomlString(TomlString&& other) noexcept
    : view_(other.view_)
    , owned_(std::move(other.owned_))
    , span_(other.span_)
{
    other.view_ = {};
}

TomlString& TomlString::operator=(TomlString&& other) noexcept {
    if (this != &other) {
        view_ = other.view_;
        owned_ = std::move(other.owned_);
        span_ = other.span_;
        other.view_ = {};
    }
    return *this;
}

} // namespace boml
