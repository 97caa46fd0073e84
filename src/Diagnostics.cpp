/**
 * @file Diagnostics.cpp
 * @brief Line/column resolution and error excerpts
 */

#include "boml/Diagnostics.hpp"

#include <algorithm>
#include <sstream>
#include <string>

namespace boml {

namespace {

struct Line {
    std::size_t number;
    std::size_t start;
    std::size_t end;   // excludes the line ending
};

Line line_at(std::string_view source, std::size_t offset) {
    offset = std::min(offset, source.size());
    const std::size_t before = offset == 0 ? std::string_view::npos : source.rfind('\n', offset - 1);
    const std::size_t start = before == std::string_view::npos ? 0 : before + 1;
    std::size_t end = source.find('\n', offset);
    if (end == std::string_view::npos) end = source.size();
    if (end > start && source[end - 1] == '\r') --end;
    return Line{locate(source, offset).line, start, end};
}

void print_line(std::ostringstream& oss, std::string_view source, const Line& line, int width) {
    oss.width(width + 2);
    oss << line.number;
    oss << " | " << source.substr(line.start, line.end - line.start) << '\n';
}

} // namespace

SourceLocation locate(std::string_view source, std::size_t offset) noexcept {
    SourceLocation loc;
    const std::size_t limit = std::min(offset, source.size());
    for (std::size_t i = 0; i < limit; ++i) {
        if (source[i] == '\n') {
            ++loc.line;
            loc.column = 1;
        } else {
            ++loc.column;
        }
    }
    return loc;
}

std::string describe(std::string_view source, const ParseError& error) {
    const Span& span = error.span();
    const SourceLocation loc = locate(source, span.start);

    std::ostringstream oss;
    oss << to_string(error.kind()) << " at line " << loc.line << ", column " << loc.column;

    std::string_view text = span.text(source);
    text = text.substr(0, text.find('\n'));
    if (!text.empty()) {
        oss << ": '" << text << "'";
    }
    oss << '\n';

    const Line current = line_at(source, span.start);
    const int width = static_cast<int>(std::to_string(current.number + 1).size());

    if (current.start > 0) {
        print_line(oss, source, line_at(source, current.start - 1), width);
    }
    print_line(oss, source, current, width);

    const std::size_t column = std::min(span.start, current.end) - current.start;
    const std::size_t stop = std::min(span.end, current.end);
    const std::size_t marks = stop > span.start ? stop - span.start : 1;
    oss << std::string(static_cast<std::size_t>(width) + 2, ' ') << " | "
        << std::string(column, ' ') << std::string(marks, '^') << '\n';

    std::size_t next = source.find('\n', current.end);
    if (next != std::string_view::npos && next + 1 < source.size()) {
        print_line(oss, source, line_at(source, next + 1), width);
    }

    return oss.str();
}

} // namespace boml
