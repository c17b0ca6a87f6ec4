#pragma once
#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace webless::html {

struct SourceLocation {
    std::size_t line = 1;    // 1-based
    std::size_t column = 1;  // 1-based, in bytes
};

// Line/column of a byte offset. Offsets past the end are clamped.
SourceLocation locate(std::string_view source, std::size_t offset);

// First failure of a parse, positioned in the source it came from.
class ParseError {
public:
    ParseError(std::string message, std::string_view source, std::size_t offset);

    const std::string& message() const { return message_; }
    std::size_t offset() const { return offset_; }
    std::size_t line() const { return location_.line; }
    std::size_t column() const { return location_.column; }
    std::pair<std::size_t, std::size_t> line_and_column() const {
        return {location_.line, location_.column};
    }

    // "[line:col] message"
    std::string to_string() const;

    // The source line containing the error followed by a caret line
    // pointing at the column. `source` must be the text that was parsed.
    std::string excerpt(std::string_view source) const;

private:
    std::string message_;
    std::size_t offset_;
    SourceLocation location_;
};

std::ostream& operator<<(std::ostream& os, const ParseError& error);

} // namespace webless::html
