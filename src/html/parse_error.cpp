#include <webless/html/parse_error.h>
#include <algorithm>
#include <sstream>

namespace webless::html {

SourceLocation locate(std::string_view source, std::size_t offset) {
    offset = std::min(offset, source.size());

    SourceLocation loc;
    std::size_t line_start = 0;
    for (std::size_t i = 0; i < offset; ++i) {
        if (source[i] == '\n') {
            ++loc.line;
            line_start = i + 1;
        }
    }
    loc.column = offset - line_start + 1;
    return loc;
}

ParseError::ParseError(std::string message, std::string_view source, std::size_t offset)
    : message_(std::move(message)),
      offset_(std::min(offset, source.size())),
      location_(locate(source, offset)) {}

std::string ParseError::to_string() const {
    std::ostringstream oss;
    oss << "[" << location_.line << ":" << location_.column << "] " << message_;
    return oss.str();
}

std::string ParseError::excerpt(std::string_view source) const {
    std::size_t offset = std::min(offset_, source.size());
    std::size_t line_start = offset - std::min(offset, location_.column - 1);
    std::size_t line_end = source.find('\n', offset);
    if (line_end == std::string_view::npos) {
        line_end = source.size();
    }

    std::string out(source.substr(line_start, line_end - line_start));
    if (!out.empty() && out.back() == '\r') {
        out.pop_back();
    }
    out += '\n';
    for (std::size_t i = line_start; i < offset; ++i) {
        out += source[i] == '\t' ? '\t' : ' ';
    }
    out += '^';
    return out;
}

std::ostream& operator<<(std::ostream& os, const ParseError& error) {
    return os << error.to_string();
}

} // namespace webless::html
