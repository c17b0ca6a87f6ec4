#include <webless/html/cursor.h>
#include <algorithm>
#include <cstdio>

namespace webless::html {

namespace {

unsigned char to_lower_ascii(unsigned char c) {
    if (c >= 'A' && c <= 'Z') {
        return static_cast<unsigned char>(c + ('a' - 'A'));
    }
    return c;
}

// Length of the UTF-8 sequence led by `lead`, or 0 when `lead` cannot start one.
std::size_t utf8_sequence_length(unsigned char lead) {
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 0;
}

} // namespace

bool is_ascii_alphanumeric(unsigned char c) {
    return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool is_html_whitespace(unsigned char c) {
    return c == ' ' || c == '\n' || c == '\r' || c == '\t' || c == '\f';
}

bool is_control(unsigned char c) {
    if (c == 0x7F) return true;
    return c < 0x20 && !is_html_whitespace(c);
}

bool equals_ignore_ascii_case(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (to_lower_ascii(static_cast<unsigned char>(a[i])) !=
            to_lower_ascii(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::optional<unsigned char> Cursor::peek(std::size_t k) const {
    if (pos_ >= source_.size() || k >= source_.size() - pos_) {
        return std::nullopt;
    }
    return static_cast<unsigned char>(source_[pos_ + k]);
}

bool Cursor::current_is(char c) const {
    auto cur = current();
    return cur && *cur == static_cast<unsigned char>(c);
}

bool Cursor::current_is_alphanumeric() const {
    auto cur = current();
    return cur && is_ascii_alphanumeric(*cur);
}

bool Cursor::current_is_whitespace() const {
    auto cur = current();
    return cur && is_html_whitespace(*cur);
}

bool Cursor::current_is_control() const {
    auto cur = current();
    return cur && is_control(*cur);
}

bool Cursor::next_match(std::string_view literal) const {
    if (literal.size() > remaining()) return false;
    return source_.compare(pos_, literal.size(), literal) == 0;
}

bool Cursor::next_match_ignore_case(std::string_view literal, std::size_t skip) const {
    if (skip > remaining() || literal.size() > remaining() - skip) return false;
    return equals_ignore_ascii_case(source_.substr(pos_ + skip, literal.size()), literal);
}

void Cursor::advance_by(std::size_t n) {
    pos_ += std::min(n, remaining());
}

void Cursor::skip_whitespace() {
    while (current_is_whitespace()) {
        advance();
    }
}

std::string_view Cursor::consume_alphanumeric() {
    std::size_t start = pos_;
    while (current_is_alphanumeric()) {
        advance();
    }
    return slice_from(start);
}

std::string_view Cursor::slice_from(std::size_t start) const {
    if (start >= pos_) return {};
    return source_.substr(start, pos_ - start);
}

std::string Cursor::describe_current() const {
    auto cur = current();
    if (!cur) {
        return "[document end]";
    }
    if (is_control(*cur)) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "[control character 0x%02x]", static_cast<unsigned>(*cur));
        return buf;
    }
    if (*cur < 0x80) {
        return std::string(1, static_cast<char>(*cur));
    }

    // Non-ASCII: the whole character when the sequence is complete, the raw byte otherwise.
    std::size_t length = utf8_sequence_length(*cur);
    bool complete = length != 0 && length <= remaining();
    for (std::size_t i = 1; complete && i < length; ++i) {
        auto next = static_cast<unsigned char>(source_[pos_ + i]);
        complete = next >= 0x80 && next <= 0xBF;
    }
    if (complete) {
        return std::string(source_.substr(pos_, length));
    }
    char buf[16];
    std::snprintf(buf, sizeof(buf), "[byte 0x%02x]", static_cast<unsigned>(*cur));
    return buf;
}

bool Cursor::expect(char expected, std::string_view what, std::string& message) const {
    if (current_is(expected)) {
        return true;
    }
    message = "Expected ";
    message += what;
    message += " '";
    message += expected;
    message += "', found '";
    message += describe_current();
    message += "'";
    return false;
}

} // namespace webless::html
