#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace webless::html {

// ASCII 0-9, A-Z, a-z.
bool is_ascii_alphanumeric(unsigned char c);
// Space, \n, \r, \t and form feed.
bool is_html_whitespace(unsigned char c);
// C0 controls other than whitespace, plus DEL.
bool is_control(unsigned char c);

bool equals_ignore_ascii_case(std::string_view a, std::string_view b);

// Read position over a source buffer the cursor does not own.
// The offset only ever moves forward.
class Cursor {
public:
    explicit Cursor(std::string_view source) : source_(source) {}

    std::string_view source() const { return source_; }
    std::size_t offset() const { return pos_; }
    std::size_t remaining() const { return at_end() ? 0 : source_.size() - pos_; }

    bool at_end() const { return pos_ >= source_.size(); }
    std::optional<unsigned char> current() const { return peek(0); }
    std::optional<unsigned char> peek(std::size_t k) const;

    bool current_is(char c) const;
    bool current_is_alphanumeric() const;
    bool current_is_whitespace() const;
    bool current_is_control() const;

    bool next_match(std::string_view literal) const;
    // Compares `literal` against the input starting `skip` bytes ahead,
    // ignoring ASCII case.
    bool next_match_ignore_case(std::string_view literal, std::size_t skip = 0) const;

    void advance() { advance_by(1); }
    void advance_by(std::size_t n);
    void skip_whitespace();

    // Consumes a run of alphanumerics and returns it; empty if none.
    std::string_view consume_alphanumeric();
    std::string_view slice_from(std::size_t start) const;

    // Current character for error messages. A multi-byte UTF-8 character is
    // returned whole; a malformed or truncated sequence as "[byte 0xNN]".
    std::string describe_current() const;

    // Fills `message` and returns false when the current byte is not `expected`.
    bool expect(char expected, std::string_view what, std::string& message) const;

private:
    std::string_view source_;
    std::size_t pos_ = 0;
};

} // namespace webless::html
