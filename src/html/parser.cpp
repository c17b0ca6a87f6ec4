#include <webless/html/parser.h>
#include <webless/core/diagnostics.h>
#include <webless/html/cursor.h>
#include <array>
#include <string>
#include <utility>
#include <vector>

namespace webless::html {

namespace {

// Elements that never have children or a closing tag.
constexpr std::array<std::string_view, 16> kVoidElements = {
    "area", "base", "br", "col", "command", "embed", "hr", "img",
    "input", "keygen", "link", "meta", "param", "source", "track", "wbr",
};

// Elements whose body is captured verbatim up to the matching closing tag.
constexpr std::array<std::string_view, 6> kForeignElements = {
    "script", "style", "title", "textarea", "svg", "math",
};

template <std::size_t N>
bool contains_ignore_ascii_case(const std::array<std::string_view, N>& list, std::string_view name) {
    for (auto entry : list) {
        if (equals_ignore_ascii_case(entry, name)) {
            return true;
        }
    }
    return false;
}

bool ends_attribute_name(unsigned char c) {
    return is_html_whitespace(c) || is_control(c) ||
           c == '"' || c == '\'' || c == '>' || c == '/' || c == '=';
}

bool ends_unquoted_value(unsigned char c) {
    return is_html_whitespace(c) || is_control(c) ||
           c == '"' || c == '\'' || c == '=' || c == '>' || c == '<' || c == '`';
}

// Recursive-descent productions over a single cursor. Each production
// either commits forward and returns a value, or records the first error
// and returns nullopt. Nothing is ever retried.
class Grammar {
public:
    Grammar(std::string_view source, std::size_t max_depth)
        : cursor_(source), max_depth_(max_depth) {}

    std::optional<std::vector<Node>> document();

    const std::string& error_message() const { return error_message_; }
    std::size_t error_offset() const { return error_offset_; }

private:
    std::optional<Node> strict_node();
    std::optional<Node> node();
    std::optional<Node> element();
    std::optional<Attribute> attribute();
    std::optional<Node> text();
    std::optional<Node> foreign_text(std::string_view tag_name);
    std::optional<Node> comment();
    std::optional<Node> doctype_declaration();

    std::optional<std::string_view> tag_name();
    bool expect(char c, std::string_view what);
    std::nullopt_t fail(std::string message);

    Cursor cursor_;
    std::size_t max_depth_;
    std::size_t depth_ = 0;
    std::string error_message_;
    std::size_t error_offset_ = 0;
};

std::nullopt_t Grammar::fail(std::string message) {
    error_message_ = std::move(message);
    error_offset_ = cursor_.offset();
    return std::nullopt;
}

bool Grammar::expect(char c, std::string_view what) {
    std::string message;
    if (cursor_.expect(c, what, message)) {
        return true;
    }
    fail(std::move(message));
    return false;
}

std::optional<std::string_view> Grammar::tag_name() {
    if (!cursor_.current_is_alphanumeric()) {
        return fail("Expected alphanumeric, found '" + cursor_.describe_current() + "'");
    }
    return cursor_.consume_alphanumeric();
}

std::optional<std::vector<Node>> Grammar::document() {
    std::vector<Node> nodes;
    for (;;) {
        cursor_.skip_whitespace();
        if (cursor_.at_end()) {
            break;
        }
        auto node = strict_node();
        if (!node) return std::nullopt;
        nodes.push_back(std::move(*node));
    }
    return nodes;
}

std::optional<Node> Grammar::strict_node() {
    cursor_.skip_whitespace();

    if (!expect('<', "start of a node")) return std::nullopt;

    auto next = cursor_.peek(1);
    if (!next) {
        return fail("Expected something after start of node");
    }
    if (*next == '!') {
        if (cursor_.peek(2) == '-') {
            return comment();
        }
        auto decl = doctype_declaration();
        if (!decl && error_message_.empty()) {
            return fail("Expected doctype declaration or comment");
        }
        return decl;
    }
    return element();
}

std::optional<Node> Grammar::node() {
    if (!cursor_.current_is('<')) {
        return text();
    }
    return strict_node();
}

std::optional<Node> Grammar::element() {
    if (depth_ >= max_depth_) {
        return fail("Element nesting exceeds the maximum depth of " + std::to_string(max_depth_));
    }

    cursor_.advance(); // '<'
    auto name = tag_name();
    if (!name) return std::nullopt;

    cursor_.skip_whitespace();

    std::vector<Attribute> attributes;
    while (!cursor_.current_is('>') && !cursor_.current_is('/')) {
        auto attr = attribute();
        if (!attr) return std::nullopt;

        for (const auto& existing : attributes) {
            if (existing.name == attr->name) {
                return fail("Element has two attributes with the same name");
            }
        }
        attributes.push_back(*attr);
        cursor_.skip_whitespace();
    }

    if (is_void_element(*name)) {
        if (cursor_.current_is('/')) {
            cursor_.advance();
        }
        if (!expect('>', "end of opening tag")) return std::nullopt;
        cursor_.advance();
        return Node::make_element(*name, std::move(attributes), {});
    }

    // Only void elements may self-close.
    if (!expect('>', "end of opening tag")) return std::nullopt;
    cursor_.advance();

    std::vector<Node> children;
    ++depth_;
    if (is_foreign_element(*name)) {
        auto body = foreign_text(*name);
        if (!body) return std::nullopt;
        children.push_back(std::move(*body));
    } else {
        while (!cursor_.next_match("</")) {
            if (cursor_.remaining() < 2) {
                return fail("Expected matching closing tag for " + std::string(*name));
            }
            auto child = node();
            if (!child) return std::nullopt;
            children.push_back(std::move(*child));
        }
    }
    --depth_;

    cursor_.advance_by(2); // "</"
    auto closing_name = tag_name();
    if (!closing_name) return std::nullopt;

    if (!equals_ignore_ascii_case(*closing_name, *name)) {
        return fail("Mismatched closing tag: Expected '" + std::string(*name) +
                    "', found '" + std::string(*closing_name) + "'");
    }
    cursor_.skip_whitespace();
    if (!expect('>', "end of closing tag")) return std::nullopt;
    cursor_.advance();

    return Node::make_element(*name, std::move(attributes), std::move(children));
}

std::optional<Attribute> Grammar::attribute() {
    std::size_t name_start = cursor_.offset();
    while (auto c = cursor_.current()) {
        if (ends_attribute_name(*c)) break;
        cursor_.advance();
    }
    if (cursor_.offset() == name_start) {
        return fail("Expected attribute name");
    }
    std::string_view name = cursor_.slice_from(name_start);

    if (cursor_.current_is_control()) {
        return fail("Unexpected control character " + cursor_.describe_current());
    }

    cursor_.skip_whitespace();
    if (cursor_.at_end()) {
        return fail("Expected something after attribute name");
    }

    std::string_view value;
    if (cursor_.current_is('=')) {
        cursor_.advance();
        auto first = cursor_.current();
        if (!first) {
            return fail("Expected attribute value after =");
        }

        if (*first == '"' || *first == '\'') {
            const char quote = static_cast<char>(*first);
            cursor_.advance();
            std::size_t value_start = cursor_.offset();
            while (!cursor_.at_end() && !cursor_.current_is_control() && !cursor_.current_is(quote)) {
                cursor_.advance();
            }
            if (!expect(quote, "value-ending quote")) return std::nullopt;
            value = cursor_.slice_from(value_start);
            cursor_.advance();
        } else {
            std::size_t value_start = cursor_.offset();
            while (auto c = cursor_.current()) {
                if (ends_unquoted_value(*c)) break;
                cursor_.advance();
            }
            value = cursor_.slice_from(value_start);
        }
    }

    return Attribute{name, value};
}

std::optional<Node> Grammar::text() {
    std::size_t start = cursor_.offset();
    while (auto c = cursor_.current()) {
        if (*c == '<' || is_control(*c)) break;
        cursor_.advance();
    }
    if (cursor_.current_is_control()) {
        return fail("Unexpected control character " + cursor_.describe_current());
    }
    return Node::make_text(cursor_.slice_from(start));
}

std::optional<Node> Grammar::foreign_text(std::string_view tag_name) {
    std::size_t start = cursor_.offset();
    while (!cursor_.at_end()) {
        // Any other "</..." is part of the body.
        if (cursor_.next_match("</") && cursor_.next_match_ignore_case(tag_name, 2)) {
            break;
        }
        cursor_.advance();
    }
    if (cursor_.at_end()) {
        return fail("Expected closing tag </" + std::string(tag_name) + ">");
    }
    return Node::make_foreign(cursor_.slice_from(start));
}

std::optional<Node> Grammar::comment() {
    cursor_.advance_by(3); // "<!-"
    if (!expect('-', "second - in comment declaration")) return std::nullopt;
    cursor_.advance();

    std::size_t start = cursor_.offset();
    if (cursor_.current_is('>') || cursor_.current_is('-')) {
        return fail("Comments may not start with '>' or '->'");
    }

    while (!cursor_.at_end()) {
        if (cursor_.next_match("--")) {
            if (cursor_.peek(2) == '>') break;
            return fail("Comments may not contain '--'");
        }
        if (cursor_.current_is_control()) {
            return fail("Unexpected control character " + cursor_.describe_current());
        }
        cursor_.advance();
    }
    if (cursor_.at_end()) {
        return fail("Expected comment tag closer '-->'");
    }
    std::string_view data = cursor_.slice_from(start);
    cursor_.advance_by(3); // "-->"

    return Node::make_comment(data);
}

std::optional<Node> Grammar::doctype_declaration() {
    // No message on a keyword mismatch: strict_node reports it as
    // "doctype or comment".
    if (!cursor_.next_match_ignore_case("DOCTYPE", 2)) {
        return std::nullopt;
    }
    cursor_.advance_by(9); // "<!DOCTYPE"
    cursor_.skip_whitespace();

    // Content is kept verbatim, not interpreted.
    std::size_t start = cursor_.offset();
    while (!cursor_.at_end() && !cursor_.current_is('>')) {
        cursor_.advance();
    }
    if (cursor_.at_end()) {
        return fail("Expected DOCTYPE tag closer '>'");
    }
    std::string_view data = cursor_.slice_from(start);
    cursor_.advance();

    return Node::make_doctype(data);
}

} // namespace

bool is_void_element(std::string_view tag_name) {
    return contains_ignore_ascii_case(kVoidElements, tag_name);
}

bool is_foreign_element(std::string_view tag_name) {
    return contains_ignore_ascii_case(kForeignElements, tag_name);
}

ParseResult parse(std::string_view source) {
    return parse(source, ParseOptions{});
}

ParseResult parse(std::string_view source, const ParseOptions& options) {
    ParseResult result;

    if (source.size() > options.max_input_size) {
        result.error.emplace("Input of " + std::to_string(source.size()) +
                                 " bytes exceeds the maximum of " +
                                 std::to_string(options.max_input_size) + " bytes",
                             source, 0);
    } else {
        Grammar grammar(source, options.max_nesting_depth);
        if (auto nodes = grammar.document()) {
            result.document.emplace(std::move(*nodes));
        } else {
            result.error.emplace(grammar.error_message(), source, grammar.error_offset());
        }
    }

    if (options.diagnostics) {
        if (result.ok()) {
            options.diagnostics->emit(core::Severity::Info, "html", "parse",
                                      "parsed " + std::to_string(result.document->size()) +
                                          " top-level nodes from " +
                                          std::to_string(source.size()) + " bytes");
        } else {
            options.diagnostics->emit_at(core::Severity::Error, "html", "parse",
                                         result.error->message(), result.error->line(),
                                         result.error->column());
        }
    }

    return result;
}

} // namespace webless::html
