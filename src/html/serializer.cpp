#include <webless/html/serializer.h>
#include <webless/html/parser.h>
#include <cstdio>

namespace webless::html {

namespace {

void append_attributes(std::string& out, const std::vector<Attribute>& attributes) {
    for (const auto& attr : attributes) {
        out += ' ';
        out += attr.name;
        if (attr.value.empty()) {
            continue;
        }
        // Quoted values cannot contain their own quote character.
        const char quote = attr.value.find('"') == std::string_view::npos ? '"' : '\'';
        out += '=';
        out += quote;
        out += attr.value;
        out += quote;
    }
}

void append_html(std::string& out, const Node& node) {
    switch (node.type()) {
        case Node::Doctype:
            out += "<!DOCTYPE ";
            out += node.data();
            out += '>';
            return;
        case Node::Comment:
            out += "<!--";
            out += node.data();
            out += "-->";
            return;
        case Node::Text:
        case Node::Foreign:
            out += node.data();
            return;
        case Node::Element:
            break;
    }

    out += '<';
    out += node.name();
    append_attributes(out, node.attributes());
    out += '>';
    if (is_void_element(node.name())) {
        return;
    }
    for (const auto& child : node.children()) {
        append_html(out, child);
    }
    out += "</";
    out += node.name();
    out += '>';
}

std::string quoted(std::string_view data) {
    std::string out = "\"";
    for (char c : data) {
        switch (c) {
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20 || c == 0x7F) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\x%02x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
    return out;
}

void append_tree(std::string& out, const Node& node, int depth) {
    out.append(static_cast<std::size_t>(depth) * 2, ' ');
    switch (node.type()) {
        case Node::Doctype:
            out += "DOCTYPE " + quoted(node.data());
            break;
        case Node::Comment:
            out += "COMMENT " + quoted(node.data());
            break;
        case Node::Text:
            out += "TEXT " + quoted(node.data());
            break;
        case Node::Foreign:
            out += "FOREIGN " + quoted(node.data());
            break;
        case Node::Element:
            out += '<';
            out += node.name();
            for (const auto& attr : node.attributes()) {
                out += ' ';
                out += attr.name;
                out += '=';
                out += quoted(attr.value);
            }
            out += '>';
            break;
    }
    out += '\n';

    for (const auto& child : node.children()) {
        append_tree(out, child, depth + 1);
    }
}

} // namespace

std::string to_html(const Node& node) {
    std::string out;
    append_html(out, node);
    return out;
}

std::string to_html(const Document& document) {
    std::string out;
    for (const auto& node : document.nodes()) {
        append_html(out, node);
    }
    return out;
}

std::string dump_tree(const Document& document) {
    std::string out = "#document\n";
    for (const auto& node : document.nodes()) {
        append_tree(out, node, 1);
    }
    return out;
}

} // namespace webless::html
