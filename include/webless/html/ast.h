#pragma once
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace webless::html {

// Name and value are views into the parsed source. A boolean attribute
// (no '=') has an empty value.
struct Attribute {
    std::string_view name;
    std::string_view value;
};

inline bool operator==(const Attribute& a, const Attribute& b) {
    return a.name == b.name && a.value == b.value;
}
inline bool operator!=(const Attribute& a, const Attribute& b) { return !(a == b); }

// Immutable AST node. Every string_view refers into the source buffer the
// node was parsed from; that buffer must outlive the node.
class Node {
public:
    enum Type { Doctype, Comment, Text, Foreign, Element };

    static Node make_doctype(std::string_view data) { return Node(Doctype, {}, data); }
    static Node make_comment(std::string_view data) { return Node(Comment, {}, data); }
    static Node make_text(std::string_view data) { return Node(Text, {}, data); }
    static Node make_foreign(std::string_view data) { return Node(Foreign, {}, data); }
    static Node make_element(std::string_view name, std::vector<Attribute> attributes,
                             std::vector<Node> children);

    Type type() const { return type_; }
    bool is_element() const { return type_ == Element; }

    // Element tag name as written; empty for other node types.
    std::string_view name() const { return name_; }
    // Character data of Doctype/Comment/Text/Foreign nodes.
    std::string_view data() const { return data_; }

    const std::vector<Attribute>& attributes() const { return attributes_; }
    const std::vector<Node>& children() const { return children_; }

    std::optional<std::string_view> attribute(std::string_view name) const;
    bool has_attribute(std::string_view name) const;

    friend bool operator==(const Node& a, const Node& b);
    friend bool operator!=(const Node& a, const Node& b) { return !(a == b); }

private:
    Node(Type type, std::string_view name, std::string_view data)
        : type_(type), name_(name), data_(data) {}

    Type type_;
    std::string_view name_;
    std::string_view data_;
    std::vector<Attribute> attributes_;
    std::vector<Node> children_;
};

const char* node_type_name(Node::Type type);

// Ordered top-level nodes of a parsed source.
class Document {
public:
    Document() = default;
    explicit Document(std::vector<Node> nodes) : nodes_(std::move(nodes)) {}

    const std::vector<Node>& nodes() const { return nodes_; }
    std::size_t size() const { return nodes_.size(); }
    bool empty() const { return nodes_.empty(); }

    friend bool operator==(const Document& a, const Document& b) { return a.nodes_ == b.nodes_; }
    friend bool operator!=(const Document& a, const Document& b) { return !(a == b); }

private:
    std::vector<Node> nodes_;
};

} // namespace webless::html
