#include <webless/html/ast.h>

namespace webless::html {

Node Node::make_element(std::string_view name, std::vector<Attribute> attributes,
                        std::vector<Node> children) {
    Node node(Element, name, {});
    node.attributes_ = std::move(attributes);
    node.children_ = std::move(children);
    return node;
}

std::optional<std::string_view> Node::attribute(std::string_view name) const {
    for (const auto& attr : attributes_) {
        if (attr.name == name) {
            return attr.value;
        }
    }
    return std::nullopt;
}

bool Node::has_attribute(std::string_view name) const {
    return attribute(name).has_value();
}

bool operator==(const Node& a, const Node& b) {
    return a.type_ == b.type_ && a.name_ == b.name_ && a.data_ == b.data_ &&
           a.attributes_ == b.attributes_ && a.children_ == b.children_;
}

const char* node_type_name(Node::Type type) {
    switch (type) {
        case Node::Doctype: return "Doctype";
        case Node::Comment: return "Comment";
        case Node::Text:    return "Text";
        case Node::Foreign: return "Foreign";
        case Node::Element: return "Element";
    }
    return "Unknown";
}

} // namespace webless::html
