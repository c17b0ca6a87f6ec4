#pragma once
#include <webless/html/ast.h>
#include <string>

namespace webless::html {

// Re-serialize to HTML that parses back to an equal tree.
std::string to_html(const Node& node);
std::string to_html(const Document& document);

// Indented one-node-per-line rendering for debugging and tooling.
std::string dump_tree(const Document& document);

} // namespace webless::html
