#pragma once
#include <webless/core/config.h>
#include <webless/html/ast.h>
#include <webless/html/parse_error.h>
#include <cstddef>
#include <optional>
#include <string_view>

namespace webless::core {
class DiagnosticEmitter;
} // namespace webless::core

namespace webless::html {

struct ParseOptions {
    std::size_t max_input_size = core::config::kDefaultMaxInputSize;
    std::size_t max_nesting_depth = core::config::kDefaultMaxNestingDepth;
    // Receives one event per parse when set. Not owned.
    core::DiagnosticEmitter* diagnostics = nullptr;
};

// Either a complete document or the first error; never both.
struct ParseResult {
    std::optional<Document> document;
    std::optional<ParseError> error;

    bool ok() const { return document.has_value(); }
};

// Parses a complete in-memory source. The returned document holds views
// into `source`, which must outlive it.
//
// The one-argument form uses default ParseOptions, so it is still bounded:
// inputs over kDefaultMaxInputSize (64 MiB) and elements nested deeper than
// kDefaultMaxNestingDepth (512) are reported as errors.
ParseResult parse(std::string_view source);
ParseResult parse(std::string_view source, const ParseOptions& options);

// area, base, br, col, command, embed, hr, img, input, keygen, link, meta,
// param, source, track, wbr (ASCII case-insensitive).
bool is_void_element(std::string_view tag_name);
// script, style, title, textarea, svg, math (ASCII case-insensitive).
bool is_foreign_element(std::string_view tag_name);

} // namespace webless::html
