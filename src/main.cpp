#include <webless/core/config.h>
#include <webless/core/diagnostics.h>
#include <webless/html/parser.h>
#include <webless/html/serializer.h>

#include <charconv>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

void print_usage(std::ostream& stream) {
    stream << "usage: " << webless::core::config::kProgramName
           << " [--html] [--verbose] [--max-depth=N] [--max-size=N] <file|->\n";
}

bool is_help_flag(std::string_view text) {
    return text == "-h" || text == "--help";
}

bool is_version_flag(std::string_view text) {
    return text == "-V" || text == "--version";
}

bool parse_positive_size(std::string_view text, std::size_t& value) {
    if (text.empty()) {
        return false;
    }

    std::size_t parsed = 0;
    const char* begin = text.data();
    const char* end = begin + text.size();
    const std::from_chars_result result = std::from_chars(begin, end, parsed);
    if (result.ec != std::errc() || result.ptr != end || parsed == 0) {
        return false;
    }

    value = parsed;
    return true;
}

// Matches "--name=VALUE" and yields VALUE.
bool match_valued_flag(std::string_view argument, std::string_view name, std::string_view& value) {
    if (argument.size() <= name.size() || argument.compare(0, name.size(), name) != 0 ||
        argument[name.size()] != '=') {
        return false;
    }
    value = argument.substr(name.size() + 1);
    return true;
}

bool read_source(const std::string& path, std::string& source) {
    if (path == "-") {
        std::ostringstream oss;
        oss << std::cin.rdbuf();
        source = oss.str();
        return !std::cin.bad();
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    source.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return !file.bad();
}

} // namespace

int main(int argc, char** argv) {
    if (argc == 2 && is_help_flag(argv[1])) {
        print_usage(std::cout);
        return 0;
    }
    if (argc == 2 && is_version_flag(argv[1])) {
        std::cout << webless::core::config::kVersionString << "\n";
        return 0;
    }

    webless::html::ParseOptions options;
    bool emit_html = false;
    bool verbose = false;
    std::vector<std::string> positional_args;

    for (int index = 1; index < argc; ++index) {
        const std::string_view argument(argv[index] != nullptr ? argv[index] : "");
        std::string_view value;

        if (argument == "--html") {
            emit_html = true;
        } else if (argument == "--verbose") {
            verbose = true;
        } else if (match_valued_flag(argument, "--max-depth", value)) {
            if (!parse_positive_size(value, options.max_nesting_depth)) {
                std::cerr << "Invalid --max-depth: '" << argument << "'\n";
                print_usage(std::cerr);
                return 1;
            }
        } else if (match_valued_flag(argument, "--max-size", value)) {
            if (!parse_positive_size(value, options.max_input_size)) {
                std::cerr << "Invalid --max-size: '" << argument << "'\n";
                print_usage(std::cerr);
                return 1;
            }
        } else if (argument.size() > 1 && argument[0] == '-') {
            std::cerr << "Unknown option: '" << argument << "'\n";
            print_usage(std::cerr);
            return 1;
        } else {
            positional_args.emplace_back(argument);
        }
    }

    if (positional_args.size() != 1) {
        print_usage(std::cerr);
        return 1;
    }

    std::string source;
    if (!read_source(positional_args[0], source)) {
        std::cerr << "Cannot read '" << positional_args[0] << "'\n";
        return 1;
    }

    webless::core::DiagnosticEmitter diagnostics;
    diagnostics.set_min_severity(verbose ? webless::core::Severity::Info
                                         : webless::core::Severity::Error);
    diagnostics.add_observer([](const webless::core::DiagnosticEvent& event) {
        std::cerr << webless::core::format_diagnostic(event) << "\n";
    });
    options.diagnostics = &diagnostics;

    const webless::html::ParseResult result = webless::html::parse(source, options);
    if (!result.ok()) {
        std::cerr << result.error->excerpt(source) << "\n";
        return 1;
    }

    if (emit_html) {
        std::cout << webless::html::to_html(*result.document) << "\n";
    } else {
        std::cout << webless::html::dump_tree(*result.document);
    }
    return 0;
}
