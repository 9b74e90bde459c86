// main.cpp - confdiff command-line front end
//
// Compares two JSON, YAML or XML documents and prints the result document
// (summary, change list, annotated lines) as JSON on stdout.
//
// Exit codes:
//   0  documents are equal
//   1  differences found
//   2  input error (usage, unreadable file, unsupported format, parse error)
//   3  internal comparison error

#include <confdiff/compare.h>
#include <confdiff/format.h>
#include <confdiff/serialization.h>

#include <charconv>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace confdiff;

namespace {

constexpr int exit_equal     = 0;
constexpr int exit_different = 1;
constexpr int exit_input     = 2;
constexpr int exit_internal  = 3;

void print_usage(const char* program)
{
    std::cout << "Usage: " << program << " [options] <source> <target>\n\n";
    std::cout << "Options:\n";
    std::cout << "  --format, -f FMT     json, yaml or xml (default: detect from source)\n";
    std::cout << "  --ignore, -i KEY     Skip a key name or dotted path (repeatable)\n";
    std::cout << "  --lenient            Compare sequences ignoring element order\n";
    std::cout << "  --elementwise        Report sequence changes per element\n";
    std::cout << "  --key-aware          Annotate lines by key syntax instead of substrings\n";
    std::cout << "  --xml-attributes     Compare XML attributes (stored under \"@attrs\")\n";
    std::cout << "  --max-depth N        Nesting limit (default: " << CONFDIFF_DEFAULT_MAX_DEPTH << ")\n";
    std::cout << "  --compact            Print the result on a single line\n";
    std::cout << "  --help, -h           Show this help\n";
}

std::optional<std::string> read_file(const std::string& filename)
{
    std::ifstream file(filename, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

int report_error(const CompareError& error, bool compact)
{
    std::cout << to_json(error, compact) << "\n";
    return error.is_input_error() ? exit_input : exit_internal;
}

} // anonymous namespace

int main(int argc, char* argv[])
{
    CompareRequest request;
    std::optional<std::string> format_arg;
    std::vector<std::string> files;
    bool compact = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--format" || arg == "-f") {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return exit_input;
            }
            format_arg = argv[++i];
        } else if (arg == "--ignore" || arg == "-i") {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return exit_input;
            }
            request.ignore_keys.emplace_back(argv[++i]);
        } else if (arg == "--lenient") {
            request.strict = false;
        } else if (arg == "--elementwise") {
            request.sequence_mode = SequenceMode::ElementWise;
        } else if (arg == "--key-aware") {
            request.annotate_mode = AnnotateMode::KeyAware;
        } else if (arg == "--xml-attributes") {
            request.xml_attributes = true;
        } else if (arg == "--max-depth") {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return exit_input;
            }
            const std::string value = argv[++i];
            std::size_t depth = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), depth);
            if (ec != std::errc{} || ptr != value.data() + value.size() || depth == 0) {
                std::cerr << "Invalid --max-depth value: " << value << "\n";
                return exit_input;
            }
            request.max_depth = depth;
        } else if (arg == "--compact") {
            compact = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return exit_equal;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n\n";
            print_usage(argv[0]);
            return exit_input;
        } else {
            files.push_back(arg);
        }
    }

    if (files.size() != 2) {
        print_usage(argv[0]);
        return exit_input;
    }

    for (std::size_t n = 0; n < files.size(); ++n) {
        auto contents = read_file(files[n]);
        if (!contents) {
            std::cerr << "Cannot read " << files[n] << "\n";
            return exit_input;
        }
        (n == 0 ? request.source_text : request.target_text) = std::move(*contents);
    }

    if (format_arg) {
        auto format = parse_format(*format_arg);
        if (!format) {
            return report_error(CompareError::unsupported_format(*format_arg), compact);
        }
        request.format = *format;
    } else {
        request.format = detect_format(request.source_text, files[0]);
    }

    CompareOutcome outcome = compare(request);
    if (!outcome.ok()) {
        return report_error(*outcome.error, compact);
    }

    std::cout << to_json(*outcome.result, compact) << "\n";
    return outcome.result->summary.empty() ? exit_equal : exit_different;
}
