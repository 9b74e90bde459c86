// format.cpp - format names, detection and adapter dispatch

#include <confdiff/format.h>
#include <confdiff/adapter.h>
#include <confdiff/json_adapter.h>
#include <confdiff/xml_adapter.h>
#include <confdiff/yaml_adapter.h>

#include <algorithm>
#include <cctype>
#include <limits>

namespace confdiff {

namespace {

std::string to_lower(std::string_view text)
{
    std::string result{text};
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string_view trim_view(std::string_view text)
{
    constexpr std::string_view whitespace = " \t\n\r\f\v";
    const auto first = text.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

} // anonymous namespace

std::string_view format_name(Format format) noexcept
{
    switch (format) {
        case Format::Json: return "json";
        case Format::Yaml: return "yaml";
        case Format::Xml:  return "xml";
    }
    return "json";
}

std::string_view format_display_name(Format format) noexcept
{
    switch (format) {
        case Format::Json: return "JSON";
        case Format::Yaml: return "YAML";
        case Format::Xml:  return "XML";
    }
    return "JSON";
}

std::optional<Format> parse_format(std::string_view name)
{
    const std::string lowered = to_lower(name);
    if (lowered == "json") return Format::Json;
    if (lowered == "yaml" || lowered == "yml") return Format::Yaml;
    if (lowered == "xml") return Format::Xml;
    return std::nullopt;
}

Format detect_format(std::string_view content, std::string_view filename)
{
    if (!filename.empty()) {
        const auto dot = filename.rfind('.');
        const std::string ext = to_lower(dot == std::string_view::npos ? filename : filename.substr(dot + 1));
        if (ext == "json") return Format::Json;
        if (ext == "xml") return Format::Xml;
        if (ext == "yaml" || ext == "yml") return Format::Yaml;
    }

    const std::string_view trimmed = trim_view(content);
    if (!trimmed.empty()) {
        const char first = trimmed.front();
        const char last = trimmed.back();
        if ((first == '{' && last == '}') || (first == '[' && last == ']')) {
            if (parse_json(std::string{trimmed}).ok()) {
                return Format::Json;
            }
        }
        if (first == '<' && trimmed.find('>') != std::string_view::npos) {
            return Format::Xml;
        }
    }
    return Format::Yaml;
}

bool validate_format(const std::string& content, Format format)
{
    return parse_document(format, content).ok();
}

namespace detail {

double out_of_range_double(std::string_view number) noexcept
{
    std::size_t pos = 0;
    bool negative = false;
    if (pos < number.size() && (number[pos] == '-' || number[pos] == '+')) {
        negative = number[pos] == '-';
        ++pos;
    }

    // Decimal order of the first significant digit: 0 for 1.5, -3 for 0.0012
    long long integer_digits = 0;
    long long fraction_zeros = 0;
    bool in_fraction = false;
    bool significant = false;
    for (; pos < number.size() && number[pos] != 'e' && number[pos] != 'E'; ++pos) {
        const char c = number[pos];
        if (c == '.') {
            in_fraction = true;
        } else if (c >= '0' && c <= '9') {
            if (!in_fraction) {
                if (significant || c != '0') {
                    significant = true;
                    ++integer_digits;
                }
            } else if (!significant) {
                if (c == '0') {
                    ++fraction_zeros;
                } else {
                    significant = true;
                }
            }
        }
    }
    const long long order = integer_digits > 0 ? integer_digits - 1 : -(fraction_zeros + 1);

    long long exponent = 0;
    if (pos < number.size()) {
        ++pos;
        bool negative_exponent = false;
        if (pos < number.size() && (number[pos] == '-' || number[pos] == '+')) {
            negative_exponent = number[pos] == '-';
            ++pos;
        }
        for (; pos < number.size() && number[pos] >= '0' && number[pos] <= '9'; ++pos) {
            exponent = std::min<long long>(exponent * 10 + (number[pos] - '0'), 1'000'000'000);
        }
        if (negative_exponent) {
            exponent = -exponent;
        }
    }

    const double magnitude = order + exponent < 0 ? 0.0 : std::numeric_limits<double>::infinity();
    return negative ? -magnitude : magnitude;
}

} // namespace detail

ParseResult parse_document(Format format, const std::string& text, const ParseOptions& options)
{
    switch (format) {
        case Format::Json: return parse_json(text, options);
        case Format::Yaml: return parse_yaml(text, options);
        case Format::Xml:  return parse_xml(text, options);
    }
    return ParseResult::failure(ParseError{format, "unsupported format"});
}

} // namespace confdiff
