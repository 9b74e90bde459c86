// yaml_adapter.cpp - YAML text to Value (yaml-cpp)

#include <confdiff/yaml_adapter.h>
#include <confdiff/builders.h>
#include <confdiff/log.h>

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <iterator>
#include <limits>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace confdiff {

namespace {

namespace tags {
    constexpr std::string_view str       = "tag:yaml.org,2002:str";
    constexpr std::string_view integer   = "tag:yaml.org,2002:int";
    constexpr std::string_view floating  = "tag:yaml.org,2002:float";
    constexpr std::string_view boolean   = "tag:yaml.org,2002:bool";
    constexpr std::string_view null      = "tag:yaml.org,2002:null";
    constexpr std::string_view map       = "tag:yaml.org,2002:map";
    constexpr std::string_view seq       = "tag:yaml.org,2002:seq";
    constexpr std::string_view timestamp = "tag:yaml.org,2002:timestamp";
    constexpr std::string_view binary    = "tag:yaml.org,2002:binary";
    constexpr std::string_view plain     = "?";   // non-specific, plain scalar
    constexpr std::string_view quoted    = "!";   // non-specific, quoted scalar
} // namespace tags

constexpr std::string_view merge_key = "<<";

// ============================================================
// YAML 1.1 implicit resolvers
//
// Each scanner accepts exactly the language of the corresponding YAML 1.1
// resolver pattern, in a single left-to-right pass.
// ============================================================

constexpr std::size_t no_match = std::string_view::npos;

bool is_digit(char c) { return c >= '0' && c <= '9'; }
bool is_digit_or_underscore(char c) { return is_digit(c) || c == '_'; }
bool is_binary_digit(char c) { return c == '0' || c == '1' || c == '_'; }
bool is_octal_digit(char c) { return (c >= '0' && c <= '7') || c == '_'; }
bool is_hex_digit(char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0 || c == '_'; }

template <typename Pred>
std::size_t skip_while(std::string_view text, std::size_t pos, Pred pred)
{
    while (pos < text.size() && pred(text[pos])) {
        ++pos;
    }
    return pos;
}

template <typename Pred>
bool all_of_nonempty(std::string_view text, Pred pred)
{
    return !text.empty() && skip_while(text, 0, pred) == text.size();
}

std::size_t sign_length(std::string_view text)
{
    return (!text.empty() && (text[0] == '-' || text[0] == '+')) ? 1 : 0;
}

/// One or more ":[0-5]?[0-9]" groups starting at @p pos; end position or no_match
std::size_t scan_sexagesimal_groups(std::string_view text, std::size_t pos)
{
    std::size_t groups = 0;
    while (pos < text.size() && text[pos] == ':') {
        ++pos;
        if (pos + 1 < text.size() && text[pos] >= '0' && text[pos] <= '5' && is_digit(text[pos + 1])) {
            pos += 2;
        } else if (pos < text.size() && is_digit(text[pos])) {
            pos += 1;
        } else {
            return no_match;
        }
        ++groups;
    }
    return groups > 0 ? pos : no_match;
}

/// Optional "[eE][-+][0-9]+" at @p pos; end position or no_match
std::size_t scan_exponent(std::string_view text, std::size_t pos)
{
    if (pos == text.size() || (text[pos] != 'e' && text[pos] != 'E')) {
        return pos;
    }
    ++pos;
    if (pos == text.size() || (text[pos] != '-' && text[pos] != '+')) {
        return no_match;
    }
    ++pos;
    const std::size_t end = skip_while(text, pos, is_digit);
    return end > pos ? end : no_match;
}

bool is_null_scalar(std::string_view text)
{
    return text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL";
}

bool is_int_scalar(std::string_view text)
{
    const std::size_t start = sign_length(text);
    const std::string_view body = text.substr(start);

    if (body.size() > 2 && body.substr(0, 2) == "0b") {
        return all_of_nonempty(body.substr(2), is_binary_digit);
    }
    if (body.size() > 2 && body.substr(0, 2) == "0x") {
        return all_of_nonempty(body.substr(2), is_hex_digit);
    }
    if (body == "0") {
        return true;
    }
    if (body.size() > 1 && body[0] == '0') {
        return all_of_nonempty(body.substr(1), is_octal_digit);
    }
    if (body.empty() || body[0] < '1' || body[0] > '9') {
        return false;
    }
    const std::size_t end = skip_while(text, start + 1, is_digit_or_underscore);
    return end == text.size() || scan_sexagesimal_groups(text, end) == text.size();
}

bool is_float_scalar(std::string_view text)
{
    if (text == ".nan" || text == ".NaN" || text == ".NAN") {
        return true;
    }

    const std::size_t start = sign_length(text);
    const std::string_view body = text.substr(start);
    if (body == ".inf" || body == ".Inf" || body == ".INF") {
        return true;
    }

    // .5, .5e+3 (unsigned only)
    if (!body.empty() && body[0] == '.') {
        if (start != 0 || body.size() < 2 || !is_digit(body[1])) {
            return false;
        }
        return scan_exponent(text, skip_while(text, 2, is_digit_or_underscore)) == text.size();
    }

    if (body.empty() || !is_digit(body[0])) {
        return false;
    }
    std::size_t pos = skip_while(text, start + 1, is_digit_or_underscore);

    // 1:30.5 (no exponent)
    if (pos < text.size() && text[pos] == ':') {
        pos = scan_sexagesimal_groups(text, pos);
        if (pos == no_match || pos == text.size() || text[pos] != '.') {
            return false;
        }
        return skip_while(text, pos + 1, is_digit_or_underscore) == text.size();
    }

    if (pos == text.size() || text[pos] != '.') {
        return false;
    }
    pos = skip_while(text, pos + 1, is_digit_or_underscore);
    return scan_exponent(text, pos) == text.size();
}

std::string strip_underscores(std::string_view text)
{
    std::string result;
    result.reserve(text.size());
    std::copy_if(text.begin(), text.end(), std::back_inserter(result),
                 [](char c) { return c != '_'; });
    return result;
}

/// Split off a leading sign, returning -1 or +1
int take_sign(std::string& digits)
{
    int sign = 1;
    if (!digits.empty() && (digits[0] == '-' || digits[0] == '+')) {
        if (digits[0] == '-') sign = -1;
        digits.erase(0, 1);
    }
    return sign;
}

/// Integer in @p base; falls back to double when it does not fit in int64_t
Value make_integer(std::string_view digits, int base, int sign)
{
    int64_t ival = 0;
    const char* first = digits.data();
    const char* last = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(first, last, ival, base);
    if (ec == std::errc{} && ptr == last) {
        return Value{sign * ival};
    }

    double dval = 0.0;
    for (char c : digits) {
        int d = (c >= '0' && c <= '9') ? c - '0' : (std::tolower(static_cast<unsigned char>(c)) - 'a' + 10);
        dval = dval * base + d;
    }
    return Value{sign * dval};
}

std::optional<Value> construct_int(std::string_view text)
{
    std::string value = strip_underscores(text);
    const int sign = take_sign(value);

    if (value.empty()) {
        return std::nullopt;
    }
    if (value == "0") {
        return Value{int64_t{0}};
    }
    if (value.rfind("0b", 0) == 0) {
        return make_integer(std::string_view{value}.substr(2), 2, sign);
    }
    if (value.rfind("0x", 0) == 0) {
        return make_integer(std::string_view{value}.substr(2), 16, sign);
    }
    if (value[0] == '0') {
        return make_integer(std::string_view{value}.substr(1), 8, sign);
    }
    if (value.find(':') != std::string::npos) {
        // base 60: 1:30 -> 90, as a double once it leaves int64_t
        int64_t total = 0;
        double approx = 0.0;
        bool overflow = false;
        std::size_t start = 0;
        while (true) {
            const auto pos = value.find(':', start);
            const auto part = std::string_view{value}.substr(start, pos == std::string::npos ? std::string::npos : pos - start);
            if (part.empty() || !std::all_of(part.begin(), part.end(), is_digit)) {
                return std::nullopt;
            }
            double part_value = 0.0;
            for (char c : part) {
                part_value = part_value * 10 + (c - '0');
            }
            approx = approx * 60 + part_value;

            if (!overflow) {
                int64_t digit = 0;
                auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), digit);
                if (ec != std::errc{} || total > (std::numeric_limits<int64_t>::max() - digit) / 60) {
                    overflow = true;
                } else {
                    total = total * 60 + digit;
                }
            }
            if (pos == std::string::npos) break;
            start = pos + 1;
        }
        return overflow ? Value{sign * approx} : Value{sign * total};
    }

    for (char c : value) {
        if (c < '0' || c > '9') return std::nullopt;
    }
    return make_integer(value, 10, sign);
}

std::optional<Value> construct_float(std::string_view text)
{
    std::string value = strip_underscores(text);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const int sign = take_sign(value);

    if (value == ".inf") {
        return Value{sign * std::numeric_limits<double>::infinity()};
    }
    if (value == ".nan") {
        return Value{std::numeric_limits<double>::quiet_NaN()};
    }
    if (value.find(':') != std::string::npos) {
        // base 60 with fraction: 1:30.5 -> 90.5
        double total = 0.0;
        std::size_t start = 0;
        while (true) {
            auto pos = value.find(':', start);
            std::string part = value.substr(start, pos == std::string::npos ? std::string::npos : pos - start);
            double digit = 0.0;
            auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), digit);
            if (ec != std::errc{} || ptr != part.data() + part.size()) {
                return std::nullopt;
            }
            total = total * 60 + digit;
            if (pos == std::string::npos) break;
            start = pos + 1;
        }
        return Value{sign * total};
    }

    double dval = 0.0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), dval);
    if (ec == std::errc::result_out_of_range) {
        return Value{sign * detail::out_of_range_double(value)};
    }
    if (ec != std::errc{} || ptr != value.data() + value.size()) {
        return std::nullopt;
    }
    return Value{sign * dval};
}

std::optional<Value> construct_bool(std::string_view text)
{
    static constexpr std::string_view truthy[] = {"yes", "Yes", "YES", "true", "True", "TRUE", "on", "On", "ON"};
    static constexpr std::string_view falsy[]  = {"no", "No", "NO", "false", "False", "FALSE", "off", "Off", "OFF"};
    if (std::find(std::begin(truthy), std::end(truthy), text) != std::end(truthy)) return Value{true};
    if (std::find(std::begin(falsy), std::end(falsy), text) != std::end(falsy)) return Value{false};
    return std::nullopt;
}

/// Implicit resolution of a plain (untagged, unquoted) scalar
Value resolve_plain_scalar(const std::string& text)
{
    if (is_null_scalar(text)) {
        return Value{};
    }
    if (auto v = construct_bool(text)) {
        return *v;
    }
    if (is_int_scalar(text)) {
        if (auto v = construct_int(text)) return *v;
    }
    if (is_float_scalar(text)) {
        if (auto v = construct_float(text)) return *v;
    }
    return Value{text};
}

std::string describe_mark(const std::string& message, const YAML::Mark& mark)
{
    if (mark.is_null()) {
        return message;
    }
    return message + " (line " + std::to_string(mark.line + 1) +
           ", column " + std::to_string(mark.column + 1) + ")";
}

class YamlConverter {
public:
    explicit YamlConverter(const ParseOptions& options)
        : max_depth_(options.max_depth), max_nodes_(options.max_nodes) {}

    Value convert(const YAML::Node& node, std::size_t depth) {
        if (depth > max_depth_) {
            fail_depth(node);
        }

        if (!node.IsMap() && !node.IsSequence()) {
            count_nodes(1, node);
            deepest_ = std::max(deepest_, depth);
            return node.IsScalar() ? convert_scalar(node) : Value{};
        }

        // Aliases resolve to the same node: convert it once and share the tree
        if (const Converted* seen = find_converted(node)) {
            if (depth + seen->height > max_depth_) {
                fail_depth(node);
            }
            count_nodes(seen->nodes, node);
            deepest_ = std::max(deepest_, depth + seen->height);
            return seen->value;
        }

        const std::size_t nodes_before = nodes_;
        const std::size_t deepest_before = deepest_;
        deepest_ = depth;
        count_nodes(1, node);

        Value value;
        if (node.IsSequence()) {
            check_container_tag(node, tags::seq);
            value = convert_sequence(node, depth);
        } else {
            check_container_tag(node, tags::map);
            value = convert_map(node, depth);
        }

        converted_[node.Mark().pos].push_back(
            Converted{node, value, deepest_ - depth, nodes_ - nodes_before});
        deepest_ = std::max(deepest_, deepest_before);
        return value;
    }

private:
    struct Converted {
        YAML::Node  node;
        Value       value;
        std::size_t height;  ///< Levels below the node
        std::size_t nodes;   ///< Expanded node count, the node included
    };

    std::size_t max_depth_;
    std::size_t max_nodes_;
    std::size_t nodes_   = 0;
    std::size_t deepest_ = 0;

    // Bucketed by source position; Node::is() decides identity
    std::unordered_map<int, std::vector<Converted>> converted_;

    using Entries = std::vector<std::pair<std::string, Value>>;

    const Converted* find_converted(const YAML::Node& node) const {
        auto it = converted_.find(node.Mark().pos);
        if (it == converted_.end()) {
            return nullptr;
        }
        for (const auto& entry : it->second) {
            if (entry.node.is(node)) {
                return &entry;
            }
        }
        return nullptr;
    }

    void count_nodes(std::size_t count, const YAML::Node& node) {
        nodes_ += count;
        if (nodes_ > max_nodes_) {
            fail("document expands to more than " + std::to_string(max_nodes_) + " nodes", node);
        }
    }

    [[noreturn]] void fail_depth(const YAML::Node& node) const {
        fail("maximum nesting depth of " + std::to_string(max_depth_) + " exceeded", node);
    }

    [[noreturn]] void fail(const std::string& message, const YAML::Node& node) const {
        throw ParseError{Format::Yaml, describe_mark(message, node.Mark())};
    }

    void check_container_tag(const YAML::Node& node, std::string_view expected) const {
        const std::string& tag = node.Tag();
        if (tag.empty() || tag == tags::plain || tag == tags::quoted || tag == expected) {
            return;
        }
        fail("could not determine a constructor for the tag '" + tag + "'", node);
    }

    Value convert_scalar(const YAML::Node& node) const {
        const std::string& tag = node.Tag();
        const std::string& text = node.Scalar();

        if (tag == tags::plain) {
            return resolve_plain_scalar(text);
        }
        if (tag == tags::quoted || tag == tags::str || tag == tags::timestamp || tag == tags::binary) {
            return Value{text};
        }
        if (tag == tags::null) {
            return Value{};
        }
        if (tag == tags::boolean) {
            if (auto v = construct_bool(text)) return *v;
            fail("invalid boolean '" + text + "'", node);
        }
        if (tag == tags::integer) {
            if (auto v = construct_int(text)) return *v;
            fail("invalid integer '" + text + "'", node);
        }
        if (tag == tags::floating) {
            if (auto v = construct_float(text)) return *v;
            if (auto v = construct_int(text)) {
                return v->is_double() ? *v : Value{static_cast<double>(v->as_int())};
            }
            fail("invalid float '" + text + "'", node);
        }
        fail("could not determine a constructor for the tag '" + tag + "'", node);
    }

    Value convert_sequence(const YAML::Node& node, std::size_t depth) {
        VectorBuilder builder;
        for (const auto& child : node) {
            builder.push_back(convert(child, depth + 1));
        }
        return builder.finish();
    }

    std::string key_text(const YAML::Node& key) const {
        if (key.IsScalar() || key.IsNull()) {
            return key.Scalar();
        }
        fail("found unhashable key", key);
    }

    static bool is_merge_key(const YAML::Node& key) {
        return key.IsScalar() && key.Tag() == tags::plain && key.Scalar() == merge_key;
    }

    Entries map_entries(const YAML::Node& node, std::size_t depth) {
        Value merged = convert(node, depth);
        Entries result;
        for (const auto& entry : *merged.get_if<ValueMap>()) {
            result.emplace_back(entry.key, entry.value.get());
        }
        return result;
    }

    /// Entries contributed by a "<<" value; earlier mappings in a list win
    void collect_merge(const YAML::Node& value, std::size_t depth, Entries& out) {
        if (value.IsMap()) {
            auto entries = map_entries(value, depth + 1);
            out.insert(out.end(), entries.begin(), entries.end());
            return;
        }
        if (value.IsSequence()) {
            std::vector<Entries> submerge;
            for (const auto& sub : value) {
                if (!sub.IsMap()) {
                    fail("expected a mapping for merging", sub);
                }
                submerge.push_back(map_entries(sub, depth + 1));
            }
            std::reverse(submerge.begin(), submerge.end());
            for (auto& entries : submerge) {
                out.insert(out.end(), entries.begin(), entries.end());
            }
            return;
        }
        fail("expected a mapping or list of mappings for merging", value);
    }

    Value convert_map(const YAML::Node& node, std::size_t depth) {
        Entries merged;
        Entries explicit_entries;

        for (auto it = node.begin(); it != node.end(); ++it) {
            if (is_merge_key(it->first)) {
                collect_merge(it->second, depth, merged);
                continue;
            }
            explicit_entries.emplace_back(key_text(it->first), convert(it->second, depth + 1));
        }

        // Merged entries first, explicit keys override in place
        MapBuilder builder;
        for (auto& [key, val] : merged) {
            builder.set(key, std::move(val));
        }
        for (auto& [key, val] : explicit_entries) {
            builder.set(key, std::move(val));
        }
        return builder.finish();
    }
};

} // anonymous namespace

ParseResult parse_yaml(const std::string& text, const ParseOptions& options)
{
    try {
        std::vector<YAML::Node> documents = YAML::LoadAll(text);
        if (documents.empty()) {
            return ParseResult::success(Value{});
        }
        if (documents.size() > 1) {
            throw ParseError{Format::Yaml, "expected a single document in the stream, but found another document"};
        }
        YamlConverter converter(options);
        return ParseResult::success(converter.convert(documents.front(), 0));
    } catch (const ParseError& e) {
        detail::log_parse_failure("yaml", e.message());
        return ParseResult::failure(e);
    } catch (const YAML::Exception& e) {
        ParseError err{Format::Yaml, describe_mark(e.msg, e.mark)};
        detail::log_parse_failure("yaml", err.message());
        return ParseResult::failure(std::move(err));
    } catch (const std::exception& e) {
        ParseError err{Format::Yaml, e.what()};
        detail::log_parse_failure("yaml", err.message());
        return ParseResult::failure(std::move(err));
    }
}

} // namespace confdiff
