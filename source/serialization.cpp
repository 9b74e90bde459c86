// serialization.cpp - JSON output

#include <confdiff/serialization.h>
#include <confdiff/builders.h>

#include <charconv>
#include <cmath>
#include <cstdio>
#include <sstream>

namespace confdiff {

namespace {

// JSON escape special characters in strings
std::string json_escape_string(const std::string& s) {
    std::string result;
    result.reserve(s.size() + 16);

    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

void to_json_impl(const Value& val, std::ostringstream& oss, bool compact, int indent_level) {
    const std::string indent = compact ? "" : std::string(indent_level * 2, ' ');
    const std::string child_indent = compact ? "" : std::string((indent_level + 1) * 2, ' ');
    const std::string newline = compact ? "" : "\n";
    const std::string space_after_colon = compact ? "" : " ";

    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (arg ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << arg;
        } else if constexpr (std::is_same_v<T, double>) {
            oss << format_double(arg);
        } else if constexpr (std::is_same_v<T, std::string>) {
            oss << "\"" << json_escape_string(arg) << "\"";
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            if (arg.empty()) {
                oss << "{}";
            } else {
                oss << "{" << newline;
                bool first = true;
                for (const auto& entry : arg) {
                    if (!first) oss << "," << newline;
                    first = false;
                    oss << child_indent << "\"" << json_escape_string(entry.key) << "\":" << space_after_colon;
                    to_json_impl(entry.value.get(), oss, compact, indent_level + 1);
                }
                oss << newline << indent << "}";
            }
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            if (arg.empty()) {
                oss << "[]";
            } else {
                oss << "[" << newline;
                bool first = true;
                for (const auto& v : arg) {
                    if (!first) oss << "," << newline;
                    first = false;
                    oss << child_indent;
                    to_json_impl(v.get(), oss, compact, indent_level + 1);
                }
                oss << newline << indent << "]";
            }
        }
    }, val.data);
}

Value lines_to_value(const std::vector<std::string>& lines)
{
    VectorBuilder builder;
    for (const auto& line : lines) {
        builder.push_back(line);
    }
    return builder.finish();
}

Value change_to_value(const ChangeRecord& change)
{
    MapBuilder builder;
    builder.set("path", change.path.to_string())
           .set("change_type", std::string{change_kind_name(change.kind)});
    if (change.old_value) {
        builder.set("old_value", *change.old_value);
    }
    if (change.new_value) {
        builder.set("new_value", *change.new_value);
    }
    return builder.finish();
}

} // anonymous namespace

std::string format_double(double value)
{
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value < 0 ? "-Infinity" : "Infinity";
    }

    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    std::string text{buf, ec == std::errc{} ? ptr : buf};
    if (text.find_first_of(".e") == std::string::npos) {
        text += ".0";
    }
    return text;
}

std::string to_json(const Value& val, bool compact) {
    std::ostringstream oss;
    to_json_impl(val, oss, compact, 0);
    return oss.str();
}

Value result_to_value(const CompareResult& result)
{
    Value summary = MapBuilder()
        .set("additions", result.summary.additions)
        .set("deletions", result.summary.deletions)
        .set("modifications", result.summary.modifications)
        .finish();

    VectorBuilder changes;
    for (const auto& change : result.diff) {
        changes.push_back(change_to_value(change));
    }

    Value formatted = MapBuilder()
        .set("source", lines_to_value(result.formatted_diff.source))
        .set("target", lines_to_value(result.formatted_diff.target))
        .finish();

    return MapBuilder()
        .set("summary", std::move(summary))
        .set("diff", changes.finish())
        .set("formatted_diff", std::move(formatted))
        .finish();
}

std::string to_json(const CompareResult& result, bool compact)
{
    return to_json(result_to_value(result), compact);
}

std::string to_json(const CompareError& error, bool compact)
{
    MapBuilder builder;
    builder.set("error", std::string{error_kind_name(error.kind)});
    if (error.format) {
        builder.set("format", std::string{format_name(*error.format)});
    }
    builder.set("detail", error.message);
    return to_json(builder.finish(), compact);
}

} // namespace confdiff
