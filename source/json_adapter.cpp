// json_adapter.cpp - JSON text to Value

#include <confdiff/json_adapter.h>
#include <confdiff/builders.h>
#include <confdiff/log.h>

#include <charconv>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace confdiff {

namespace {

// Raised inside the parser, converted to ParseError at the adapter boundary
class JsonSyntaxError : public std::runtime_error {
public:
    JsonSyntaxError(const std::string& message, std::size_t pos)
        : std::runtime_error(message), pos_(pos) {}

    [[nodiscard]] std::size_t pos() const noexcept { return pos_; }

private:
    std::size_t pos_;
};

bool is_json_whitespace(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool is_digit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

void append_utf8(std::string& out, uint32_t cp)
{
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

/// "msg: line L column C (char P)" with 1-based line/column
std::string describe_position(const std::string& text, const std::string& message, std::size_t pos)
{
    std::size_t line = 1;
    std::size_t line_start = 0;
    for (std::size_t i = 0; i < pos && i < text.size(); ++i) {
        if (text[i] == '\n') {
            ++line;
            line_start = i + 1;
        }
    }
    return message + ": line " + std::to_string(line) +
           " column " + std::to_string(pos - line_start + 1) +
           " (char " + std::to_string(pos) + ")";
}

class JsonParser {
public:
    JsonParser(const std::string& json, std::size_t max_depth)
        : json_(json), max_depth_(max_depth) {}

    Value parse() {
        Value result = parse_value();
        skip_whitespace();
        if (pos_ < json_.size()) {
            throw JsonSyntaxError("Extra data", pos_);
        }
        return result;
    }

private:
    const std::string& json_;
    std::size_t pos_ = 0;
    std::size_t depth_ = 0;
    std::size_t max_depth_;

    char peek() const {
        return pos_ < json_.size() ? json_[pos_] : '\0';
    }

    bool at_end() const {
        return pos_ >= json_.size();
    }

    void skip_whitespace() {
        while (pos_ < json_.size() && is_json_whitespace(json_[pos_])) {
            ++pos_;
        }
    }

    bool consume_literal(std::string_view literal) {
        if (json_.compare(pos_, literal.size(), literal) == 0) {
            pos_ += literal.size();
            return true;
        }
        return false;
    }

    void enter_container() {
        if (++depth_ > max_depth_) {
            throw JsonSyntaxError("Maximum nesting depth of " + std::to_string(max_depth_) + " exceeded", pos_);
        }
    }

    Value parse_value() {
        skip_whitespace();
        if (at_end()) {
            throw JsonSyntaxError("Expecting value", pos_);
        }

        const char c = peek();
        if (c == '{') return parse_object();
        if (c == '[') return parse_array();
        if (c == '"') return Value{parse_string_raw()};
        if (c == '-' || is_digit(c)) return parse_number();

        if (consume_literal("true")) return Value{true};
        if (consume_literal("false")) return Value{false};
        if (consume_literal("null")) return Value{};
        if (consume_literal("NaN")) return Value{std::numeric_limits<double>::quiet_NaN()};
        if (consume_literal("Infinity")) return Value{std::numeric_limits<double>::infinity()};

        throw JsonSyntaxError("Expecting value", pos_);
    }

    Value parse_object() {
        enter_container();
        ++pos_;  // '{'
        MapBuilder builder;

        skip_whitespace();
        if (peek() == '}') {
            ++pos_;
            --depth_;
            return builder.finish();
        }

        while (true) {
            skip_whitespace();
            if (peek() != '"') {
                throw JsonSyntaxError("Expecting property name enclosed in double quotes", pos_);
            }
            std::string key = parse_string_raw();

            skip_whitespace();
            if (peek() != ':') {
                throw JsonSyntaxError("Expecting ':' delimiter", pos_);
            }
            ++pos_;

            builder.set(key, parse_value());

            skip_whitespace();
            const char c = peek();
            if (c == '}') {
                ++pos_;
                break;
            }
            if (c != ',') {
                throw JsonSyntaxError("Expecting ',' delimiter", pos_);
            }
            ++pos_;
        }

        --depth_;
        return builder.finish();
    }

    Value parse_array() {
        enter_container();
        ++pos_;  // '['
        VectorBuilder builder;

        skip_whitespace();
        if (peek() == ']') {
            ++pos_;
            --depth_;
            return builder.finish();
        }

        while (true) {
            builder.push_back(parse_value());

            skip_whitespace();
            const char c = peek();
            if (c == ']') {
                ++pos_;
                break;
            }
            if (c != ',') {
                throw JsonSyntaxError("Expecting ',' delimiter", pos_);
            }
            ++pos_;
        }

        --depth_;
        return builder.finish();
    }

    uint32_t parse_hex4(std::size_t escape_pos) {
        if (pos_ + 4 > json_.size()) {
            throw JsonSyntaxError("Invalid \\uXXXX escape", escape_pos);
        }
        uint32_t cp = 0;
        const auto* first = json_.data() + pos_;
        auto [ptr, ec] = std::from_chars(first, first + 4, cp, 16);
        if (ec != std::errc{} || ptr != first + 4) {
            throw JsonSyntaxError("Invalid \\uXXXX escape", escape_pos);
        }
        pos_ += 4;
        return cp;
    }

    std::string parse_string_raw() {
        const std::size_t start = pos_;
        ++pos_;  // opening quote
        std::string result;

        while (pos_ < json_.size()) {
            const char c = json_[pos_++];
            if (c == '"') {
                return result;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                throw JsonSyntaxError("Invalid control character at", pos_ - 1);
            }
            if (c != '\\') {
                result += c;
                continue;
            }

            const std::size_t escape_pos = pos_ - 1;
            if (at_end()) {
                break;
            }
            const char escaped = json_[pos_++];
            switch (escaped) {
                case '"':  result += '"'; break;
                case '\\': result += '\\'; break;
                case '/':  result += '/'; break;
                case 'b':  result += '\b'; break;
                case 'f':  result += '\f'; break;
                case 'n':  result += '\n'; break;
                case 'r':  result += '\r'; break;
                case 't':  result += '\t'; break;
                case 'u': {
                    uint32_t cp = parse_hex4(escape_pos);
                    // Combine a UTF-16 surrogate pair when the low half follows
                    if (cp >= 0xD800 && cp <= 0xDBFF &&
                        json_.compare(pos_, 2, "\\u") == 0) {
                        const std::size_t saved = pos_;
                        pos_ += 2;
                        const uint32_t low = parse_hex4(saved);
                        if (low >= 0xDC00 && low <= 0xDFFF) {
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                        } else {
                            pos_ = saved;
                        }
                    }
                    append_utf8(result, cp);
                    break;
                }
                default:
                    throw JsonSyntaxError("Invalid \\escape", escape_pos);
            }
        }

        throw JsonSyntaxError("Unterminated string starting at", start);
    }

    Value parse_number() {
        const std::size_t start = pos_;
        bool is_float = false;

        if (peek() == '-') {
            ++pos_;
            if (consume_literal("Infinity")) {
                return Value{-std::numeric_limits<double>::infinity()};
            }
        }

        if (peek() == '0') {
            ++pos_;
        } else if (is_digit(peek())) {
            while (is_digit(peek())) ++pos_;
        } else {
            throw JsonSyntaxError("Expecting value", start);
        }

        if (peek() == '.' && pos_ + 1 < json_.size() && is_digit(json_[pos_ + 1])) {
            is_float = true;
            ++pos_;
            while (is_digit(peek())) ++pos_;
        }

        if (peek() == 'e' || peek() == 'E') {
            std::size_t exp_pos = pos_ + 1;
            if (exp_pos < json_.size() && (json_[exp_pos] == '+' || json_[exp_pos] == '-')) {
                ++exp_pos;
            }
            if (exp_pos < json_.size() && is_digit(json_[exp_pos])) {
                is_float = true;
                pos_ = exp_pos;
                while (is_digit(peek())) ++pos_;
            }
        }

        const char* first = json_.data() + start;
        const char* last = json_.data() + pos_;

        if (!is_float) {
            int64_t ival = 0;
            auto [ptr, ec] = std::from_chars(first, last, ival);
            if (ec == std::errc{} && ptr == last) {
                return Value{ival};
            }
            // Out of int64 range: keep the magnitude as a double
        }

        double dval = 0.0;
        auto [ptr, ec] = std::from_chars(first, last, dval);
        if (ec == std::errc::result_out_of_range) {
            dval = detail::out_of_range_double(std::string_view{first, static_cast<std::size_t>(last - first)});
        } else if (ec != std::errc{} || ptr != last) {
            throw JsonSyntaxError("Expecting value", start);
        }
        return Value{dval};
    }
};

} // anonymous namespace

ParseResult parse_json(const std::string& text, const ParseOptions& options)
{
    JsonParser parser(text, options.max_depth);
    try {
        return ParseResult::success(parser.parse());
    } catch (const JsonSyntaxError& e) {
        ParseError err{Format::Json, describe_position(text, e.what(), e.pos())};
        detail::log_parse_failure("json", err.message());
        return ParseResult::failure(std::move(err));
    }
}

} // namespace confdiff
