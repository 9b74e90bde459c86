// line_annotator.cpp - per-line change markers

#include <confdiff/line_annotator.h>
#include <confdiff/adapter.h>

#include <algorithm>

namespace confdiff {

namespace {

using TokenList = std::vector<std::string>;

/// Local part of an XML qualified name ("{uri}local" -> "local")
std::string local_name(const std::string& key)
{
    if (!key.empty() && key.front() == '{') {
        if (auto close = key.find('}'); close != std::string::npos) {
            return key.substr(close + 1);
        }
    }
    return key;
}

void add_fragments(const ChangePath& path, TokenList& tokens)
{
    // Every fragment counts, the leading "root" and empty keys included
    for (auto& fragment : path.fragments()) {
        tokens.push_back(std::move(fragment));
    }
}

void add_key_tokens(const ChangePath& path, Format format, TokenList& tokens)
{
    const auto& elements = path.elements();

    // Walk back to the key that names the changed node in the document
    std::vector<std::string> keys;
    for (const auto& element : elements) {
        if (auto* key = std::get_if<std::string>(&element)) {
            keys.push_back(*key);
        }
    }
    if (keys.empty()) {
        return;
    }

    std::string key = keys.back();

    if (format == Format::Xml) {
        const bool is_attribute = keys.size() >= 2 && keys[keys.size() - 2] == xml_attributes_key;
        if (is_attribute) {
            tokens.push_back(local_name(key) + "=");
            return;
        }
        if ((key == xml_text_key || key == xml_attributes_key) && keys.size() >= 2) {
            key = keys[keys.size() - 2];
        }
        key = local_name(key);
        tokens.push_back("<" + key + ">");
        tokens.push_back("<" + key + " ");
        tokens.push_back("<" + key + "/");
        return;
    }

    if (format == Format::Yaml) {
        tokens.push_back(key + ":");
        return;
    }

    tokens.push_back("\"" + key + "\"");
}

struct LineMatcher {
    TokenList primary;    // '-' on the source side, '+' on the target side
    TokenList modified;   // '~'

    [[nodiscard]] static bool contains_any(const std::string& line, const TokenList& tokens) {
        return std::any_of(tokens.begin(), tokens.end(), [&](const std::string& token) {
            return line.find(token) != std::string::npos;
        });
    }

    [[nodiscard]] std::vector<std::string> mark(const std::string& text, char primary_marker) const {
        std::vector<std::string> result;
        for (const auto& line : split_lines(text)) {
            char marker = markers::unchanged;
            if (contains_any(line, primary)) {
                marker = primary_marker;
            } else if (contains_any(line, modified)) {
                marker = markers::modified;
            }
            std::string annotated;
            annotated.reserve(line.size() + 2);
            annotated += marker;
            annotated += ' ';
            annotated += line;
            result.push_back(std::move(annotated));
        }
        return result;
    }
};

} // anonymous namespace

std::vector<std::string> split_lines(const std::string& text)
{
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (true) {
        const auto pos = text.find('\n', start);
        if (pos == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return lines;
}

AnnotatedText annotate(const std::string& source_text,
                       const std::string& target_text,
                       const ChangeList& changes,
                       AnnotateMode mode,
                       Format format)
{
    LineMatcher source_matcher;
    LineMatcher target_matcher;

    auto collect = [&](const ChangePath& path, TokenList& tokens) {
        if (mode == AnnotateMode::KeyAware) {
            add_key_tokens(path, format, tokens);
        } else {
            add_fragments(path, tokens);
        }
    };

    for (const auto& change : changes) {
        switch (change.kind) {
            case ChangeRecord::Kind::Deletion:
                collect(change.path, source_matcher.primary);
                break;
            case ChangeRecord::Kind::Addition:
                collect(change.path, target_matcher.primary);
                break;
            case ChangeRecord::Kind::Modification:
                collect(change.path, source_matcher.modified);
                collect(change.path, target_matcher.modified);
                break;
        }
    }

    return AnnotatedText{source_matcher.mark(source_text, markers::removed),
                         target_matcher.mark(target_text, markers::added)};
}

} // namespace confdiff
