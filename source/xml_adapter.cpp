// xml_adapter.cpp - XML text to Value (libxml2)

#include <confdiff/xml_adapter.h>
#include <confdiff/builders.h>
#include <confdiff/log.h>

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace confdiff {

namespace {

struct DocDeleter {
    void operator()(xmlDoc* doc) const noexcept { xmlFreeDoc(doc); }
};

struct ParserCtxtDeleter {
    void operator()(xmlParserCtxt* ctxt) const noexcept { xmlFreeParserCtxt(ctxt); }
};

struct XmlCharDeleter {
    void operator()(xmlChar* str) const noexcept { xmlFree(str); }
};

using DocPtr       = std::unique_ptr<xmlDoc, DocDeleter>;
using ParserCtxtPtr = std::unique_ptr<xmlParserCtxt, ParserCtxtDeleter>;
using XmlCharPtr   = std::unique_ptr<xmlChar, XmlCharDeleter>;

constexpr int parse_flags = XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING;

void ensure_parser_initialized()
{
    static std::once_flag once;
    std::call_once(once, [] { xmlInitParser(); });
}

std::string_view as_view(const xmlChar* str)
{
    return str ? std::string_view{reinterpret_cast<const char*>(str)} : std::string_view{};
}

std::string trim(std::string_view text)
{
    constexpr std::string_view whitespace = " \t\n\r\f\v";
    const auto first = text.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(whitespace);
    return std::string{text.substr(first, last - first + 1)};
}

/// "{uri}local" for namespaced names, "local" otherwise
std::string qualified_name(const xmlChar* name, const xmlNs* ns)
{
    if (ns && ns->href) {
        return "{" + std::string{as_view(ns->href)} + "}" + std::string{as_view(name)};
    }
    return std::string{as_view(name)};
}

/// Text, CDATA and entity content that precedes the first child element
std::string leading_text(const xmlNode* element)
{
    std::string text;
    for (const xmlNode* child = element->children; child; child = child->next) {
        if (child->type == XML_ELEMENT_NODE) {
            break;
        }
        switch (child->type) {
            case XML_TEXT_NODE:
            case XML_CDATA_SECTION_NODE:
                text += as_view(child->content);
                break;
            case XML_ENTITY_REF_NODE: {
                XmlCharPtr content{xmlNodeGetContent(child)};
                text += as_view(content.get());
                break;
            }
            default:
                break;  // comments, processing instructions
        }
    }
    return trim(text);
}

std::string describe_error(const xmlError* error)
{
    if (!error || !error->message) {
        return "malformed document";
    }
    std::string message = trim(error->message);
    if (error->line > 0) {
        message += " (line " + std::to_string(error->line);
        if (error->int2 > 0) {
            message += ", column " + std::to_string(error->int2);
        }
        message += ")";
    }
    return message;
}

class XmlConverter {
public:
    explicit XmlConverter(const ParseOptions& options) : options_(options) {}

    Value convert(const xmlNode* element, std::size_t depth) const {
        if (depth > options_.max_depth) {
            throw ParseError{Format::Xml,
                             "maximum nesting depth of " + std::to_string(options_.max_depth) +
                             " exceeded (line " + std::to_string(xmlGetLineNo(element)) + ")"};
        }

        MapBuilder builder;

        if (auto text = leading_text(element); !text.empty()) {
            builder.set(xml_text_key, std::move(text));
        }

        if (options_.xml_attributes && element->properties) {
            MapBuilder attrs;
            for (const xmlAttr* attr = element->properties; attr; attr = attr->next) {
                XmlCharPtr content{xmlNodeListGetString(element->doc, attr->children, 1)};
                attrs.set(qualified_name(attr->name, attr->ns), std::string{as_view(content.get())});
            }
            builder.set(xml_attributes_key, attrs.finish());
        }

        for (const xmlNode* child = element->children; child; child = child->next) {
            if (child->type != XML_ELEMENT_NODE) {
                continue;
            }
            const std::string tag = qualified_name(child->name, child->ns);
            Value child_value = convert(child, depth + 1);

            if (!builder.contains(tag)) {
                builder.set(tag, std::move(child_value));
                continue;
            }

            // Repeated tag: promote the entry to a sequence in document order
            Value existing = builder.get(tag);
            ValueVector items;
            if (auto* vec = existing.get_if<ValueVector>()) {
                items = *vec;
            } else {
                items = items.push_back(ValueBox{std::move(existing)});
            }
            builder.set(tag, Value{items.push_back(ValueBox{std::move(child_value)})});
        }

        return builder.finish();
    }

private:
    const ParseOptions& options_;
};

} // anonymous namespace

ParseResult parse_xml(const std::string& text, const ParseOptions& options)
{
    ensure_parser_initialized();

    try {
        if (text.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
            throw ParseError{Format::Xml, "document exceeds " +
                                          std::to_string(std::numeric_limits<int>::max()) + " bytes"};
        }

        ParserCtxtPtr ctxt{xmlNewParserCtxt()};
        if (!ctxt) {
            throw ParseError{Format::Xml, "failed to allocate parser context"};
        }

        DocPtr doc{xmlCtxtReadMemory(ctxt.get(), text.data(), static_cast<int>(text.size()),
                                     nullptr, nullptr, parse_flags)};
        if (!doc) {
            throw ParseError{Format::Xml, describe_error(xmlCtxtGetLastError(ctxt.get()))};
        }

        const xmlNode* root = xmlDocGetRootElement(doc.get());
        if (!root) {
            throw ParseError{Format::Xml, "no root element"};
        }

        XmlConverter converter(options);
        return ParseResult::success(converter.convert(root, 0));
    } catch (const ParseError& e) {
        detail::log_parse_failure("xml", e.message());
        return ParseResult::failure(e);
    }
}

} // namespace confdiff
