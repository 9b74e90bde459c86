// compare.cpp - parse / diff / summarise / annotate pipeline

#include <confdiff/compare.h>
#include <confdiff/adapter.h>
#include <confdiff/log.h>

namespace confdiff {

namespace {

std::string strip(const std::string& text)
{
    constexpr std::string_view whitespace = " \t\n\r\f\v";
    const auto first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

CompareOutcome failed(CompareError error)
{
    return CompareOutcome{std::nullopt, std::move(error)};
}

} // anonymous namespace

CompareOutcome compare(const CompareRequest& request)
{
    const std::string source_text = strip(request.source_text);
    const std::string target_text = strip(request.target_text);

    ParseOptions parse_options;
    parse_options.max_depth      = request.max_depth;
    parse_options.xml_attributes = request.xml_attributes;

    ParseResult source = parse_document(request.format, source_text, parse_options);
    if (!source.ok()) {
        return failed(CompareError::from_parse_error(*source.error));
    }
    ParseResult target = parse_document(request.format, target_text, parse_options);
    if (!target.ok()) {
        return failed(CompareError::from_parse_error(*target.error));
    }

    CompareOptions options;
    options.ignore_keys   = request.ignore_keys;
    options.strict        = request.strict;
    options.sequence_mode = request.sequence_mode;
    options.max_depth     = request.max_depth;

    try {
        StructuralDiffer differ(std::move(options));
        differ.diff(source.value, target.value);

        CompareResult result;
        result.diff           = differ.take_changes();
        result.summary        = summarize(result.diff);
        result.formatted_diff = annotate(source_text, target_text, result.diff,
                                         request.annotate_mode, request.format);
        return CompareOutcome{std::move(result), std::nullopt};
    } catch (const InternalComparisonError& e) {
        detail::log_message("compare", e.what());
        return failed(CompareError::internal(e.what()));
    } catch (const std::exception& e) {
        detail::log_message("compare", e.what());
        return failed(CompareError::internal(std::string{"Comparison failed: "} + e.what()));
    }
}

} // namespace confdiff
