// error.cpp - ParseError and CompareError construction

#include <confdiff/error.h>

namespace confdiff {

ParseError::ParseError(Format format, std::string message)
    : std::runtime_error("Invalid " + std::string{format_display_name(format)} + " format: " + message),
      format_(format),
      message_(std::move(message))
{
}

CompareError CompareError::from_parse_error(const ParseError& err)
{
    return CompareError{Kind::Parse, err.format(), err.what()};
}

CompareError CompareError::unsupported_format(std::string_view name)
{
    return CompareError{Kind::UnsupportedFormat, std::nullopt,
                        "Unsupported format: " + std::string{name}};
}

CompareError CompareError::internal(std::string_view detail)
{
    return CompareError{Kind::Internal, std::nullopt, std::string{detail}};
}

std::string_view error_kind_name(CompareError::Kind kind) noexcept
{
    switch (kind) {
        case CompareError::Kind::Parse:             return "parse_error";
        case CompareError::Kind::UnsupportedFormat: return "unsupported_format";
        case CompareError::Kind::Internal:          return "internal_error";
    }
    return "internal_error";
}

} // namespace confdiff
