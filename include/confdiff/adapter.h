// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file adapter.h
/// @brief Common contract of the format adapters.
///
/// Every adapter turns raw text into a Value tree:
/// @code
///   ParseResult parsed = parse_document(Format::Yaml, text);
///   if (!parsed.ok()) {
///       std::cerr << parsed.error->what() << "\n";  // "Invalid YAML format: ..."
///   }
/// @endcode
/// A failed parse never yields a partial tree.

#pragma once

#include "confdiff_config.h"
#include "api.h"
#include "error.h"
#include "format.h"
#include "value.h"

#include <optional>
#include <string>
#include <string_view>

namespace confdiff {

struct ParseOptions {
    /// Documents nested deeper than this are rejected with a ParseError
    std::size_t max_depth = CONFDIFF_DEFAULT_MAX_DEPTH;

    /// YAML only: upper bound on nodes after alias expansion
    std::size_t max_nodes = CONFDIFF_DEFAULT_MAX_NODES;

    /// XML only: fold element attributes into a reserved "@attrs" mapping
    bool xml_attributes = false;
};

struct ParseResult {
    Value                     value;
    std::optional<ParseError> error;

    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }

    [[nodiscard]] static ParseResult success(Value v) { return ParseResult{std::move(v), std::nullopt}; }
    [[nodiscard]] static ParseResult failure(ParseError err) { return ParseResult{Value{}, std::move(err)}; }
};

/// Reserved key holding an XML element's trimmed direct text
inline constexpr const char* xml_text_key = "text";

/// Reserved key holding an XML element's attributes (ParseOptions::xml_attributes)
inline constexpr const char* xml_attributes_key = "@attrs";

/// Dispatch to the adapter for @p format
[[nodiscard]] CONFDIFF_API ParseResult parse_document(Format format,
                                                      const std::string& text,
                                                      const ParseOptions& options = {});

namespace detail {

/// Value of a decimal literal that std::from_chars rejected as out of range:
/// signed zero when its magnitude is below 1, signed infinity otherwise
[[nodiscard]] CONFDIFF_API double out_of_range_double(std::string_view number) noexcept;

} // namespace detail

} // namespace confdiff
