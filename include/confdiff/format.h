// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file format.h
/// @brief Document format identifiers, lookup and detection.

#pragma once

#include "confdiff_config.h"
#include "api.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace confdiff {

enum class Format : std::uint8_t { Json, Yaml, Xml };

/// Lowercase wire name: "json", "yaml", "xml"
[[nodiscard]] CONFDIFF_API std::string_view format_name(Format format) noexcept;

/// Display name used in error messages: "JSON", "YAML", "XML"
[[nodiscard]] CONFDIFF_API std::string_view format_display_name(Format format) noexcept;

/// Case-insensitive lookup of a wire name ("JSON", "yaml", "Xml", ...).
/// "yml" is accepted as an alias of "yaml".
/// @return std::nullopt for anything else
[[nodiscard]] CONFDIFF_API std::optional<Format> parse_format(std::string_view name);

/// Guess the format of a document.
///
/// The file extension wins when it is one of .json, .xml, .yaml or .yml
/// (case-insensitive). Otherwise the trimmed content is sniffed: {...} or
/// [...] that parses as JSON is JSON, text starting with '<' and containing
/// '>' is XML, everything else is YAML.
[[nodiscard]] CONFDIFF_API Format detect_format(std::string_view content,
                                                std::string_view filename = {});

/// @return true when the adapter for @p format accepts @p content
[[nodiscard]] CONFDIFF_API bool validate_format(const std::string& content, Format format);

} // namespace confdiff
