// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file xml_adapter.h
/// @brief XML reader (libxml2) producing Value trees.
///
/// Mapping rules:
/// - every element becomes a ValueMap; the root element's own tag is dropped
/// - text and CDATA before the first child element, trimmed, is stored under
///   "text" (dropped when empty)
/// - each child element is stored under its tag ("{uri}local" when namespaced)
/// - a repeated tag turns the entry into a ValueVector in document order
/// - attributes are ignored unless ParseOptions::xml_attributes is set, in
///   which case they are stored under "@attrs"
///
/// Example: <root><item>1</item><item>2</item></root>
///   -> {"item": [{"text": "1"}, {"text": "2"}]}
///
/// DTD loading, external entities and network access are disabled.

#pragma once

#include "adapter.h"

namespace confdiff {

[[nodiscard]] CONFDIFF_API ParseResult parse_xml(const std::string& text,
                                                 const ParseOptions& options = {});

} // namespace confdiff
