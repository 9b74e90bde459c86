// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file line_annotator.h
/// @brief Maps structural changes back onto the raw document lines.
///
/// Every input line is emitted as "<marker> <line>" where the marker is one of
///   ' '  unchanged
///   '-'  removed (source side only)
///   '+'  added (target side only)
///   '~'  modified
///
/// This is a text heuristic, not a line-to-node mapping. In the default
/// Substring mode a source line is marked '-' when it contains a fragment of
/// any Deletion path ("root", "server" or "port" for root.server.port),
/// otherwise '~' when it contains a fragment of a Modification path. The
/// target side works the same way with Additions. Lines can be over- or
/// under-marked when unrelated text contains a fragment (an XML <root> tag,
/// any line at all for an empty key) or a value spans several lines.
///
/// KeyAware mode only looks for the last key of each path, written the way
/// the document format writes keys ("port" / port: / <port>).

#pragma once

#include "confdiff_config.h"
#include "api.h"
#include "format.h"
#include "value_diff.h"

#include <string>
#include <vector>

namespace confdiff {

struct AnnotatedText {
    std::vector<std::string> source;
    std::vector<std::string> target;
};

enum class AnnotateMode : std::uint8_t {
    Substring,  ///< Any path fragment appearing anywhere in the line
    KeyAware    ///< Last path key in the format's key syntax
};

/// Line markers
namespace markers {
    inline constexpr char unchanged = ' ';
    inline constexpr char removed   = '-';
    inline constexpr char added     = '+';
    inline constexpr char modified  = '~';
}

[[nodiscard]] CONFDIFF_API AnnotatedText annotate(const std::string& source_text,
                                                  const std::string& target_text,
                                                  const ChangeList& changes,
                                                  AnnotateMode mode = AnnotateMode::Substring,
                                                  Format format = Format::Json);

/// Split on '\n' only; a trailing newline yields a final empty line
[[nodiscard]] CONFDIFF_API std::vector<std::string> split_lines(const std::string& text);

} // namespace confdiff
