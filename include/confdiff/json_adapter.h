// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file json_adapter.h
/// @brief JSON (RFC 8259) reader producing Value trees.
///
/// - objects become insertion-ordered ValueMaps; a repeated key keeps its
///   first position and takes the last value
/// - integers without fraction or exponent become int64_t (double when they
///   don't fit), all other numbers double
/// - content after the top-level value is an error
///
/// Error messages name the problem and its position, e.g.
/// "Expecting value: line 1 column 6 (char 5)".

#pragma once

#include "adapter.h"

namespace confdiff {

[[nodiscard]] CONFDIFF_API ParseResult parse_json(const std::string& text,
                                                  const ParseOptions& options = {});

} // namespace confdiff
