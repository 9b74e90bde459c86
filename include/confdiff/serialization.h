// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief JSON output for Value trees and comparison results.
///
/// Usage:
/// @code
///   std::string json = to_json(value, false);     // pretty-printed
///   std::string body = to_json(*outcome.result);  // response document
/// @endcode
///
/// Response document layout:
/// @code
///   {
///     "summary": {"additions": 1, "deletions": 0, "modifications": 1},
///     "diff": [
///       {"path": "root.b", "change_type": "modification", "old_value": 2, "new_value": 3},
///       {"path": "root.c", "change_type": "addition", "new_value": 4}
///     ],
///     "formatted_diff": {"source": ["  {..."], "target": ["~ {..."]}
///   }
/// @endcode
/// Errors serialise as {"error": "parse_error", "format": "json", "detail": "..."}.
///
/// Non-finite doubles are written as NaN / Infinity / -Infinity, which the
/// JSON adapter reads back.

#pragma once

#include "api.h"
#include "compare.h"
#include "value.h"

#include <string>

namespace confdiff {

/// Serialize a Value tree; Mapping keys keep their insertion order
[[nodiscard]] CONFDIFF_API std::string to_json(const Value& val, bool compact = false);

[[nodiscard]] CONFDIFF_API std::string to_json(const CompareResult& result, bool compact = false);

[[nodiscard]] CONFDIFF_API std::string to_json(const CompareError& error, bool compact = false);

/// Value tree form of the response document (see above)
[[nodiscard]] CONFDIFF_API Value result_to_value(const CompareResult& result);

/// Shortest round-trip text of a double; integral values keep a ".0"
[[nodiscard]] CONFDIFF_API std::string format_double(double value);

} // namespace confdiff
