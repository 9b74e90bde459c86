// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file compare.h
/// @brief One-call pipeline: parse both documents, diff, summarise, annotate.
///
/// Usage:
/// @code
///   CompareRequest request;
///   request.source_text = R"({"a":1,"b":2})";
///   request.target_text = R"({"a":1,"b":3,"c":4})";
///   request.format      = Format::Json;
///
///   CompareOutcome outcome = compare(request);
///   if (outcome.ok()) {
///       std::cout << outcome.result->summary.modifications << "\n";  // 1
///   } else {
///       std::cerr << outcome.error->message << "\n";
///   }
/// @endcode
///
/// A comparison is all-or-nothing: when either document fails to parse no
/// diff is computed and only the error is returned.

#pragma once

#include "confdiff_config.h"
#include "api.h"
#include "error.h"
#include "format.h"
#include "line_annotator.h"
#include "summary.h"
#include "value_diff.h"

#include <optional>
#include <string>
#include <vector>

namespace confdiff {

struct CompareRequest {
    std::string              source_text;
    std::string              target_text;
    Format                   format = Format::Json;
    std::vector<std::string> ignore_keys;
    bool                     strict = true;

    SequenceMode sequence_mode  = SequenceMode::Whole;
    AnnotateMode annotate_mode  = AnnotateMode::Substring;
    bool         xml_attributes = false;
    std::size_t  max_depth      = CONFDIFF_DEFAULT_MAX_DEPTH;
};

struct CompareResult {
    Summary       summary;
    ChangeList    diff;
    AnnotatedText formatted_diff;
};

struct CompareOutcome {
    std::optional<CompareResult> result;
    std::optional<CompareError>  error;

    [[nodiscard]] bool ok() const noexcept { return result.has_value(); }
};

/// Run the whole pipeline. Never throws for bad input; parse failures come
/// back as CompareError::Kind::Parse and differ failures as Kind::Internal.
[[nodiscard]] CONFDIFF_API CompareOutcome compare(const CompareRequest& request);

} // namespace confdiff
