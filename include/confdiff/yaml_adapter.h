// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file yaml_adapter.h
/// @brief YAML reader (yaml-cpp) producing Value trees.
///
/// Scalars are resolved with the YAML 1.1 rules of a safe loader:
/// - null:  ~, null, Null, NULL, empty
/// - bool:  true/false, yes/no, on/off (lower, Capitalised, UPPER)
/// - int:   123, -1_000, 0x1F, 017 (octal), 0b101, 1:30 (base 60)
/// - float: 1.5, 1., .5, 6.02e+23, .inf, -.Inf, .nan (1e3 is a string)
/// - everything else, and every quoted scalar, is a string
/// Explicit !!str, !!int, !!float, !!bool and !!null tags force the type;
/// !!timestamp and !!binary keep the scalar text; other tags are rejected.
///
/// Anchors and aliases are expanded; "<<" merge keys copy the entries of the
/// referenced mapping(s) unless the key is set explicitly. An empty document
/// is null; a stream with more than one document is an error.

#pragma once

#include "adapter.h"

namespace confdiff {

[[nodiscard]] CONFDIFF_API ParseResult parse_yaml(const std::string& text,
                                                  const ParseOptions& options = {});

} // namespace confdiff
