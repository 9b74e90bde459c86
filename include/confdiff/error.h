// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file error.h
/// @brief Error kinds raised while comparing documents.
///
/// - ParseError: the text is not valid for its declared format ("fix your input")
/// - InternalComparisonError: the differ, summary or annotator failed ("tool defect")
/// - CompareError: the classified value returned to callers of compare(),
///   which also covers unsupported format names rejected at the boundary

#pragma once

#include "confdiff_config.h"
#include "api.h"
#include "format.h"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace confdiff {

class CONFDIFF_API ParseError : public std::runtime_error {
public:
    ParseError(Format format, std::string message);

    [[nodiscard]] Format format() const noexcept { return format_; }

    /// Underlying syntax problem without the "Invalid <FMT> format: " prefix
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

private:
    Format      format_;
    std::string message_;
};

class CONFDIFF_API InternalComparisonError : public std::runtime_error {
public:
    explicit InternalComparisonError(const std::string& message)
        : std::runtime_error("Comparison failed: " + message) {}
};

struct CONFDIFF_API CompareError {
    enum class Kind : std::uint8_t { Parse, UnsupportedFormat, Internal };

    Kind                  kind = Kind::Internal;
    std::optional<Format> format;   ///< Set for Parse errors
    std::string           message;  ///< Client-facing text

    [[nodiscard]] static CompareError from_parse_error(const ParseError& err);
    [[nodiscard]] static CompareError unsupported_format(std::string_view name);
    [[nodiscard]] static CompareError internal(std::string_view detail);

    /// True for errors caused by the caller's input (Parse, UnsupportedFormat)
    [[nodiscard]] bool is_input_error() const noexcept { return kind != Kind::Internal; }
};

/// "parse_error", "unsupported_format" or "internal_error"
[[nodiscard]] CONFDIFF_API std::string_view error_kind_name(CompareError::Kind kind) noexcept;

} // namespace confdiff
