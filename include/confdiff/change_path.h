// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file change_path.h
/// @brief Structural address of a change inside a document tree.
///
/// A ChangePath always starts at the implicit "root" segment. Map keys are
/// appended with '.', sequence indices (element-wise mode only) with "[i]":
///
///   root                  the document itself
///   root.server.port      key "port" inside mapping "server"
///   root.items[2]         third element of sequence "items"
///
/// The same traversal order is used for source and target, so equal
/// locations always render to identical strings.

#pragma once

#include "confdiff_config.h"
#include "api.h"

#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace confdiff {

using PathElement = std::variant<std::string, std::size_t>;
using Path        = std::vector<PathElement>;

/// Name of the implicit first segment of every ChangePath
inline constexpr std::string_view root_segment = "root";

/// Separator between key segments
inline constexpr char path_separator = '.';

class CONFDIFF_API ChangePath {
public:
    ChangePath() = default;
    explicit ChangePath(Path elements) : elements_(std::move(elements)) {}

    /// Build a path from key segments below root
    ChangePath(std::initializer_list<std::string> keys);

    [[nodiscard]] const Path& elements() const noexcept { return elements_; }
    [[nodiscard]] std::size_t depth() const noexcept { return elements_.size(); }
    [[nodiscard]] bool is_root() const noexcept { return elements_.empty(); }

    // push/pop pattern used during traversal to avoid copying paths
    void push_back(std::string key) { elements_.emplace_back(std::move(key)); }
    void push_back(std::size_t index) { elements_.emplace_back(index); }
    void pop_back() { elements_.pop_back(); }

    /// Dotted rendering, e.g. "root.server.port" or "root.items[2]"
    [[nodiscard]] std::string to_string() const;

    /// to_string() split on '.', e.g. {"root", "server", "port"}
    [[nodiscard]] std::vector<std::string> fragments() const;

    /// Last map key on the path ("port" for root.server.port, "items" for
    /// root.items[2]); "root" when the path has no key segment.
    [[nodiscard]] std::string last_key() const;

    /// True when the last segment is the map key @p key
    [[nodiscard]] bool ends_with_key(std::string_view key) const;

    bool operator==(const ChangePath& other) const = default;

private:
    Path elements_;
};

/// Convert Path to dot-notation string below root (e.g., "root.users[0].name")
[[nodiscard]] CONFDIFF_API std::string path_to_string(const Path& path);

} // namespace confdiff
