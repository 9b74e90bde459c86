// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_diff.h
/// @brief Structural diff between two Value trees.
///
/// The differ walks both trees in lockstep starting at the root Mapping and
/// records one ChangeRecord per differing location:
///
/// - keys are visited in target order (additions and modifications), then the
///   keys only present in source are reported as deletions in source order
/// - nested Mappings are recursed into; every other unequal pair (scalars,
///   sequences, or a type change) is a single Modification
/// - with SequenceMode::ElementWise, unequal sequences are compared index by
///   index instead of being replaced as a whole
///
/// Usage:
/// @code
///   CompareOptions options;
///   options.ignore_keys = {"password"};
///   ChangeList changes = diff(source, target, options);
/// @endcode

#pragma once

#include "confdiff_config.h"
#include "api.h"
#include "change_path.h"
#include "value.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace confdiff {

struct ChangeRecord {
    enum class Kind : std::uint8_t { Addition, Deletion, Modification };

    Kind                 kind = Kind::Modification;
    ChangePath           path;
    std::optional<Value> old_value;  ///< Set for Deletion and Modification
    std::optional<Value> new_value;  ///< Set for Addition and Modification

    [[nodiscard]] static ChangeRecord addition(ChangePath path, Value new_value) {
        return ChangeRecord{Kind::Addition, std::move(path), std::nullopt, std::move(new_value)};
    }

    [[nodiscard]] static ChangeRecord deletion(ChangePath path, Value old_value) {
        return ChangeRecord{Kind::Deletion, std::move(path), std::move(old_value), std::nullopt};
    }

    [[nodiscard]] static ChangeRecord modification(ChangePath path, Value old_value, Value new_value) {
        return ChangeRecord{Kind::Modification, std::move(path), std::move(old_value), std::move(new_value)};
    }
};

using ChangeList = std::vector<ChangeRecord>;

/// "addition", "deletion" or "modification"
[[nodiscard]] CONFDIFF_API std::string_view change_kind_name(ChangeRecord::Kind kind) noexcept;

enum class SequenceMode : std::uint8_t {
    Whole,        ///< An unequal sequence is one Modification
    ElementWise   ///< Unequal sequences are diffed per index ("root.items[2]")
};

struct CompareOptions {
    /// Key names ("password") or dotted paths ("server.port", "root.server.port")
    /// that are skipped entirely
    std::vector<std::string> ignore_keys;

    /// false: sequences compare as unordered multisets
    bool strict = true;

    SequenceMode sequence_mode = SequenceMode::Whole;

    /// Deeper trees raise InternalComparisonError
    std::size_t max_depth = CONFDIFF_DEFAULT_MAX_DEPTH;
};

// ============================================================
// StructuralDiffer - collects the diff as a flat list of ChangeRecord
// ============================================================

class CONFDIFF_API StructuralDiffer {
public:
    StructuralDiffer() = default;
    explicit StructuralDiffer(CompareOptions options);

    /// Compute the diff; previous results are discarded.
    /// @throws InternalComparisonError when the trees exceed max_depth
    void diff(const Value& source, const Value& target);

    [[nodiscard]] const ChangeList& get_changes() const { return changes_; }

    /// Move the collected changes out, leaving the differ empty
    [[nodiscard]] ChangeList take_changes();

    [[nodiscard]] bool has_changes() const { return !changes_.empty(); }
    [[nodiscard]] const CompareOptions& options() const noexcept { return options_; }

    void clear();

    /// Print the collected changes to stdout
    void print_changes() const;

private:
    CompareOptions           options_;
    std::vector<std::string> ignored_names_;
    std::vector<std::string> ignored_paths_;
    ChangeList               changes_;

    [[nodiscard]] bool is_ignored(const std::string& key, const ChangePath& path) const;
    void check_depth(const ChangePath& path) const;

    void diff_map(const ValueMap& source, const ValueMap& target, ChangePath& current_path);
    void diff_entry(const Value& source, const Value& target, ChangePath& current_path);
    void diff_sequence(const ValueVector& source, const ValueVector& target, ChangePath& current_path);
};

/// Deep equality as used by the differ. Mapping key order never matters;
/// with @p strict false sequences compare as multisets. NaN equals NaN.
[[nodiscard]] CONFDIFF_API bool values_equal(const Value& a, const Value& b, bool strict = true);

/// Convenience wrapper around StructuralDiffer
[[nodiscard]] CONFDIFF_API ChangeList diff(const Value& source,
                                           const Value& target,
                                           const CompareOptions& options = {});

} // namespace confdiff
