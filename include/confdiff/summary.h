// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file summary.h
/// @brief Per-kind tally of a change list.

#pragma once

#include "confdiff_config.h"
#include "api.h"
#include "value_diff.h"

#include <cstddef>

namespace confdiff {

struct Summary {
    std::size_t additions     = 0;
    std::size_t deletions     = 0;
    std::size_t modifications = 0;

    [[nodiscard]] std::size_t total() const noexcept { return additions + deletions + modifications; }
    [[nodiscard]] bool empty() const noexcept { return total() == 0; }

    bool operator==(const Summary& other) const = default;
};

[[nodiscard]] CONFDIFF_API Summary summarize(const ChangeList& changes) noexcept;

} // namespace confdiff
