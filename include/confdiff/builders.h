// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Transient-based builders for O(n) construction of Value containers.
///
/// The format adapters build every Mapping and Sequence through these, so a
/// document is assembled without creating an intermediate persistent copy per
/// inserted key.
///
/// Usage:
/// @code
///   Value server = MapBuilder()
///       .set("host", "localhost")
///       .set("port", 8080)
///       .finish();
///
///   Value ports = VectorBuilder()
///       .push_back(80)
///       .push_back(443)
///       .finish();
/// @endcode

#pragma once

#include "value.h"

namespace confdiff {

/// Builder for an insertion-ordered value_map
template <typename MemoryPolicy>
class BasicMapBuilder {
public:
    using value_type   = BasicValue<MemoryPolicy>;
    using value_box    = BasicValueBox<MemoryPolicy>;
    using value_map    = BasicValueMap<MemoryPolicy>;
    using entry_type   = BasicMapEntry<MemoryPolicy>;
    using entries_type = typename value_map::entry_vector::transient_type;
    using index_type   = typename value_map::index_map::transient_type;

    BasicMapBuilder()
        : entries_(typename value_map::entry_vector{}.transient()),
          index_(typename value_map::index_map{}.transient()) {}

    explicit BasicMapBuilder(const value_map& existing)
        : entries_(existing.entries().transient()),
          index_(existing.index().transient()) {}

    BasicMapBuilder(BasicMapBuilder&&) noexcept = default;
    BasicMapBuilder& operator=(BasicMapBuilder&&) noexcept = default;

    // Copy operations (disabled - transient sharing is dangerous)
    BasicMapBuilder(const BasicMapBuilder&) = delete;
    BasicMapBuilder& operator=(const BasicMapBuilder&) = delete;

    /// Set a key. A key that is already present keeps its position and
    /// takes the new value.
    template <typename T>
    BasicMapBuilder& set(const std::string& key, T&& val) {
        return set(key, value_type{std::forward<T>(val)});
    }

    BasicMapBuilder& set(const std::string& key, value_type val) {
        if (auto* pos = index_.find(key)) {
            entries_.set(*pos, entry_type{key, value_box{std::move(val)}});
        } else {
            index_.set(key, entries_.size());
            entries_.push_back(entry_type{key, value_box{std::move(val)}});
        }
        return *this;
    }

    /// Set a key only if it is not present yet
    BasicMapBuilder& set_if_absent(const std::string& key, value_type val) {
        if (!contains(key)) {
            set(key, std::move(val));
        }
        return *this;
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        return index_.count(key) > 0;
    }

    [[nodiscard]] std::size_t size() const {
        return entries_.size();
    }

    /// Get a previously set value by key, or default_val if absent
    [[nodiscard]] value_type get(const std::string& key, value_type default_val = value_type{}) const {
        if (auto* pos = index_.find(key)) {
            return entries_[*pos].value.get();
        }
        return default_val;
    }

    /// Finish building and return the Value. The builder is left empty.
    [[nodiscard]] value_type finish() {
        value_map result{entries_.persistent(), index_.persistent()};
        entries_ = typename value_map::entry_vector{}.transient();
        index_   = typename value_map::index_map{}.transient();
        return value_type{std::move(result)};
    }

private:
    entries_type entries_;
    index_type   index_;
};

/// Builder for a value_vector
template <typename MemoryPolicy>
class BasicVectorBuilder {
public:
    using value_type     = BasicValue<MemoryPolicy>;
    using value_box      = BasicValueBox<MemoryPolicy>;
    using value_vector   = BasicValueVector<MemoryPolicy>;
    using transient_type = typename value_vector::transient_type;

    BasicVectorBuilder() : transient_(value_vector{}.transient()) {}
    explicit BasicVectorBuilder(const value_vector& existing) : transient_(existing.transient()) {}

    BasicVectorBuilder(BasicVectorBuilder&&) noexcept = default;
    BasicVectorBuilder& operator=(BasicVectorBuilder&&) noexcept = default;
    BasicVectorBuilder(const BasicVectorBuilder&) = delete;
    BasicVectorBuilder& operator=(const BasicVectorBuilder&) = delete;

    template <typename T>
    BasicVectorBuilder& push_back(T&& val) {
        transient_.push_back(value_box{value_type{std::forward<T>(val)}});
        return *this;
    }

    BasicVectorBuilder& push_back(value_type val) {
        transient_.push_back(value_box{std::move(val)});
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    [[nodiscard]] value_type finish() {
        value_type result{transient_.persistent()};
        transient_ = value_vector{}.transient();
        return result;
    }

private:
    transient_type transient_;
};

using MapBuilder    = BasicMapBuilder<value_memory_policy>;
using VectorBuilder = BasicVectorBuilder<value_memory_policy>;

extern template class BasicMapBuilder<value_memory_policy>;
extern template class BasicVectorBuilder<value_memory_policy>;

} // namespace confdiff
