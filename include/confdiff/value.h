// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Canonical tree type shared by the JSON, YAML and XML adapters.
///
/// A Value is one of:
/// - Scalar: int64_t, double, bool, std::string or null (std::monostate)
/// - Mapping: insertion-ordered map of unique string keys (ValueMap)
/// - Sequence: ordered list of values (ValueVector)
///
/// Containers are immer persistent structures, so copying a Value (or a
/// subtree into a ChangeRecord) only bumps a reference count.
///
/// Integer and floating scalars are distinct alternatives: Value{1} and
/// Value{1.0} compare unequal, matching JSON/YAML native typing.

#pragma once

#include "confdiff_config.h"
#include "api.h"

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <concepts>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace confdiff {

// Forward declaration
template <typename MemoryPolicy>
struct BasicValue;

template <typename MemoryPolicy>
using BasicValueBox = immer::box<BasicValue<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueVector = immer::vector<BasicValueBox<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
struct BasicMapEntry {
    std::string key;
    BasicValueBox<MemoryPolicy> value;

    bool operator==(const BasicMapEntry& other) const {
        return key == other.key && value == other.value;
    }
};

// ============================================================
// BasicValueMap - insertion-ordered persistent map
//
// Entries live in an immer::vector in first-insertion order; an immer::map
// indexes key -> position. Setting an existing key replaces its value in
// place, so the key keeps its original position.
// ============================================================

template <typename MemoryPolicy>
class BasicValueMap {
public:
    using value_box      = BasicValueBox<MemoryPolicy>;
    using entry_type     = BasicMapEntry<MemoryPolicy>;
    using entry_vector   = immer::vector<entry_type, MemoryPolicy>;
    using index_map      = immer::map<std::string, std::size_t,
                                      std::hash<std::string>,
                                      std::equal_to<std::string>,
                                      MemoryPolicy>;
    using const_iterator = typename entry_vector::const_iterator;

    BasicValueMap() = default;
    BasicValueMap(entry_vector entries, index_map index)
        : entries_(std::move(entries)), index_(std::move(index)) {}

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    [[nodiscard]] const_iterator begin() const { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const { return entries_.end(); }

    [[nodiscard]] const entry_type& entry_at(std::size_t pos) const { return entries_[pos]; }

    /// @return Pointer to the boxed value, or nullptr when the key is absent
    [[nodiscard]] const value_box* find(const std::string& key) const {
        if (auto* pos = index_.find(key)) {
            return &entries_[*pos].value;
        }
        return nullptr;
    }

    [[nodiscard]] std::size_t count(const std::string& key) const { return index_.count(key); }
    [[nodiscard]] bool contains(const std::string& key) const { return count(key) > 0; }

    /// Persistent update: returns a new map, this one is unchanged
    [[nodiscard]] BasicValueMap set(const std::string& key, value_box val) const {
        if (auto* pos = index_.find(key)) {
            return BasicValueMap{entries_.set(*pos, entry_type{key, std::move(val)}), index_};
        }
        return BasicValueMap{entries_.push_back(entry_type{key, std::move(val)}),
                             index_.set(key, entries_.size())};
    }

    [[nodiscard]] const entry_vector& entries() const noexcept { return entries_; }
    [[nodiscard]] const index_map& index() const noexcept { return index_; }

    /// Structural equality: same key set, equal values. Key order is ignored.
    friend bool operator==(const BasicValueMap& a, const BasicValueMap& b) {
        if (a.size() != b.size()) return false;
        for (const auto& entry : a.entries_) {
            auto* other = b.find(entry.key);
            if (!other || !(*other == entry.value)) return false;
        }
        return true;
    }

private:
    entry_vector entries_;
    index_map    index_;
};

/// Coarse shape of a node, as seen by the differ and annotator
enum class NodeKind : std::uint8_t { Scalar, Mapping, Sequence };

template <typename MemoryPolicy = immer::default_memory_policy>
struct BasicValue
{
    using memory_policy = MemoryPolicy;
    using value_box     = BasicValueBox<MemoryPolicy>;
    using value_map     = BasicValueMap<MemoryPolicy>;
    using value_vector  = BasicValueVector<MemoryPolicy>;
    using map_entry     = BasicMapEntry<MemoryPolicy>;

    std::variant<int64_t,
                 double,
                 bool,
                 std::string,
                 value_map,
                 value_vector,
                 std::monostate>
        data;

    constexpr BasicValue() noexcept : data(std::monostate{}) {}

    template <std::integral T>
        requires (!std::same_as<T, bool>)
    constexpr BasicValue(T v) noexcept : data(static_cast<int64_t>(v)) {}

    template <std::floating_point T>
    constexpr BasicValue(T v) noexcept : data(static_cast<double>(v)) {}

    constexpr BasicValue(bool v) noexcept : data(v) {}
    BasicValue(const std::string& v) : data(v) {}
    BasicValue(std::string&& v) noexcept : data(std::move(v)) {}
    BasicValue(const char* v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(std::string_view v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(value_map v) : data(std::move(v)) {}
    BasicValue(value_vector v) : data(std::move(v)) {}

    // Factory functions for container types
    static BasicValue map(std::initializer_list<std::pair<std::string, BasicValue>> init) {
        auto entries = typename value_map::entry_vector{}.transient();
        auto index   = typename value_map::index_map{}.transient();
        for (const auto& [key, val] : init) {
            if (auto* pos = index.find(key)) {
                entries.set(*pos, map_entry{key, value_box{val}});
            } else {
                index.set(key, entries.size());
                entries.push_back(map_entry{key, value_box{val}});
            }
        }
        return BasicValue{value_map{entries.persistent(), index.persistent()}};
    }

    static BasicValue vector(std::initializer_list<BasicValue> init) {
        auto t = value_vector{}.transient();
        for (const auto& val : init) {
            t.push_back(value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] std::size_t type_index() const noexcept { return data.index(); }
    [[nodiscard]] bool is_null() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_int() const noexcept { return is<int64_t>(); }
    [[nodiscard]] bool is_double() const noexcept { return is<double>(); }
    [[nodiscard]] bool is_number() const noexcept { return is_int() || is_double(); }
    [[nodiscard]] bool is_bool() const noexcept { return is<bool>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_map() const noexcept { return is<value_map>(); }
    [[nodiscard]] bool is_vector() const noexcept { return is<value_vector>(); }

    [[nodiscard]] NodeKind kind() const noexcept {
        if (is_map()) return NodeKind::Mapping;
        if (is_vector()) return NodeKind::Sequence;
        return NodeKind::Scalar;
    }

    [[nodiscard]] BasicValue at(const std::string& key) const {
        if (auto* m = get_if<value_map>()) {
            if (auto* found = m->find(key)) return found->get();
        }
        return BasicValue{};
    }

    [[nodiscard]] BasicValue at(std::size_t index) const {
        if (auto* v = get_if<value_vector>()) {
            if (index < v->size()) return (*v)[index].get();
        }
        return BasicValue{};
    }

    [[nodiscard]] int64_t as_int(int64_t default_val = 0) const {
        if (auto* p = get_if<int64_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_double(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        return default_val;
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] value_map as_map(value_map default_val = {}) const {
        if (auto* p = get_if<value_map>()) return *p;
        return default_val;
    }

    [[nodiscard]] value_vector as_vector(value_vector default_val = {}) const {
        if (auto* p = get_if<value_vector>()) return *p;
        return default_val;
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        if (auto* m = get_if<value_map>()) return m->contains(key);
        return false;
    }

    [[nodiscard]] std::size_t size() const {
        if (auto* m = get_if<value_map>()) return m->size();
        if (auto* v = get_if<value_vector>()) return v->size();
        return 0;
    }
};

// ============================================================
// Memory Policy
//
// Comparisons run concurrently on independent threads, and immer's
// free-list heaps are process-wide, so trees use the default policy
// (atomic refcounts, thread-safe free list).
// ============================================================

using value_memory_policy = immer::default_memory_policy;

using Value       = BasicValue<value_memory_policy>;
using ValueBox    = BasicValueBox<value_memory_policy>;
using ValueMap    = BasicValueMap<value_memory_policy>;
using ValueVector = BasicValueVector<value_memory_policy>;
using MapEntry    = BasicMapEntry<value_memory_policy>;

/// Deep structural equality (Mapping key order ignored, Sequence order kept)
template <typename MemoryPolicy>
bool operator==(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    return a.data == b.data;
}

// ============================================================
// Utility functions
// ============================================================

/// Short human-readable rendering ("42", "\"on\"", "{map:3}", "[vector:2]")
[[nodiscard]] CONFDIFF_API std::string value_to_string(const Value& val);

/// Name of the stored alternative ("int", "double", "bool", "string", "map", "vector", "null")
[[nodiscard]] CONFDIFF_API std::string_view value_type_name(const Value& val);

/// Print Value with indentation to stdout
CONFDIFF_API void print_value(const Value& val, const std::string& prefix = "", std::size_t depth = 0);

// ============================================================
// Extern Template Declarations
// ============================================================

extern template struct BasicValue<value_memory_policy>;
extern template class BasicValueMap<value_memory_policy>;

} // namespace confdiff
