// value_diff.cpp - StructuralDiffer and deep equality

#include <confdiff/value_diff.h>
#include <confdiff/error.h>
#include <confdiff/log.h>

#include <algorithm>
#include <cmath>
#include <iostream>

namespace confdiff {

namespace {

std::string trim_copy(const std::string& text)
{
    constexpr std::string_view whitespace = " \t\n\r\f\v";
    const auto first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

bool sequences_equal(const ValueVector& a, const ValueVector& b, bool strict)
{
    if (a.size() != b.size()) {
        return false;
    }

    if (strict) {
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (&a[i].get() == &b[i].get()) continue;  // shared node
            if (!values_equal(a[i].get(), b[i].get(), true)) return false;
        }
        return true;
    }

    // Multiset comparison: every element of a claims one equal, unclaimed element of b
    std::vector<bool> claimed(b.size(), false);
    for (const auto& item : a) {
        bool matched = false;
        for (std::size_t j = 0; j < b.size(); ++j) {
            if (!claimed[j] && values_equal(item.get(), b[j].get(), false)) {
                claimed[j] = true;
                matched = true;
                break;
            }
        }
        if (!matched) return false;
    }
    return true;
}

bool maps_equal(const ValueMap& a, const ValueMap& b, bool strict)
{
    if (a.size() != b.size()) {
        return false;
    }
    for (const auto& entry : a) {
        auto* other = b.find(entry.key);
        if (!other) return false;
        if (&entry.value.get() == &other->get()) continue;
        if (!values_equal(entry.value.get(), other->get(), strict)) return false;
    }
    return true;
}

} // anonymous namespace

std::string_view change_kind_name(ChangeRecord::Kind kind) noexcept
{
    switch (kind) {
        case ChangeRecord::Kind::Addition:     return "addition";
        case ChangeRecord::Kind::Deletion:     return "deletion";
        case ChangeRecord::Kind::Modification: return "modification";
    }
    return "modification";
}

bool values_equal(const Value& a, const Value& b, bool strict)
{
    if (a.type_index() != b.type_index()) {
        return false;
    }

    return std::visit([&](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(b.data);

        if constexpr (std::is_same_v<T, ValueMap>) {
            return maps_equal(lhs, rhs, strict);
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return sequences_equal(lhs, rhs, strict);
        } else if constexpr (std::is_same_v<T, double>) {
            return lhs == rhs || (std::isnan(lhs) && std::isnan(rhs));
        } else if constexpr (std::is_same_v<T, std::monostate>) {
            return true;
        } else {
            return lhs == rhs;
        }
    }, a.data);
}

// ============================================================
// StructuralDiffer Implementation
// ============================================================

StructuralDiffer::StructuralDiffer(CompareOptions options)
    : options_(std::move(options))
{
    for (const auto& raw : options_.ignore_keys) {
        std::string entry = trim_copy(raw);
        if (entry.empty()) {
            continue;
        }
        if (entry.find(path_separator) == std::string::npos) {
            ignored_names_.push_back(std::move(entry));
            continue;
        }
        // Dotted entries address a full path, "root." is optional
        const std::string root_prefix = std::string{root_segment} + path_separator;
        if (entry.rfind(root_prefix, 0) != 0) {
            entry = root_prefix + entry;
        }
        ignored_paths_.push_back(std::move(entry));
    }
}

void StructuralDiffer::diff(const Value& source, const Value& target)
{
    changes_.clear();

    ChangePath root_path;
    diff_entry(source, target, root_path);

    detail::log_message("StructuralDiffer",
                        std::to_string(changes_.size()) + " change(s) collected");
}

ChangeList StructuralDiffer::take_changes()
{
    ChangeList result = std::move(changes_);
    changes_.clear();
    return result;
}

void StructuralDiffer::clear()
{
    changes_.clear();
}

void StructuralDiffer::print_changes() const
{
    if (changes_.empty()) {
        std::cout << "  (no changes)\n";
        return;
    }
    for (const auto& change : changes_) {
        std::string type_str;
        switch (change.kind) {
            case ChangeRecord::Kind::Addition:     type_str = "ADD   "; break;
            case ChangeRecord::Kind::Deletion:     type_str = "DELETE"; break;
            case ChangeRecord::Kind::Modification: type_str = "MODIFY"; break;
        }
        std::cout << "  " << type_str << " " << change.path.to_string();
        if (change.kind == ChangeRecord::Kind::Modification) {
            std::cout << ": " << value_to_string(*change.old_value) << " -> " << value_to_string(*change.new_value);
        } else if (change.kind == ChangeRecord::Kind::Addition) {
            std::cout << ": " << value_to_string(*change.new_value);
        } else {
            std::cout << ": " << value_to_string(*change.old_value);
        }
        std::cout << "\n";
    }
}

bool StructuralDiffer::is_ignored(const std::string& key, const ChangePath& path) const
{
    for (const auto& name : ignored_names_) {
        if (name == key) return true;
    }
    if (!ignored_paths_.empty()) {
        const std::string rendered = path.to_string();
        for (const auto& ignored : ignored_paths_) {
            if (ignored == rendered) return true;
        }
    }
    return false;
}

void StructuralDiffer::check_depth(const ChangePath& path) const
{
    if (path.depth() > options_.max_depth) {
        throw InternalComparisonError("maximum nesting depth of " + std::to_string(options_.max_depth) +
                                      " exceeded at " + path.to_string());
    }
}

void StructuralDiffer::diff_entry(const Value& source, const Value& target, ChangePath& current_path)
{
    if (values_equal(source, target, options_.strict)) {
        return;
    }

    if (auto* source_map = source.get_if<ValueMap>()) {
        if (auto* target_map = target.get_if<ValueMap>()) {
            diff_map(*source_map, *target_map, current_path);
            return;
        }
    }

    if (options_.sequence_mode == SequenceMode::ElementWise) {
        if (auto* source_vec = source.get_if<ValueVector>()) {
            if (auto* target_vec = target.get_if<ValueVector>()) {
                diff_sequence(*source_vec, *target_vec, current_path);
                return;
            }
        }
    }

    changes_.push_back(ChangeRecord::modification(current_path, source, target));
}

void StructuralDiffer::diff_map(const ValueMap& source, const ValueMap& target, ChangePath& current_path)
{
    check_depth(current_path);

    // Additions and modifications, in target order
    for (const auto& entry : target) {
        current_path.push_back(entry.key);
        if (is_ignored(entry.key, current_path)) {
            detail::log_key_skipped("diff_map", current_path.to_string(), "is ignored");
        } else if (auto* source_box = source.find(entry.key)) {
            diff_entry(source_box->get(), entry.value.get(), current_path);
        } else {
            changes_.push_back(ChangeRecord::addition(current_path, entry.value.get()));
        }
        current_path.pop_back();
    }

    // Deletions, in source order
    for (const auto& entry : source) {
        if (target.contains(entry.key)) {
            continue;
        }
        current_path.push_back(entry.key);
        if (!is_ignored(entry.key, current_path)) {
            changes_.push_back(ChangeRecord::deletion(current_path, entry.value.get()));
        }
        current_path.pop_back();
    }
}

void StructuralDiffer::diff_sequence(const ValueVector& source, const ValueVector& target, ChangePath& current_path)
{
    check_depth(current_path);

    const std::size_t common_size = std::min(source.size(), target.size());

    for (std::size_t i = 0; i < common_size; ++i) {
        const Value& old_item = source[i].get();
        const Value& new_item = target[i].get();
        if (values_equal(old_item, new_item, options_.strict)) {
            continue;
        }

        current_path.push_back(i);
        auto* old_map = old_item.get_if<ValueMap>();
        auto* new_map = new_item.get_if<ValueMap>();
        if (old_map && new_map) {
            diff_map(*old_map, *new_map, current_path);
        } else {
            changes_.push_back(ChangeRecord::modification(current_path, old_item, new_item));
        }
        current_path.pop_back();
    }

    // Extra target elements
    for (std::size_t i = common_size; i < target.size(); ++i) {
        current_path.push_back(i);
        changes_.push_back(ChangeRecord::addition(current_path, target[i].get()));
        current_path.pop_back();
    }

    // Extra source elements
    for (std::size_t i = common_size; i < source.size(); ++i) {
        current_path.push_back(i);
        changes_.push_back(ChangeRecord::deletion(current_path, source[i].get()));
        current_path.pop_back();
    }
}

ChangeList diff(const Value& source, const Value& target, const CompareOptions& options)
{
    StructuralDiffer differ(options);
    differ.diff(source, target);
    return differ.take_changes();
}

} // namespace confdiff
