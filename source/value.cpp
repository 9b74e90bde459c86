// value.cpp - Value type utilities

#include <confdiff/value.h>
#include <confdiff/builders.h>
#include <confdiff/serialization.h>

#include <iostream>

namespace confdiff {

std::string value_to_string(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            return format_double(arg);
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return "{map:" + std::to_string(arg.size()) + "}";
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return "[vector:" + std::to_string(arg.size()) + "]";
        } else {
            return "null";
        }
    }, val.data);
}

std::string_view value_type_name(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string_view {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, int64_t>) {
            return "int";
        } else if constexpr (std::is_same_v<T, double>) {
            return "double";
        } else if constexpr (std::is_same_v<T, bool>) {
            return "bool";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "string";
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return "map";
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return "vector";
        } else {
            return "null";
        }
    }, val.data);
}

void print_value(const Value& val, const std::string& prefix, std::size_t depth)
{
    std::visit(
        [&](auto&& arg) {
            using T = std::decay_t<decltype(arg)>;

            if constexpr (std::is_same_v<T, std::string>) {
                std::cout << std::string(depth * 2, ' ') << prefix << arg << "\n";
            } else if constexpr (std::is_same_v<T, bool>) {
                std::cout << std::string(depth * 2, ' ') << prefix
                          << (arg ? "true" : "false") << "\n";
            } else if constexpr (std::is_same_v<T, int64_t>) {
                std::cout << std::string(depth * 2, ' ') << prefix << arg << "\n";
            } else if constexpr (std::is_same_v<T, double>) {
                std::cout << std::string(depth * 2, ' ') << prefix << format_double(arg) << "\n";
            } else if constexpr (std::is_same_v<T, ValueMap>) {
                for (const auto& entry : arg) {
                    std::cout << std::string(depth * 2, ' ') << prefix << entry.key << ":\n";
                    print_value(entry.value.get(), "", depth + 1);
                }
            } else if constexpr (std::is_same_v<T, ValueVector>) {
                for (std::size_t i = 0; i < arg.size(); ++i) {
                    std::cout << std::string(depth * 2, ' ') << prefix << "["
                              << i << "]:\n";
                    print_value(arg[i].get(), "", depth + 1);
                }
            } else if constexpr (std::is_same_v<T, std::monostate>) {
                std::cout << std::string(depth * 2, ' ') << prefix << "null\n";
            }
        },
        val.data);
}

// ============================================================
// Explicit Template Instantiations
//
// Matches the 'extern template' declarations in value.h and builders.h.
// ============================================================

template struct BasicValue<value_memory_policy>;
template class BasicValueMap<value_memory_policy>;
template class BasicMapBuilder<value_memory_policy>;
template class BasicVectorBuilder<value_memory_policy>;

} // namespace confdiff
