// change_path.cpp - ChangePath rendering and fragment helpers

#include <confdiff/change_path.h>

namespace confdiff {

ChangePath::ChangePath(std::initializer_list<std::string> keys)
{
    elements_.reserve(keys.size());
    for (const auto& key : keys) {
        elements_.emplace_back(key);
    }
}

std::string ChangePath::to_string() const
{
    return path_to_string(elements_);
}

std::vector<std::string> ChangePath::fragments() const
{
    const std::string rendered = to_string();

    std::vector<std::string> result;
    std::size_t start = 0;
    while (true) {
        const auto pos = rendered.find(path_separator, start);
        if (pos == std::string::npos) {
            result.push_back(rendered.substr(start));
            break;
        }
        result.push_back(rendered.substr(start, pos - start));
        start = pos + 1;
    }
    return result;
}

std::string ChangePath::last_key() const
{
    for (auto it = elements_.rbegin(); it != elements_.rend(); ++it) {
        if (auto* key = std::get_if<std::string>(&*it)) {
            return *key;
        }
    }
    return std::string{root_segment};
}

bool ChangePath::ends_with_key(std::string_view key) const
{
    if (elements_.empty()) {
        return false;
    }
    auto* last = std::get_if<std::string>(&elements_.back());
    return last && *last == key;
}

std::string path_to_string(const Path& path)
{
    std::string result{root_segment};
    for (const auto& elem : path) {
        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                result += path_separator;
                result += v;
            } else {
                result += "[" + std::to_string(v) + "]";
            }
        }, elem);
    }
    return result;
}

} // namespace confdiff
