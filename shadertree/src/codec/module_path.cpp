#include <shadertree/codec/module_path.hpp>

#include <algorithm>

namespace st::codec {

namespace {

constexpr std::string_view separator = "::";
constexpr std::string_view absolute_keyword = "package";
constexpr std::string_view relative_keyword = "self";

}

ModulePath::ModulePath(PathOrigin origin, std::vector<std::string> components)
    : origin(origin), components(std::move(components)) {}

auto ModulePath::parse(std::string_view str) -> Option<ModulePath> {
    std::vector<std::string> parts;
    while (true) {
        auto pos = str.find(separator);
        auto part = str.substr(0, pos);
        if (part.empty()) { return {}; }
        parts.emplace_back(part);
        if (pos == std::string_view::npos) { break; }
        str.remove_prefix(pos + separator.size());
    }

    auto origin = PathOrigin::absolute;
    if (parts.front() == absolute_keyword) {
        parts.erase(parts.begin());
    } else if (parts.front() == relative_keyword) {
        origin = PathOrigin::package_relative;
        parts.erase(parts.begin());
    }
    return ModulePath{origin, std::move(parts)};
}

auto ModulePath::is_valid() const -> bool {
    return std::none_of(components.begin(), components.end(), [](std::string const& c) { return c.empty(); });
}

auto ModulePath::last() const -> Option<std::string> {
    if (components.empty()) { return {}; }
    return components.back();
}

auto ModulePath::parent() const -> ModulePath {
    if (components.empty()) { return *this; }
    return ModulePath{origin, std::vector<std::string>(components.begin(), components.end() - 1)};
}

auto ModulePath::joined(std::string_view component) const -> ModulePath {
    auto path = *this;
    path.components.emplace_back(component);
    return path;
}

auto ModulePath::to_string() const -> std::string {
    std::string str{origin == PathOrigin::absolute ? absolute_keyword : relative_keyword};
    for (auto const& component : components) {
        str += separator;
        str += component;
    }
    return str;
}

auto ModulePath::to_relative_path() const -> std::filesystem::path {
    std::filesystem::path path{};
    for (auto const& component : components) {
        path /= component;
    }
    return path;
}

}
