#pragma once

#include <compare>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "../prelude/option.hpp"

namespace st::codec {

enum class PathOrigin : uint8_t {
    absolute,
    package_relative,
};

// Hierarchical shader module identifier. A shader file `<root>/a/b.wesl` has path `package::a::b`.
struct ModulePath final {
    PathOrigin origin = PathOrigin::absolute;
    std::vector<std::string> components;

    ModulePath() = default;
    ModulePath(PathOrigin origin, std::vector<std::string> components);

    static auto root() -> ModulePath { return {}; }

    // Accepts `a::b`, `package::a::b` and `self::a::b`.
    static auto parse(std::string_view str) -> Option<ModulePath>;

    auto is_root() const -> bool { return components.empty(); }
    // Every component is non-empty.
    auto is_valid() const -> bool;

    auto last() const -> Option<std::string>;
    auto parent() const -> ModulePath;
    auto joined(std::string_view component) const -> ModulePath;

    auto to_string() const -> std::string;
    // `a/b` for `package::a::b`.
    auto to_relative_path() const -> std::filesystem::path;

    auto operator==(ModulePath const& rhs) const -> bool = default;
    auto operator<=>(ModulePath const& rhs) const = default;
};

}

template <>
struct fmt::formatter<st::codec::ModulePath> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(st::codec::ModulePath const& path, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(path.to_string(), ctx);
    }
};
