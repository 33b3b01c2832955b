#pragma once

#include <array>
#include <filesystem>
#include <string_view>

#include "../codec/module_path.hpp"

namespace st::gfx {

// In lookup order. When both exist for one module, the `.wesl` source form is used.
inline constexpr std::array<std::string_view, 2> shader_source_extensions{".wesl", ".wgsl"};

auto is_shader_source(std::filesystem::path const& path) -> bool;

auto find_shader_source(
    std::filesystem::path const& shader_root, codec::ModulePath const& module_path
) -> Option<std::filesystem::path>;

}
