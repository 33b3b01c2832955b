#include <shadertree/gfx/shader_source.hpp>

#include <algorithm>

namespace st::gfx {

auto is_shader_source(std::filesystem::path const& path) -> bool {
    auto ext = path.extension().string();
    return std::find(shader_source_extensions.begin(), shader_source_extensions.end(), ext)
        != shader_source_extensions.end();
}

auto find_shader_source(
    std::filesystem::path const& shader_root, codec::ModulePath const& module_path
) -> Option<std::filesystem::path> {
    if (module_path.is_root() || !module_path.is_valid()) { return {}; }

    auto base_path = shader_root / module_path.to_relative_path();
    for (auto ext : shader_source_extensions) {
        auto path = base_path;
        path += ext;
        std::error_code ec;
        if (std::filesystem::is_regular_file(path, ec)) {
            return path;
        }
    }
    return {};
}

}
