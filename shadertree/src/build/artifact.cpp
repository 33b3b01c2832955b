#include <shadertree/build/artifact.hpp>

#include <fmt/format.h>
#include <shadertree/codec/mangler.hpp>

namespace st::build {

auto artifact_name_of(codec::ModulePath const& module_path) -> std::string {
    return codec::mangle(module_path.parent(), module_path.last().value_or(""));
}

auto artifact_path(std::filesystem::path const& output_dir, std::string_view mangled_name) -> std::filesystem::path {
    return output_dir / fmt::format("{}.{}", mangled_name, artifact_extension);
}

auto artifact_path_of(std::filesystem::path const& output_dir, codec::ModulePath const& module_path)
    -> std::filesystem::path {
    return artifact_path(output_dir, artifact_name_of(module_path));
}

}
