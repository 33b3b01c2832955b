#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "compile_options.hpp"
#include "source_map.hpp"
#include "../codec/module_path.hpp"
#include "../prelude/idiom.hpp"
#include "../prelude/expected.hpp"

namespace st::gfx {

struct CompiledShader final {
    codec::ModulePath module_path;
    std::string source;
    Option<SourceMap> source_map;
    // The module's own file first, then every include that was read.
    std::vector<std::filesystem::path> visited_files;

    auto write_artifact(std::filesystem::path const& path) const -> Expected<void, std::string>;
};

struct ShaderCompiler final : PImpl<ShaderCompiler> {
    struct Impl;

    explicit ShaderCompiler(std::filesystem::path shader_root, CompileOptions options = {});
    ~ShaderCompiler();

    auto shader_root() const -> std::filesystem::path const&;

    auto options() -> CompileOptions&;
    auto options() const -> CompileOptions const&;

    // Resolves `module_path` to `<root>/<path>.wesl` or `.wgsl`, then expands its includes and macros.
    auto compile(codec::ModulePath const& module_path) const -> Expected<CompiledShader, std::string>;
};

}
