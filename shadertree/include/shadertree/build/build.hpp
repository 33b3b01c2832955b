#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "build_error.hpp"
#include "extension.hpp"
#include "../gfx/compile_options.hpp"
#include "../prelude/box.hpp"
#include "../prelude/span.hpp"

namespace st::build {

struct BuildPublisher;

struct ShaderBuildDesc final {
    std::filesystem::path shader_root;
    // Must exist already. An output directory inside the shader root is not walked.
    std::filesystem::path output_dir;
    gfx::CompileOptions compile_options{};
};

struct BuiltArtifact final {
    codec::ModulePath module_path;
    std::string artifact_name;
    std::filesystem::path source_path;
    std::filesystem::path artifact_path;
};

struct BuildOutput final {
    std::filesystem::path shader_root;
    std::filesystem::path output_dir;
    // In build order.
    std::vector<BuiltArtifact> artifacts;
    // Every file read by the compiler, without duplicates.
    std::vector<std::filesystem::path> touched_files;
};

using ExtensionRegistry = std::vector<Box<BuildExtension>>;

// Compiles every shader below `desc.shader_root` into `desc.output_dir` while driving `extensions`.
// In each directory all shader files are built before any subdirectory is entered; both are
// visited in name order. Publishers run after `exit_root` succeeded.
auto build_shader_dir(
    ShaderBuildDesc const& desc,
    Span<Box<BuildExtension>> extensions,
    Span<Box<BuildPublisher>> publishers = {}
) -> Expected<BuildOutput, BuildError>;

}
