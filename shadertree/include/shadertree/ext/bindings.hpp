#pragma once

#include <fstream>
#include <map>
#include <set>
#include <vector>

#include "binding_generator.hpp"
#include "../build/extension.hpp"
#include "../prelude/box.hpp"

namespace st::ext {

struct BindingsOptions final {
    std::string root_namespace = "shaders";
    std::string index_file = "mod.hpp";
    BindingOptions generator_options{};
};

// Generates one C++ header per shader into a directory tree mirroring the shader tree. Every
// directory gets an index header that includes the headers of its shaders, then the indices of its
// subdirectories.
//
// A shader `a.wesl` and a directory `a/` share the namespace `a`. Names that would clash with the
// declarations of a header, or with a sibling that maps to the same identifier, get a `_` suffix.
//
// Register it before extensions that rewrite artifacts (e.g. the minifier) so the embedded source
// is the readable one.
struct BindingsExtension final : build::BuildExtension {
    BindingsExtension(
        std::filesystem::path binding_root,
        BindingsOptions options = {},
        Box<BindingGenerator> generator = Box<CppBindingGenerator>::make()
    );

    auto name() const -> std::string_view override { return "bindings"; }

    auto init_root(std::filesystem::path const& shader_root, gfx::ShaderCompiler& compiler) -> build::ExtensionResult override;

    auto enter_module(std::filesystem::path const& dir_path) -> build::ExtensionResult override;

    auto exit_module(std::filesystem::path const& dir_path) -> build::ExtensionResult override;

    auto post_build(
        codec::ModulePath const& module_path,
        std::filesystem::path const& artifact_path,
        Option<gfx::SourceMap> const& source_map
    ) -> build::ExtensionResult override;

    auto exit_root(std::filesystem::path const& shader_root, gfx::ShaderCompiler const& compiler) -> build::ExtensionResult override;

private:
    // Owns the index file of one directory while it is being walked.
    struct ModuleFrame final {
        std::filesystem::path dir;
        std::string cpp_namespace;
        std::ofstream index;
        // file stem or directory name -> namespace identifier
        std::map<std::string, std::string> identifiers{};
        std::set<std::string> taken{};

        auto child_namespace(std::string const& name) -> std::string;
    };

    auto push_frame(std::filesystem::path dir, std::string cpp_namespace) -> build::ExtensionResult;
    auto pop_frame() -> build::ExtensionResult;

    std::filesystem::path binding_root_;
    BindingsOptions options_;
    Box<BindingGenerator> generator_;
    std::vector<ModuleFrame> frames_;
};

}
