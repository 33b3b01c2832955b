#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "../codec/module_path.hpp"
#include "../gfx/source_map.hpp"
#include "../prelude/expected.hpp"

namespace st::gfx {

struct ShaderCompiler;

}

namespace st::build {

// The message is opaque to the build; it is reported together with the extension name.
using ExtensionResult = Expected<void, std::string>;

// A stateful observer of one build. For every lifecycle point, extensions are called one after
// another in registration order, and the first error stops the whole build.
//
// - `init_root` once, before anything is compiled. The compiler may be reconfigured here.
// - `enter_module` / `exit_module` around every directory below the shader root. The root itself
//   gets neither.
// - `post_build` once per compiled shader, after its artifact was written. An extension may
//   rewrite the artifact, and extensions registered later see the rewritten file.
// - `exit_root` once, after the whole tree was walked.
struct BuildExtension {
    virtual ~BuildExtension() = default;

    virtual auto name() const -> std::string_view = 0;

    virtual auto init_root(
        std::filesystem::path const& shader_root, gfx::ShaderCompiler& compiler
    ) -> ExtensionResult = 0;

    virtual auto enter_module(std::filesystem::path const& dir_path) -> ExtensionResult = 0;

    virtual auto exit_module(std::filesystem::path const& dir_path) -> ExtensionResult = 0;

    virtual auto post_build(
        codec::ModulePath const& module_path,
        std::filesystem::path const& artifact_path,
        Option<gfx::SourceMap> const& source_map
    ) -> ExtensionResult = 0;

    virtual auto exit_root(
        std::filesystem::path const& shader_root, gfx::ShaderCompiler const& compiler
    ) -> ExtensionResult {
        return {};
    }
};

}
