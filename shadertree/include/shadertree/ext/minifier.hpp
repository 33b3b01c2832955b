#pragma once

#include <cstdint>

#include "../build/extension.hpp"

namespace st::ext {

struct MinifyError final {
    std::string message;
    uint32_t line = 0;
};

// Drops comments and every whitespace that does not separate two tokens.
auto minify_wgsl(std::string_view source) -> Expected<std::string, MinifyError>;

struct MinifierOptions final {
    // Only minify when `profile` is "release".
    bool release_only = true;
    std::string profile = "debug";
};

// Replaces each artifact with its minified form. Register it after extensions that embed the
// shader source and before extensions that measure the final artifacts.
struct MinifierExtension final : build::BuildExtension {
    explicit MinifierExtension(MinifierOptions options = {});

    auto name() const -> std::string_view override { return "minifier"; }

    auto init_root(std::filesystem::path const& shader_root, gfx::ShaderCompiler& compiler) -> build::ExtensionResult override;

    auto enter_module(std::filesystem::path const& dir_path) -> build::ExtensionResult override { return {}; }

    auto exit_module(std::filesystem::path const& dir_path) -> build::ExtensionResult override { return {}; }

    auto post_build(
        codec::ModulePath const& module_path,
        std::filesystem::path const& artifact_path,
        Option<gfx::SourceMap> const& source_map
    ) -> build::ExtensionResult override;

    auto enabled() const -> bool;

private:
    MinifierOptions options_;
};

}
