#pragma once

#include <vector>

#include "../build/extension.hpp"

namespace st::ext {

struct SizeReportRow final {
    std::string name;
    size_t source_lines = 0;
    size_t built_lines = 0;
    size_t source_bytes = 0;
    size_t built_bytes = 0;
};

// Compares every shader source with its final artifact and logs a table when the build finishes.
// Register it last so it sees artifacts after all rewrites.
struct SizeReportExtension final : build::BuildExtension {
    auto name() const -> std::string_view override { return "size_report"; }

    auto init_root(std::filesystem::path const& shader_root, gfx::ShaderCompiler& compiler) -> build::ExtensionResult override;

    auto enter_module(std::filesystem::path const& dir_path) -> build::ExtensionResult override { return {}; }

    auto exit_module(std::filesystem::path const& dir_path) -> build::ExtensionResult override { return {}; }

    auto post_build(
        codec::ModulePath const& module_path,
        std::filesystem::path const& artifact_path,
        Option<gfx::SourceMap> const& source_map
    ) -> build::ExtensionResult override;

    auto exit_root(std::filesystem::path const& shader_root, gfx::ShaderCompiler const& compiler) -> build::ExtensionResult override;

    auto rows() const -> std::vector<SizeReportRow> const& { return rows_; }

    auto format_table() const -> std::string;

private:
    std::filesystem::path shader_root_;
    std::vector<SizeReportRow> rows_;
};

}
