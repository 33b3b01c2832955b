#include <shadertree/ext/size_report.hpp>

#include <algorithm>

#include <fmt/format.h>
#include <shadertree/gfx/shader_source.hpp>
#include <shadertree/runtime/logger.hpp>
#include <shadertree/runtime/text_file.hpp>

namespace st::ext {

auto SizeReportExtension::init_root(
    std::filesystem::path const& shader_root, gfx::ShaderCompiler& compiler
) -> build::ExtensionResult {
    shader_root_ = shader_root;
    rows_.clear();
    return {};
}

auto SizeReportExtension::post_build(
    codec::ModulePath const& module_path,
    std::filesystem::path const& artifact_path,
    Option<gfx::SourceMap> const& source_map
) -> build::ExtensionResult {
    auto source_path = gfx::find_shader_source(shader_root_, module_path);
    if (!source_path) {
        return fmt::format("no source file for {}", module_path);
    }
    auto source = rt::read_text_file(source_path.value());
    if (!source) {
        return fmt::format("failed to read '{}'", source_path.value().generic_string());
    }
    auto built = rt::read_text_file(artifact_path);
    if (!built) {
        return fmt::format("failed to read '{}'", artifact_path.generic_string());
    }

    rows_.push_back(SizeReportRow{
        .name = module_path.to_string(),
        .source_lines = rt::count_lines(source.value()),
        .built_lines = rt::count_lines(built.value()),
        .source_bytes = source.value().size(),
        .built_bytes = built.value().size(),
    });
    return {};
}

auto SizeReportExtension::exit_root(
    std::filesystem::path const& shader_root, gfx::ShaderCompiler const& compiler
) -> build::ExtensionResult {
    log::info("extension", "shader sizes:\n{}", format_table());
    return {};
}

auto SizeReportExtension::format_table() const -> std::string {
    constexpr std::string_view name_header = "name";
    size_t name_width = name_header.size();
    for (auto const& row : rows_) {
        name_width = std::max(name_width, row.name.size());
    }

    auto table = fmt::format("{:<{}} | {:>12} | {:>11}\n", name_header, name_width, "source_lines", "built_lines");
    for (auto const& row : rows_) {
        table += fmt::format("{:<{}} | {:>12} | {:>11}\n", row.name, name_width, row.source_lines, row.built_lines);
    }
    return table;
}

}
