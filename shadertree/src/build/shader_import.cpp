#include <shadertree/build/shader_import.hpp>

#include <cstdlib>

#include <fmt/format.h>
#include <shadertree/build/artifact.hpp>
#include <shadertree/build/publisher.hpp>
#include <shadertree/gfx/shader_source.hpp>
#include <shadertree/runtime/text_file.hpp>

namespace st::build {

namespace {

auto trim(std::string_view str) -> std::string_view {
    auto is_space = [](char ch) { return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r'; };
    while (!str.empty() && is_space(str.front())) { str.remove_prefix(1); }
    while (!str.empty() && is_space(str.back())) { str.remove_suffix(1); }
    return str;
}

auto get_env_path(char const* name) -> Option<std::filesystem::path> {
    auto value = std::getenv(name);
    if (!value || *value == '\0') { return {}; }
    return std::filesystem::path{value};
}

}

auto ImportContext::from_environment() -> Expected<ImportContext, ImportError> {
    auto shader_root = get_env_path(root_path_env_var);
    if (!shader_root) {
        return ImportError{
            .kind = ImportErrorKind::not_published,
            .message = fmt::format("'{}' is not set, the shaders have not been built", root_path_env_var),
        };
    }
    auto output_dir = get_env_path(output_dir_env_var);
    if (!output_dir) {
        return ImportError{
            .kind = ImportErrorKind::not_published,
            .message = fmt::format("'{}' is not set", output_dir_env_var),
        };
    }
    return ImportContext{
        .shader_root = std::move(shader_root).value(),
        .output_dir = std::move(output_dir).value(),
    };
}

auto resolve_shader_import(std::string_view import_path, ImportContext const& context)
    -> Expected<std::filesystem::path, ImportError> {
    import_path = trim(import_path);
    if (import_path.empty()) {
        return ImportError{
            .kind = ImportErrorKind::empty_path,
            .message = "expected a shader path like `a::b`",
        };
    }

    if (import_path == "package" || import_path.starts_with("package::")) {
        return ImportError{
            .kind = ImportErrorKind::redundant_package_prefix,
            .message = "shader paths are always relative to the shader root, remove the leading `package::`",
        };
    }
    auto module_path = codec::ModulePath::parse(import_path);
    if (!module_path || module_path.value().is_root() || module_path.value().origin != codec::PathOrigin::absolute) {
        return ImportError{
            .kind = ImportErrorKind::invalid_path,
            .message = fmt::format("`{}` is not a valid shader path", import_path),
        };
    }

    auto const& components = module_path.value().components;
    if (gfx::find_shader_source(context.shader_root, module_path.value())) {
        auto path = artifact_path_of(context.output_dir, module_path.value());
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            return ImportError{
                .kind = ImportErrorKind::not_built,
                .message = fmt::format("shader `{}` has no artifact at '{}'", import_path, path.generic_string()),
            };
        }
        return path;
    }

    std::error_code ec;
    if (std::filesystem::is_directory(context.shader_root / module_path.value().to_relative_path(), ec)) {
        return ImportError{
            .kind = ImportErrorKind::is_module,
            .message = fmt::format(
                "`{}` is a module not a shader file, add `::` and the shader in the module's name",
                import_path
            ),
            .existing_components = components.size(),
        };
    }

    // Points at the last component that does exist.
    size_t existing_components = 0;
    auto dir = context.shader_root;
    for (size_t i = 0; i + 1 < components.size(); i++) {
        dir /= components[i];
        if (!std::filesystem::is_directory(dir, ec)) { break; }
        existing_components = i + 1;
    }
    return ImportError{
        .kind = ImportErrorKind::not_found,
        .message = fmt::format("shader `{}` does not exist", import_path),
        .existing_components = existing_components,
    };
}

auto read_shader_import(std::string_view import_path, ImportContext const& context)
    -> Expected<std::string, ImportError> {
    auto path = resolve_shader_import(import_path, context);
    if (!path) { return std::move(path).error(); }
    auto content = rt::read_text_file(path.value());
    if (!content) {
        return ImportError{
            .kind = ImportErrorKind::not_built,
            .message = fmt::format("failed to read '{}'", path.value().generic_string()),
        };
    }
    return std::move(content).value();
}

}
