#include <shadertree/ext/bindings.hpp>

#include <algorithm>
#include <cstdlib>
#include <iterator>

#include <fmt/format.h>
#include <shadertree/gfx/shader_compiler.hpp>
#include <shadertree/runtime/logger.hpp>
#include <shadertree/runtime/text_file.hpp>

namespace st::ext {

namespace {

constexpr std::string_view generated_header_notice = "// Generated by shadertree. Do not edit.\n";

// Declared by every shader header, so no child namespace may take these names.
constexpr std::string_view header_declarations[]{
    "module_path", "artifact_name", "source", "EntryPoint", "entry_points", "decl",
};

// `#include "..."` has no escapes.
auto is_includable(std::string_view name) -> bool {
    return name.find_first_of("\"\\\n\r") == std::string_view::npos;
}

auto shorten_home(std::string path) -> std::string {
    auto home = std::getenv("HOME");
    if (home && *home && path.starts_with(home)) {
        path.replace(0, std::string_view{home}.size(), "~");
    }
    return path;
}

// `file:line` of the shader line that produced `line` of the artifact.
auto locate_error(
    CodegenError const& error,
    std::filesystem::path const& artifact_path,
    Option<gfx::SourceMap> const& source_map
) -> std::string {
    if (source_map && error.line != 0) {
        if (auto location = source_map.value().lookup(error.line); location) {
            return fmt::format("{}:{}", location.value().file, location.value().line);
        }
    }
    if (error.line != 0) {
        return fmt::format("{}:{}", shorten_home(artifact_path.generic_string()), error.line);
    }
    return shorten_home(artifact_path.generic_string());
}

}

BindingsExtension::BindingsExtension(
    std::filesystem::path binding_root, BindingsOptions options, Box<BindingGenerator> generator
) : binding_root_(std::move(binding_root)), options_(std::move(options)), generator_(std::move(generator)) {}

auto BindingsExtension::init_root(
    std::filesystem::path const& shader_root, gfx::ShaderCompiler& compiler
) -> build::ExtensionResult {
    compiler.options().use_sourcemap = true;
    frames_.clear();
    log::debug("extension", "bindings for '{}' go to '{}'",
        shader_root.generic_string(), binding_root_.generic_string());
    return push_frame(binding_root_, options_.root_namespace);
}

auto BindingsExtension::enter_module(std::filesystem::path const& dir_path) -> build::ExtensionResult {
    if (frames_.empty()) {
        return std::string{"entered a module before the shader root was initialized"};
    }
    auto dir_name = dir_path.filename().string();
    if (!is_includable(dir_name)) {
        return fmt::format("directory name '{}' cannot be used in an #include", dir_name);
    }
    auto& parent = frames_.back();
    parent.index << fmt::format("#include \"{}/{}\"\n", dir_name, options_.index_file);
    auto cpp_namespace = fmt::format("{}::{}", parent.cpp_namespace, parent.child_namespace(dir_name));
    return push_frame(parent.dir / dir_name, std::move(cpp_namespace));
}

auto BindingsExtension::exit_module(std::filesystem::path const& dir_path) -> build::ExtensionResult {
    if (frames_.size() <= 1) {
        return fmt::format("exited module '{}' that was never entered", dir_path.generic_string());
    }
    return pop_frame();
}

auto BindingsExtension::post_build(
    codec::ModulePath const& module_path,
    std::filesystem::path const& artifact_path,
    Option<gfx::SourceMap> const& source_map
) -> build::ExtensionResult {
    if (frames_.empty()) {
        return std::string{"built a shader before the shader root was initialized"};
    }
    auto source = rt::read_text_file(artifact_path);
    if (!source) {
        return fmt::format("failed to read '{}'", shorten_home(artifact_path.generic_string()));
    }

    auto artifact_name = artifact_path.stem().string();
    auto generated = generator_->generate(
        source.value(), artifact_name, options_.generator_options, demangle_declaration
    );
    if (!generated) {
        return fmt::format(
            "{}: {}", locate_error(generated.error(), artifact_path, source_map), generated.error().message
        );
    }

    auto& frame = frames_.back();
    auto stem = module_path.last().value_or(artifact_name);
    auto header_name = fmt::format("{}.hpp", stem);
    if (header_name == options_.index_file) {
        return fmt::format("bindings of {} would replace the index file '{}'", module_path, header_name);
    }
    if (!is_includable(header_name)) {
        return fmt::format("bindings of {} cannot be used in an #include", module_path);
    }

    auto namespace_name = fmt::format("{}::{}", frame.cpp_namespace, frame.child_namespace(stem));
    auto header = fmt::format(
        "{}"
        "#pragma once\n"
        "\n"
        "#include <array>\n"
        "#include <string_view>\n"
        "\n"
        "namespace {} {{\n"
        "\n"
        "inline constexpr std::string_view module_path = \"{}\";\n"
        "inline constexpr std::string_view artifact_name = \"{}\";\n"
        "\n"
        "{}"
        "\n"
        "}} // namespace {}\n",
        generated_header_notice, namespace_name, module_path.to_string(), artifact_name,
        generated.value(), namespace_name
    );

    auto header_path = frame.dir / header_name;
    if (!rt::write_text_file(header_path, header)) {
        return fmt::format("failed to write '{}'", shorten_home(header_path.generic_string()));
    }
    frame.index << fmt::format("#include \"{}\"\n", header_name);
    if (!frame.index) {
        return fmt::format("failed to write '{}'", shorten_home((frame.dir / options_.index_file).generic_string()));
    }
    log::debug("extension", "bindings of {} written to '{}'", module_path, header_path.generic_string());
    return {};
}

auto BindingsExtension::exit_root(
    std::filesystem::path const& shader_root, gfx::ShaderCompiler const& compiler
) -> build::ExtensionResult {
    if (frames_.size() != 1) {
        return fmt::format("{} module(s) were entered but never exited", frames_.empty() ? 0 : frames_.size() - 1);
    }
    return pop_frame();
}

auto BindingsExtension::ModuleFrame::child_namespace(std::string const& name) -> std::string {
    if (auto it = identifiers.find(name); it != identifiers.end()) {
        return it->second;
    }
    auto id = to_cpp_identifier(name);
    if (std::find(std::begin(header_declarations), std::end(header_declarations), id) != std::end(header_declarations)) {
        id += '_';
    }
    while (taken.contains(id)) {
        id += '_';
    }
    taken.insert(id);
    identifiers.emplace(name, id);
    return id;
}

auto BindingsExtension::push_frame(std::filesystem::path dir, std::string cpp_namespace) -> build::ExtensionResult {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return fmt::format("failed to create '{}': {}", shorten_home(dir.generic_string()), ec.message());
    }
    auto index_path = dir / options_.index_file;
    std::ofstream index(index_path, std::ios::trunc);
    if (!index) {
        return fmt::format("failed to open '{}'", shorten_home(index_path.generic_string()));
    }
    index << generated_header_notice << "#pragma once\n\n";
    frames_.push_back(ModuleFrame{
        .dir = std::move(dir),
        .cpp_namespace = std::move(cpp_namespace),
        .index = std::move(index),
    });
    return {};
}

// Only the innermost index is closed. The parent's index stays open so that the rest of the
// parent directory can still be appended to it.
auto BindingsExtension::pop_frame() -> build::ExtensionResult {
    auto& frame = frames_.back();
    frame.index.flush();
    auto ok = static_cast<bool>(frame.index);
    auto index_path = frame.dir / options_.index_file;
    frames_.pop_back();
    if (!ok) {
        return fmt::format("failed to write '{}'", shorten_home(index_path.generic_string()));
    }
    return {};
}

}
