#include <shadertree/build/build.hpp>

#include <algorithm>
#include <set>

#include <fmt/format.h>

#include <shadertree/build/artifact.hpp>
#include <shadertree/build/publisher.hpp>
#include <shadertree/gfx/shader_compiler.hpp>
#include <shadertree/gfx/shader_source.hpp>
#include <shadertree/runtime/logger.hpp>

namespace st::build {

namespace {

struct DirListing final {
    std::vector<std::filesystem::path> files;
    std::vector<std::filesystem::path> dirs;
};

auto by_file_name(std::filesystem::path const& lhs, std::filesystem::path const& rhs) -> bool {
    return lhs.filename() < rhs.filename();
}

auto list_dir(std::filesystem::path const& dir) -> Expected<DirListing, BuildError> {
    std::error_code ec;
    std::filesystem::directory_iterator it{dir, ec};
    if (ec) { return BuildError::io(dir, ec); }

    DirListing listing{};
    for (; it != std::filesystem::directory_iterator{}; it.increment(ec)) {
        auto const& entry = *it;
        // Symlinks are resolved here so that a dangling one is skipped instead of failing the build.
        std::error_code status_ec;
        auto status = entry.symlink_status(status_ec);
        if (!status_ec && std::filesystem::is_symlink(status)) {
            status = entry.status(status_ec);
        }
        if (status_ec || !std::filesystem::exists(status)) {
            log::warn("build", "skip unreadable entry '{}'", entry.path().generic_string());
            continue;
        }

        if (std::filesystem::is_directory(status)) {
            listing.dirs.push_back(entry.path());
        } else if (std::filesystem::is_regular_file(status) && gfx::is_shader_source(entry.path())) {
            listing.files.push_back(entry.path());
        }
    }
    if (ec) { return BuildError::io(dir, ec); }

    std::sort(listing.files.begin(), listing.files.end(), by_file_name);
    std::sort(listing.dirs.begin(), listing.dirs.end(), by_file_name);
    return listing;
}

// `<root>/a/b.wesl` is `package::a::b`.
auto derive_module_path(
    std::filesystem::path const& shader_root, std::filesystem::path const& file_path
) -> Expected<codec::ModulePath, BuildError> {
    auto rel_path = file_path.lexically_relative(shader_root);
    if (rel_path.empty() || *rel_path.begin() == "..") {
        return BuildError::invalid_path(
            file_path, fmt::format("not inside the shader root '{}'", shader_root.generic_string())
        );
    }

    codec::ModulePath module_path{};
    for (auto const& dir : rel_path.parent_path()) {
        auto component = dir.string();
        if (component.empty() || component == ".") { continue; }
        module_path.components.push_back(std::move(component));
    }
    auto stem = rel_path.stem().string();
    if (stem.empty()) {
        return BuildError::invalid_path(file_path, "shader file has an empty name");
    }
    module_path.components.push_back(std::move(stem));
    return module_path;
}

struct TraversalCursor final {
    TraversalCursor(
        ShaderBuildDesc const& desc, gfx::ShaderCompiler const& compiler, Span<Box<BuildExtension>> extensions
    ) : desc(desc), compiler(compiler), extensions(extensions) {
        output.shader_root = desc.shader_root;
        output.output_dir = desc.output_dir;
    }

    template <typename F>
    auto run_hook(LifecycleStage stage, F&& hook) -> Expected<void, BuildError> {
        for (auto& extension : extensions) {
            if (auto result = hook(*extension); !result) {
                return BuildError::extension(extension->name(), stage, std::move(result).error());
            }
        }
        return {};
    }

    auto process_dir(std::filesystem::path const& dir) -> Expected<void, BuildError> {
        auto listing = list_dir(dir);
        if (!listing) { return std::move(listing).error(); }

        std::set<std::string> built_stems{};
        for (auto const& file : listing.value().files) {
            auto stem = file.stem().string();
            if (!built_stems.insert(stem).second) {
                log::warn("build", "'{}' is skipped, '{}' names the same module",
                    file.generic_string(), (dir / stem).generic_string());
                continue;
            }
            if (auto result = process_file(file); !result) { return result; }
        }

        for (auto const& sub_dir : listing.value().dirs) {
            if (is_output_dir(sub_dir)) {
                log::debug("build", "skip output directory '{}'", sub_dir.generic_string());
                continue;
            }
            if (!mark_visited(sub_dir)) {
                log::warn("build", "skip '{}', its directory was already walked", sub_dir.generic_string());
                continue;
            }
            if (auto result = run_hook(LifecycleStage::enter_module, [&sub_dir](BuildExtension& ext) {
                return ext.enter_module(sub_dir);
            }); !result) {
                return result;
            }
            if (auto result = process_dir(sub_dir); !result) { return result; }
            if (auto result = run_hook(LifecycleStage::exit_module, [&sub_dir](BuildExtension& ext) {
                return ext.exit_module(sub_dir);
            }); !result) {
                return result;
            }
        }
        return {};
    }

    auto process_file(std::filesystem::path const& file) -> Expected<void, BuildError> {
        auto module_path = derive_module_path(desc.shader_root, file);
        if (!module_path) { return std::move(module_path).error(); }

        auto compiled = compiler.compile(module_path.value());
        if (!compiled) { return BuildError::compile(file, std::move(compiled).error()); }
        for (auto const& visited : compiled.value().visited_files) {
            touch_file(visited);
        }

        auto artifact_name = artifact_name_of(module_path.value());
        auto path = artifact_path(desc.output_dir, artifact_name);
        if (auto name_size = path.filename().native().size(); name_size > max_artifact_file_name) {
            return BuildError::invalid_path(file, fmt::format(
                "artifact name of {} is {} bytes, over the {} byte file name limit",
                module_path.value(), name_size, max_artifact_file_name
            ));
        }
        if (auto written = compiled.value().write_artifact(path); !written) {
            return BuildError::io(path, std::move(written).error());
        }
        log::info("build", "built: {}", module_path.value());

        auto const& source_map = compiled.value().source_map;
        if (auto result = run_hook(LifecycleStage::post_build, [&](BuildExtension& ext) {
            return ext.post_build(module_path.value(), path, source_map);
        }); !result) {
            return result;
        }

        output.artifacts.push_back(BuiltArtifact{
            .module_path = std::move(module_path).value(),
            .artifact_name = std::move(artifact_name),
            .source_path = file,
            .artifact_path = std::move(path),
        });
        return {};
    }

    auto touch_file(std::filesystem::path const& path) -> void {
        if (std::find(output.touched_files.begin(), output.touched_files.end(), path) != output.touched_files.end()) {
            return;
        }
        log::debug("build", "touched '{}'", path.generic_string());
        output.touched_files.push_back(path);
    }

    // A directory reached twice through symlinks is walked only the first time.
    auto mark_visited(std::filesystem::path const& dir) -> bool {
        std::error_code ec;
        auto canonical_dir = std::filesystem::canonical(dir, ec);
        if (ec) { return false; }
        return visited_dirs.insert(std::move(canonical_dir)).second;
    }

    auto is_output_dir(std::filesystem::path const& dir) const -> bool {
        std::error_code ec;
        return std::filesystem::equivalent(dir, desc.output_dir, ec) && !ec;
    }

    ShaderBuildDesc const& desc;
    gfx::ShaderCompiler const& compiler;
    Span<Box<BuildExtension>> extensions;
    std::set<std::filesystem::path> visited_dirs;
    BuildOutput output;
};

} // namespace

auto build_shader_dir(
    ShaderBuildDesc const& desc,
    Span<Box<BuildExtension>> extensions,
    Span<Box<BuildPublisher>> publishers
) -> Expected<BuildOutput, BuildError> {
    std::error_code ec;
    if (!std::filesystem::is_directory(desc.shader_root, ec)) {
        return BuildError::invalid_path(desc.shader_root, "shader root is not a directory");
    }

    gfx::ShaderCompiler compiler{desc.shader_root, desc.compile_options};
    for (auto& extension : extensions) {
        if (auto result = extension->init_root(desc.shader_root, compiler); !result) {
            return BuildError::extension(extension->name(), LifecycleStage::init_root, std::move(result).error());
        }
    }

    TraversalCursor cursor{desc, compiler, extensions};
    cursor.mark_visited(desc.shader_root);
    if (auto result = cursor.process_dir(desc.shader_root); !result) {
        return std::move(result).error();
    }

    if (auto result = cursor.run_hook(LifecycleStage::exit_root, [&](BuildExtension& ext) {
        return ext.exit_root(desc.shader_root, compiler);
    }); !result) {
        return std::move(result).error();
    }
    log::info("build", "{} shader(s) built into '{}'", cursor.output.artifacts.size(), desc.output_dir.generic_string());

    for (auto& publisher : publishers) {
        if (auto result = publisher->publish(cursor.output); !result) {
            auto error = std::move(result).error();
            error.message = fmt::format("publisher '{}': {}", publisher->name(), error.message);
            return error;
        }
    }
    return std::move(cursor.output);
}

}
