#include <shadertree/build/settings.hpp>

#include <cstdint>
#include <cstdlib>

#include <fmt/format.h>
#include <toml++/toml.h>
#include <shadertree/build/publisher.hpp>
#include <shadertree/runtime/text_file.hpp>

namespace st::build {

namespace {

auto resolve_path(std::filesystem::path const& base_dir, std::string_view path) -> std::filesystem::path {
    std::filesystem::path p{path};
    if (p.is_relative()) {
        p = base_dir / p;
    }
    return p.lexically_normal();
}

auto define_value_to_string(toml::node const& node) -> Option<std::string> {
    switch (node.type()) {
        case toml::node_type::string:
            return std::string{*node.value<std::string_view>()};
        case toml::node_type::integer:
            return std::to_string(*node.value<int64_t>());
        case toml::node_type::boolean:
            return std::string{*node.value<bool>() ? "1" : "0"};
        default:
            return {};
    }
}

auto parse_settings(toml::table const& t, std::filesystem::path const& base_dir) -> Expected<BuildSettings, std::string> {
    BuildSettings settings{};

    auto build = t["build"];
    if (auto shader_root = build["shader_root"].value<std::string>(); shader_root) {
        settings.shader_root = resolve_path(base_dir, *shader_root);
    } else {
        return std::string{"'build.shader_root' is required"};
    }
    if (auto output_dir = build["output_dir"].value<std::string>(); output_dir) {
        settings.output_dir = resolve_path(base_dir, *output_dir);
    } else if (auto env_output_dir = std::getenv(output_dir_env_var); env_output_dir && *env_output_dir) {
        settings.output_dir = std::filesystem::path{env_output_dir}.lexically_normal();
    } else {
        return fmt::format("'build.output_dir' is required when '{}' is not set", output_dir_env_var);
    }
    settings.profile = build["profile"].value_or(settings.profile);
    if (auto manifest = build["manifest"].value<std::string>(); manifest) {
        settings.manifest_path = resolve_path(base_dir, *manifest);
    }
    if (auto depfile = build["depfile"].value<std::string>(); depfile) {
        settings.depfile_path = resolve_path(base_dir, *depfile);
    }
    settings.publish_environment = build["publish_environment"].value_or(settings.publish_environment);

    auto compile = t["compile"];
    settings.compile_options.use_sourcemap = compile["use_sourcemap"].value_or(settings.compile_options.use_sourcemap);
    if (auto defines = compile["defines"].as_table(); defines) {
        for (auto&& [key, node] : *defines) {
            auto value = define_value_to_string(node);
            if (!value) {
                return fmt::format("'compile.defines.{}' must be a string, an integer or a boolean", key.str());
            }
            settings.compile_options.defines.emplace(std::string{key.str()}, std::move(value).value());
        }
    }

    auto log_section = t["log"];
    if (auto level_str = log_section["level"].value<std::string>(); level_str) {
        auto level = rt::parse_log_level(*level_str);
        if (!level) {
            return fmt::format("'log.level' has unknown level '{}'", *level_str);
        }
        settings.log_level = level.value();
    }
    if (auto log_file = log_section["file"].value<std::string>(); log_file) {
        settings.log_file = resolve_path(base_dir, *log_file);
    }

    auto extensions = t["extensions"];
    auto bindings = extensions["bindings"];
    settings.bindings.enabled = bindings["enabled"].value_or(settings.bindings.enabled);
    if (auto output_dir = bindings["output_dir"].value<std::string>(); output_dir) {
        settings.bindings.output_dir = resolve_path(base_dir, *output_dir);
    } else if (settings.bindings.enabled) {
        return std::string{"'extensions.bindings.output_dir' is required when bindings are enabled"};
    }
    settings.bindings.root_namespace = bindings["namespace"].value_or(settings.bindings.root_namespace);
    settings.bindings.index_file = bindings["index_file"].value_or(settings.bindings.index_file);

    auto minifier = extensions["minifier"];
    settings.minifier.enabled = minifier["enabled"].value_or(settings.minifier.enabled);
    settings.minifier.release_only = minifier["release_only"].value_or(settings.minifier.release_only);

    settings.size_report.enabled = extensions["size_report"]["enabled"].value_or(settings.size_report.enabled);

    return settings;
}

}

auto BuildSettings::from_toml(std::string_view toml_str, std::filesystem::path const& base_dir)
    -> Expected<BuildSettings, std::string> {
    try {
        auto t = toml::parse(toml_str);
        return parse_settings(t, base_dir);
    } catch (toml::parse_error const& e) {
        return fmt::format(
            "{} (line {}, column {})", e.description(), e.source().begin.line, e.source().begin.column
        );
    }
}

auto BuildSettings::load(std::filesystem::path const& project_file) -> Expected<BuildSettings, std::string> {
    auto content = rt::read_text_file(project_file);
    if (!content) {
        return fmt::format("failed to read project file '{}'", project_file.generic_string());
    }
    auto result = from_toml(content.value(), project_file.parent_path());
    if (!result) {
        return fmt::format("{}: {}", project_file.generic_string(), result.error());
    }
    return result;
}

}
