#include <shadertree/build/publisher.hpp>

#include <cstdlib>
#include <fstream>

#include <fmt/format.h>
#include <toml++/toml.h>
#include <shadertree/runtime/logger.hpp>

namespace st::build {

namespace {

// Make treats spaces, `#` and `$` specially in prerequisites.
auto escape_make_path(std::string const& path) -> std::string {
    std::string escaped;
    escaped.reserve(path.size());
    for (auto ch : path) {
        if (ch == ' ' || ch == '#') {
            escaped += '\\';
        } else if (ch == '$') {
            escaped += '$';
        }
        escaped += ch;
    }
    return escaped;
}

}

auto set_environment_variable(char const* name, std::string const& value) -> bool {
#ifdef _WIN32
    return _putenv_s(name, value.c_str()) == 0;
#else
    return setenv(name, value.c_str(), 1) == 0;
#endif
}

auto EnvironmentPublisher::publish(BuildOutput const& output) -> Expected<void, BuildError> {
    auto root = output.shader_root.string();
    if (!set_environment_variable(root_path_env_var, root)) {
        return BuildError::io(output.shader_root, fmt::format("failed to set '{}'", root_path_env_var));
    }
    log::debug("build", "{}={}", root_path_env_var, root);

    auto out_dir = output.output_dir.string();
    if (auto host_out_dir = std::getenv(output_dir_env_var); host_out_dir && out_dir != host_out_dir) {
        log::warn("build", "'{}' is replaced by the output directory of this build '{}'", output_dir_env_var, out_dir);
    }
    if (!set_environment_variable(output_dir_env_var, out_dir)) {
        return BuildError::io(output.output_dir, fmt::format("failed to set '{}'", output_dir_env_var));
    }
    log::debug("build", "{}={}", output_dir_env_var, out_dir);
    return {};
}

ManifestPublisher::ManifestPublisher(std::filesystem::path manifest_path)
    : manifest_path_(std::move(manifest_path)) {}

auto ManifestPublisher::publish(BuildOutput const& output) -> Expected<void, BuildError> {
    toml::array artifacts{};
    for (auto const& artifact : output.artifacts) {
        artifacts.push_back(toml::table{
            {"module", artifact.module_path.to_string()},
            {"name", artifact.artifact_name},
            {"source", artifact.source_path.generic_string()},
            {"artifact", artifact.artifact_path.generic_string()},
        });
    }
    toml::table manifest{
        {"shader_root", output.shader_root.generic_string()},
        {"output_dir", output.output_dir.generic_string()},
    };
    manifest.insert("artifacts", std::move(artifacts));

    std::ofstream fout(manifest_path_, std::ios::trunc);
    if (!fout) {
        return BuildError::io(manifest_path_, "failed to open manifest file");
    }
    fout << manifest << '\n';
    if (!fout) {
        return BuildError::io(manifest_path_, "failed to write manifest file");
    }
    log::debug("build", "manifest written to '{}'", manifest_path_.generic_string());
    return {};
}

DepfilePublisher::DepfilePublisher(std::filesystem::path depfile_path, std::string target)
    : depfile_path_(std::move(depfile_path)), target_(std::move(target)) {}

auto DepfilePublisher::publish(BuildOutput const& output) -> Expected<void, BuildError> {
    std::ofstream fout(depfile_path_, std::ios::trunc);
    if (!fout) {
        return BuildError::io(depfile_path_, "failed to open depfile");
    }
    fout << escape_make_path(target_) << ':';
    for (auto const& file : output.touched_files) {
        fout << " \\\n  " << escape_make_path(file.generic_string());
    }
    fout << '\n';
    if (!fout) {
        return BuildError::io(depfile_path_, "failed to write depfile");
    }
    return {};
}

}
