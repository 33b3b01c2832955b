#pragma once

#include "build.hpp"

namespace st::build {

inline constexpr char const* root_path_env_var = "SHADERTREE_ROOT_PATH";
inline constexpr char const* output_dir_env_var = "SHADERTREE_OUT_DIR";

// Receives the result of a successful build.
struct BuildPublisher {
    virtual ~BuildPublisher() = default;

    virtual auto name() const -> std::string_view = 0;

    virtual auto publish(BuildOutput const& output) -> Expected<void, BuildError> = 0;
};

// Sets `SHADERTREE_ROOT_PATH` and `SHADERTREE_OUT_DIR` to the shader root and output directory of
// the build, so that shader imports can be resolved later in this process and in the processes it
// spawns. A `SHADERTREE_OUT_DIR` the host set to another directory is replaced.
struct EnvironmentPublisher final : BuildPublisher {
    auto name() const -> std::string_view override { return "environment"; }

    auto publish(BuildOutput const& output) -> Expected<void, BuildError> override;
};

// Writes a TOML list of the built artifacts.
struct ManifestPublisher final : BuildPublisher {
    explicit ManifestPublisher(std::filesystem::path manifest_path);

    auto name() const -> std::string_view override { return "manifest"; }

    auto publish(BuildOutput const& output) -> Expected<void, BuildError> override;

private:
    std::filesystem::path manifest_path_;
};

// Writes a Make rule `<target>: <touched files...>` so that the hosting build system reruns the
// build when any shader or include changes.
struct DepfilePublisher final : BuildPublisher {
    DepfilePublisher(std::filesystem::path depfile_path, std::string target);

    auto name() const -> std::string_view override { return "depfile"; }

    auto publish(BuildOutput const& output) -> Expected<void, BuildError> override;

private:
    std::filesystem::path depfile_path_;
    std::string target_;
};

auto set_environment_variable(char const* name, std::string const& value) -> bool;

}
