#pragma once

#include "../build/build.hpp"
#include "../build/publisher.hpp"
#include "../build/settings.hpp"

namespace st {

struct ProjectOptions final {
    char const* project_file = nullptr;
    // `-release` overrides `build.profile`.
    bool release = false;
    // `-verbose` logs at debug level.
    bool verbose = false;
};

auto parse_project_options(int argc, char** argv) -> ProjectOptions;

// Enabled extensions in the order bindings, minifier, size report.
auto make_extensions(build::BuildSettings const& settings) -> build::ExtensionRegistry;

auto make_publishers(build::BuildSettings const& settings) -> std::vector<Box<build::BuildPublisher>>;

// Prepares the output directory and runs one build as described by `settings`.
auto run_project(build::BuildSettings const& settings) -> Expected<build::BuildOutput, build::BuildError>;

// Entry point of the `shadertree` executable, returns the process exit code.
auto run_project_main(int argc, char** argv) -> int;

}
