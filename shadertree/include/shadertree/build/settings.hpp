#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "../gfx/compile_options.hpp"
#include "../prelude/expected.hpp"
#include "../runtime/logger_manager.hpp"

namespace st::build {

struct BindingsSettings final {
    bool enabled = false;
    std::filesystem::path output_dir;
    std::string root_namespace = "shaders";
    std::string index_file = "mod.hpp";
};

struct MinifierSettings final {
    bool enabled = false;
    bool release_only = true;
};

struct SizeReportSettings final {
    bool enabled = false;
};

// Contents of a project file. Relative paths are resolved against the directory of the file.
struct BuildSettings final {
    std::filesystem::path shader_root;
    std::filesystem::path output_dir;
    std::string profile = "debug";
    Option<std::filesystem::path> manifest_path;
    Option<std::filesystem::path> depfile_path;
    bool publish_environment = true;

    gfx::CompileOptions compile_options;

    rt::LogLevel log_level = rt::LogLevel::info;
    Option<std::filesystem::path> log_file;

    BindingsSettings bindings;
    MinifierSettings minifier;
    SizeReportSettings size_report;

    static auto from_toml(std::string_view toml_str, std::filesystem::path const& base_dir)
        -> Expected<BuildSettings, std::string>;

    static auto load(std::filesystem::path const& project_file) -> Expected<BuildSettings, std::string>;
};

}
