#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>

namespace st::build {

enum class BuildErrorKind : uint8_t {
    io,
    path,
    compile,
    extension,
};

enum class LifecycleStage : uint8_t {
    init_root,
    enter_module,
    exit_module,
    post_build,
    exit_root,
};

struct BuildError final {
    BuildErrorKind kind = BuildErrorKind::io;
    std::string message;
    std::filesystem::path path;
    // Only set for `BuildErrorKind::extension`.
    std::string extension_name;
    LifecycleStage stage = LifecycleStage::init_root;

    static auto io(std::filesystem::path path, std::error_code const& ec) -> BuildError;
    static auto io(std::filesystem::path path, std::string message) -> BuildError;
    static auto invalid_path(std::filesystem::path path, std::string message) -> BuildError;
    static auto compile(std::filesystem::path path, std::string message) -> BuildError;
    static auto extension(std::string_view extension_name, LifecycleStage stage, std::string message) -> BuildError;

    auto to_string() const -> std::string;
};

auto to_string(LifecycleStage stage) -> std::string_view;

}
