#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "../prelude/expected.hpp"

namespace st::build {

enum class ImportErrorKind : uint8_t {
    empty_path,
    redundant_package_prefix,
    invalid_path,
    not_published,
    is_module,
    not_found,
    not_built,
};

struct ImportError final {
    ImportErrorKind kind;
    std::string message;
    // Number of leading components that exist below the shader root, for `not_found`.
    size_t existing_components = 0;
};

struct ImportContext final {
    std::filesystem::path shader_root;
    std::filesystem::path output_dir;

    // `SHADERTREE_ROOT_PATH` and `SHADERTREE_OUT_DIR` as published by a build, or set by the host.
    static auto from_environment() -> Expected<ImportContext, ImportError>;
};

// Maps `a::b` to the artifact of `<shader_root>/a/b.wesl`. The `package::` prefix is implied and
// must not be written.
auto resolve_shader_import(std::string_view import_path, ImportContext const& context)
    -> Expected<std::filesystem::path, ImportError>;

auto read_shader_import(std::string_view import_path, ImportContext const& context)
    -> Expected<std::string, ImportError>;

}
