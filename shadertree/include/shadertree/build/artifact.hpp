#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

#include "../codec/module_path.hpp"

namespace st::build {

inline constexpr std::string_view artifact_extension = "wgsl";

// NAME_MAX of common file systems. Deep trees or escaped non-ASCII names can exceed it.
inline constexpr size_t max_artifact_file_name = 255;

// `mangle(parent, last)`, so `package::sub::b` is named `package_3sub1b`.
auto artifact_name_of(codec::ModulePath const& module_path) -> std::string;

// `{output_dir}/{mangled_name}.wgsl`
auto artifact_path(std::filesystem::path const& output_dir, std::string_view mangled_name) -> std::filesystem::path;

auto artifact_path_of(std::filesystem::path const& output_dir, codec::ModulePath const& module_path)
    -> std::filesystem::path;

}
