#pragma once

#include <utility>

#include "module_path.hpp"

namespace st::codec {

inline constexpr std::string_view absolute_mangle_prefix = "package_";
inline constexpr std::string_view relative_mangle_prefix = "self_";

// Flattens `path` and the item `name` into an identifier made of `[A-Za-z0-9_]` that starts with a
// letter, e.g. `([sub], b)` becomes `package_3sub1b`.
//
// Each component and then the name is written as `<length><escaped>`. Escaping keeps ASCII letters
// and digits, writes `_` as `__` and any other byte, or a leading digit, as `_` plus two lowercase
// hex digits. An escaped segment never starts with a digit, so lengths are unambiguous.
auto mangle(ModulePath const& path, std::string_view name) -> std::string;

// Inverse of `mangle`. Anything `mangle` cannot produce yields an empty result.
auto unmangle(std::string_view mangled) -> Option<std::pair<ModulePath, std::string>>;

// Names that are not mangled belong to the root module.
auto unmangle_or_root(std::string_view mangled) -> std::pair<ModulePath, std::string>;

}
