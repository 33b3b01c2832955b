#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "../prelude/expected.hpp"

namespace st::ext {

// Where a declaration name of a compiled shader came from.
struct TypePath final {
    std::vector<std::string> parents;
    std::string name;

    auto operator==(TypePath const& rhs) const -> bool = default;
};

using DemangleFn = std::function<auto (std::string_view) -> TypePath>;

// Names starting with `package_` are unmangled, everything else belongs to the root module.
auto demangle_declaration(std::string_view name) -> TypePath;

struct BindingOptions final {
    bool emit_source = true;
    bool emit_declarations = true;
};

struct CodegenError final {
    std::string message;
    // 1-based line of the compiled source, 0 if unknown.
    uint32_t line = 0;
};

struct BindingGenerator {
    virtual ~BindingGenerator() = default;

    // Returns declarations to be placed inside the module's namespace.
    virtual auto generate(
        std::string_view source_text,
        std::string_view source_reference,
        BindingOptions const& options,
        DemangleFn const& demangle
    ) const -> Expected<std::string, CodegenError> = 0;
};

// Emits C++ declarations: the compiled source as a string, the entry points and the names of
// all top-level declarations.
struct CppBindingGenerator final : BindingGenerator {
    auto generate(
        std::string_view source_text,
        std::string_view source_reference,
        BindingOptions const& options,
        DemangleFn const& demangle
    ) const -> Expected<std::string, CodegenError> override;
};

// Appends `_` to C++ keywords and replaces characters that cannot appear in an identifier.
auto to_cpp_identifier(std::string_view name) -> std::string;

// A double-quoted C++ string literal, split after every newline.
auto to_cpp_string_literal(std::string_view text, std::string_view indent) -> std::string;

}
