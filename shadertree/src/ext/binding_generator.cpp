#include <shadertree/ext/binding_generator.hpp>

#include <algorithm>
#include <iterator>
#include <map>
#include <set>

#include <fmt/format.h>
#include <shadertree/codec/mangler.hpp>
#include <shadertree/prelude/misc.hpp>

#include "wgsl_lexer.hpp"

namespace st::ext {

namespace {

constexpr std::string_view cpp_keywords[]{
    "alignas", "alignof", "and", "and_eq", "asm", "auto", "bitand", "bitor", "bool", "break",
    "case", "catch", "char", "char8_t", "char16_t", "char32_t", "class", "compl", "concept", "const",
    "consteval", "constexpr", "constinit", "const_cast", "continue", "co_await", "co_return",
    "co_yield", "decltype", "default", "delete", "do", "double", "dynamic_cast", "else", "enum",
    "explicit", "export", "extern", "false", "float", "for", "friend", "goto", "if", "inline",
    "int", "long", "mutable", "namespace", "new", "noexcept", "not", "not_eq", "nullptr",
    "operator", "or", "or_eq", "private", "protected", "public", "register", "reinterpret_cast",
    "requires", "return", "short", "signed", "sizeof", "static", "static_assert", "static_cast",
    "struct", "switch", "template", "this", "thread_local", "throw", "true", "try", "typedef",
    "typeid", "typename", "union", "unsigned", "using", "virtual", "void", "volatile", "wchar_t",
    "while", "xor", "xor_eq", "final", "override", "import", "module",
};

constexpr std::string_view declaration_keywords[]{
    "fn", "struct", "alias", "const", "override", "var",
};

constexpr std::string_view shader_stages[]{"vertex", "fragment", "compute"};

template <size_t N>
auto contains(std::string_view const (&arr)[N], std::string_view value) -> bool {
    return std::find(std::begin(arr), std::end(arr), value) != std::end(arr);
}

struct EntryPoint final {
    std::string_view name;
    std::string_view stage;
};

struct ShaderDeclarations final {
    std::vector<EntryPoint> entry_points;
    std::vector<std::string_view> names;
};

auto scan_declarations(std::vector<WgslToken> const& tokens) -> Expected<ShaderDeclarations, CodegenError> {
    ShaderDeclarations result{};
    int depth = 0;
    Option<std::string_view> pending_stage{};

    for (size_t i = 0; i < tokens.size(); i++) {
        auto const& token = tokens[i];
        if (token.kind == WgslTokenKind::punct) {
            if (token.text == "{") {
                ++depth;
            } else if (token.text == "}") {
                --depth;
            } else if (
                token.text == "@" && depth == 0 && i + 1 < tokens.size()
                && contains(shader_stages, tokens[i + 1].text)
            ) {
                pending_stage = tokens[i + 1].text;
                ++i;
            }
            continue;
        }
        if (depth != 0 || !contains(declaration_keywords, token.text)) { continue; }
        // `@builtin(position)`, `x.override` and similar are not declarations.
        if (i > 0 && tokens[i - 1].kind == WgslTokenKind::punct && (tokens[i - 1].text == "@" || tokens[i - 1].text == ".")) {
            continue;
        }

        auto name_index = i + 1;
        if (token.text == "var" && name_index < tokens.size() && tokens[name_index].text == "<") {
            int template_depth = 0;
            for (; name_index < tokens.size(); name_index++) {
                if (tokens[name_index].text == "<") {
                    ++template_depth;
                } else if (tokens[name_index].text == ">") {
                    --template_depth;
                    if (template_depth == 0) { break; }
                }
            }
            ++name_index;
        }
        if (name_index >= tokens.size() || tokens[name_index].kind != WgslTokenKind::word) {
            return CodegenError{fmt::format("expected a name after '{}'", token.text), token.line};
        }

        auto name = tokens[name_index].text;
        if (token.text == "fn") {
            if (pending_stage) {
                result.entry_points.push_back(EntryPoint{name, pending_stage.value()});
            }
            pending_stage.reset();
        }
        result.names.push_back(name);
        i = name_index;
    }
    return result;
}

auto join_namespace(std::vector<std::string> const& components) -> std::string {
    std::string str;
    for (auto const& component : components) {
        if (!str.empty()) { str += "::"; }
        str += component;
    }
    return str;
}

auto emit_declarations(std::vector<std::string_view> const& names, DemangleFn const& demangle) -> std::string {
    // namespace components -> (C++ name, name in the shader)
    std::map<std::vector<std::string>, std::multimap<std::string, std::string_view>> groups{};
    for (auto name : names) {
        auto type_path = demangle(name);
        std::vector<std::string> components{"decl"};
        for (auto const& parent : type_path.parents) {
            components.push_back(to_cpp_identifier(parent));
        }
        groups[std::move(components)].emplace(to_cpp_identifier(type_path.name), name);
    }

    std::string out;
    for (auto const& [components, decls] : groups) {
        // A constant cannot share its name with a nested namespace.
        std::set<std::string> child_namespaces{};
        for (auto const& [other, _] : groups) {
            if (other.size() > components.size() && std::equal(components.begin(), components.end(), other.begin())) {
                child_namespaces.insert(other[components.size()]);
            }
        }

        // Names that only differ in characters C++ does not allow map to the same identifier.
        auto taken = std::move(child_namespaces);
        out += fmt::format("namespace {} {{\n", join_namespace(components));
        for (auto const& [cpp_name, name] : decls) {
            auto decl_name = cpp_name;
            while (taken.contains(decl_name)) {
                decl_name += '_';
            }
            taken.insert(decl_name);
            out += fmt::format("inline constexpr std::string_view {} = \"{}\";\n", decl_name, name);
        }
        out += "}\n";
    }
    return out;
}

auto emit_entry_points(std::vector<EntryPoint> const& entry_points) -> std::string {
    std::string out = "struct EntryPoint final {\n"
        "    std::string_view name;\n"
        "    std::string_view stage;\n"
        "};\n\n";
    if (entry_points.empty()) {
        out += "inline constexpr std::array<EntryPoint, 0> entry_points{};\n";
        return out;
    }
    out += fmt::format("inline constexpr std::array<EntryPoint, {}> entry_points{{{{\n", entry_points.size());
    for (auto const& entry : entry_points) {
        out += fmt::format("    {{\"{}\", \"{}\"}},\n", entry.name, entry.stage);
    }
    out += "}};\n";
    return out;
}

} // namespace

auto demangle_declaration(std::string_view name) -> TypePath {
    if (name.starts_with(codec::absolute_mangle_prefix)) {
        auto [path, item] = codec::unmangle_or_root(name);
        return TypePath{std::move(path.components), std::move(item)};
    }
    return TypePath{{}, std::string{name}};
}

auto to_cpp_identifier(std::string_view name) -> std::string {
    std::string id;
    id.reserve(name.size() + 1);
    for (auto ch : name) {
        id += is_ascii_alnum(ch) || ch == '_' ? ch : '_';
    }
    if (id.empty() || is_ascii_digit(id.front())) {
        id.insert(id.begin(), '_');
    }
    if (contains(cpp_keywords, id)) {
        id += '_';
    }
    return id;
}

auto to_cpp_string_literal(std::string_view text, std::string_view indent) -> std::string {
    if (text.empty()) {
        return fmt::format("{}\"\"", indent);
    }

    std::string out;
    out.reserve(text.size() + text.size() / 8);
    bool line_start = true;
    for (size_t i = 0; i < text.size(); i++) {
        auto ch = text[i];
        if (line_start) {
            out += indent;
            out += '"';
            line_start = false;
        }
        switch (ch) {
            case '\\': out += "\\\\"; break;
            case '"': out += "\\\""; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            case '\n':
                out += "\\n\"";
                if (i + 1 < text.size()) {
                    out += '\n';
                    line_start = true;
                }
                continue;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    out += fmt::format("\\{:03o}", static_cast<unsigned char>(ch));
                } else {
                    out += ch;
                }
                break;
        }
    }
    if (text.back() != '\n') {
        out += '"';
    }
    return out;
}

auto CppBindingGenerator::generate(
    std::string_view source_text,
    std::string_view source_reference,
    BindingOptions const& options,
    DemangleFn const& demangle
) const -> Expected<std::string, CodegenError> {
    auto tokens = tokenize_wgsl(source_text);
    if (!tokens) {
        return CodegenError{tokens.error().message, tokens.error().line};
    }
    if (auto brackets = check_brackets(tokens.value()); !brackets) {
        return CodegenError{brackets.error().message, brackets.error().line};
    }
    auto declarations = scan_declarations(tokens.value());
    if (!declarations) {
        return std::move(declarations).error();
    }

    std::string out;
    if (options.emit_source) {
        out += fmt::format("// {}\n", source_reference);
        out += fmt::format("inline constexpr std::string_view source =\n{};\n\n", to_cpp_string_literal(source_text, "    "));
    }
    out += emit_entry_points(declarations.value().entry_points);
    if (options.emit_declarations) {
        out += '\n';
        out += emit_declarations(declarations.value().names, demangle);
    }
    return out;
}

}
