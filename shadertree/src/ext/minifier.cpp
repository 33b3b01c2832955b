#include <shadertree/ext/minifier.hpp>

#include <fmt/format.h>
#include <shadertree/runtime/logger.hpp>
#include <shadertree/runtime/text_file.hpp>

#include "wgsl_lexer.hpp"

namespace st::ext {

namespace {

auto is_operator_ch(char ch) -> bool {
    return std::string_view{"+-*/%<>=!&|^"}.find(ch) != std::string_view::npos;
}

}

auto minify_wgsl(std::string_view source) -> Expected<std::string, MinifyError> {
    auto tokens = tokenize_wgsl(source);
    if (!tokens) {
        return MinifyError{tokens.error().message, tokens.error().line};
    }
    if (auto brackets = check_brackets(tokens.value()); !brackets) {
        return MinifyError{brackets.error().message, brackets.error().line};
    }

    std::string minified;
    minified.reserve(source.size());
    WgslToken const* prev = nullptr;
    for (auto const& token : tokens.value()) {
        if (prev) {
            auto both_words = prev->kind == WgslTokenKind::word && token.kind == WgslTokenKind::word;
            // `a - -b` must not become `a--b`
            auto fusable = token.spaced && prev->kind == WgslTokenKind::punct && token.kind == WgslTokenKind::punct
                && is_operator_ch(prev->text.front()) && is_operator_ch(token.text.front());
            if (both_words || fusable) {
                minified += ' ';
            }
        }
        minified += token.text;
        prev = &token;
    }
    if (!minified.empty()) {
        minified += '\n';
    }
    return minified;
}

MinifierExtension::MinifierExtension(MinifierOptions options) : options_(std::move(options)) {}

auto MinifierExtension::enabled() const -> bool {
    return !options_.release_only || options_.profile == "release";
}

auto MinifierExtension::init_root(
    std::filesystem::path const& shader_root, gfx::ShaderCompiler& compiler
) -> build::ExtensionResult {
    if (!enabled()) {
        log::debug("extension", "minifier is skipped in profile '{}'", options_.profile);
    }
    return {};
}

auto MinifierExtension::post_build(
    codec::ModulePath const& module_path,
    std::filesystem::path const& artifact_path,
    Option<gfx::SourceMap> const& source_map
) -> build::ExtensionResult {
    if (!enabled()) { return {}; }

    auto source = rt::read_text_file(artifact_path);
    if (!source) {
        return fmt::format("failed to read '{}'", artifact_path.generic_string());
    }
    auto minified = minify_wgsl(source.value());
    if (!minified) {
        return fmt::format(
            "{} is not valid WGSL at line {}: {}", module_path, minified.error().line, minified.error().message
        );
    }
    if (!rt::write_text_file(artifact_path, minified.value())) {
        return fmt::format("failed to write '{}'", artifact_path.generic_string());
    }
    log::debug("extension", "minified {}: {} -> {} bytes", module_path, source.value().size(), minified.value().size());
    return {};
}

}
