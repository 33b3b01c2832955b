#include <shadertree/gfx/shader_compiler.hpp>

#include <list>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <cprep/cprep.hpp>
#include <shadertree/gfx/shader_source.hpp>
#include <shadertree/runtime/logger.hpp>
#include <shadertree/runtime/text_file.hpp>

namespace st::gfx {

namespace {

// The preprocessor has no token for WGSL attributes, so `@` is spelled as an identifier prefix
// while it runs.
constexpr std::string_view attribute_sign = "@";
constexpr std::string_view attribute_placeholder = "__st_attr__";

auto replace_all(std::string str, std::string_view from, std::string_view to) -> std::string {
    for (
        size_t pos = 0;
        (pos = str.find(from.data(), pos, from.size())) != std::string::npos;
        pos += to.size()
    ) {
        str.replace(pos, from.size(), to.data(), to.size());
    }
    return str;
}

struct ShaderIncluder final : pep::cprep::ShaderIncluder {
    explicit ShaderIncluder(std::filesystem::path const& shader_root) : shader_root_(shader_root) {}

    auto require_header(std::string_view header_name, std::string_view file_path, Result &result) -> bool override {
        auto rel_path = (std::filesystem::path{file_path}.parent_path() / header_name).lexically_normal();
        if (try_load(rel_path, result)) {
            return true;
        }
        if (try_load(std::filesystem::path{header_name}.lexically_normal(), result)) {
            return true;
        }
        missing_headers_.push_back(fmt::format("'{}' included from '{}'", header_name, file_path));
        return false;
    }

    auto clear() -> void override {
        loaded_files_.clear();
    }

    auto visited_files() const -> std::vector<std::filesystem::path> const& { return visited_files_; }
    auto missing_headers() const -> std::vector<std::string> const& { return missing_headers_; }

private:
    auto try_load(std::filesystem::path const& rel_path, Result& result) -> bool {
        // Only files below the shader root can be included.
        if (rel_path.empty() || rel_path.has_root_path() || *rel_path.begin() == "..") { return false; }
        auto full_path = shader_root_ / rel_path;
        std::error_code ec;
        if (!std::filesystem::is_regular_file(full_path, ec)) { return false; }
        auto content = rt::read_text_file(full_path);
        if (!content) { return false; }

        loaded_files_.push_back(replace_all(std::move(content).value(), attribute_sign, attribute_placeholder));
        result.header_content = loaded_files_.back();
        result.header_path = rel_path.generic_string();
        visited_files_.push_back(full_path);
        return true;
    }

    std::filesystem::path const& shader_root_;
    std::list<std::string> loaded_files_;
    std::vector<std::filesystem::path> visited_files_;
    std::vector<std::string> missing_headers_;
};

} // namespace

auto CompiledShader::write_artifact(std::filesystem::path const& path) const -> Expected<void, std::string> {
    if (!rt::write_text_file(path, source)) {
        return fmt::format("failed to write artifact '{}'", path.generic_string());
    }
    return {};
}

struct ShaderCompiler::Impl final {
    Impl(std::filesystem::path shader_root, CompileOptions options)
        : shader_root(std::move(shader_root)), options(std::move(options)) {}

    auto compile(codec::ModulePath const& module_path) const -> Expected<CompiledShader, std::string> {
        auto source_path = find_shader_source(shader_root, module_path);
        if (!source_path) {
            return fmt::format(
                "shader module '{}' not found under '{}'", module_path, shader_root.generic_string()
            );
        }
        auto shader_content = rt::read_text_file(source_path.value());
        if (!shader_content) {
            return fmt::format("failed to read '{}'", source_path.value().generic_string());
        }
        auto input_path = source_path.value().lexically_relative(shader_root).generic_string();

        std::list<std::string> options_owned_str{};
        std::vector<std::string_view> preprocess_options{};
        preprocess_options.reserve(options.defines.size() * 2);
        for (auto const& [key, value] : options.defines) {
            preprocess_options.push_back("-D");
            if (value.empty()) {
                preprocess_options.push_back(key);
            } else {
                auto& opt = options_owned_str.emplace_back(fmt::format("{}={}", key, value));
                preprocess_options.push_back(opt);
            }
        }

        auto protected_content = replace_all(std::move(shader_content).value(), attribute_sign, attribute_placeholder);
        ShaderIncluder shader_includer{shader_root};
        pep::cprep::Preprocessor preprocessor{};
        auto result = preprocessor.do_preprocess(
            input_path, protected_content, shader_includer, preprocess_options.data(), preprocess_options.size()
        );
        if (!result.error.empty()) {
            return fmt::format("failed to preprocess '{}':\n{}", input_path, result.error);
        }
        if (!shader_includer.missing_headers().empty()) {
            return fmt::format(
                "failed to resolve includes of '{}': {}",
                input_path, fmt::join(shader_includer.missing_headers(), ", ")
            );
        }
        if (!result.warning.empty()) {
            log::warn("compiler", "preprocessing '{}':\n{}", input_path, result.warning);
        }

        auto [source, source_map] = split_line_markers(
            replace_all(std::move(result.parsed_result), attribute_placeholder, attribute_sign), input_path
        );

        CompiledShader compiled{
            .module_path = module_path,
            .source = std::move(source),
            .source_map = {},
            .visited_files = {source_path.value()},
        };
        if (options.use_sourcemap) {
            compiled.source_map = std::move(source_map);
        }
        auto const& included = shader_includer.visited_files();
        compiled.visited_files.insert(compiled.visited_files.end(), included.begin(), included.end());
        return compiled;
    }

    std::filesystem::path shader_root;
    CompileOptions options;
};

ShaderCompiler::ShaderCompiler(std::filesystem::path shader_root, CompileOptions options)
    : PImpl(std::move(shader_root), std::move(options)) {}

ShaderCompiler::~ShaderCompiler() = default;

auto ShaderCompiler::shader_root() const -> std::filesystem::path const& {
    return impl()->shader_root;
}

auto ShaderCompiler::options() -> CompileOptions& {
    return impl()->options;
}
auto ShaderCompiler::options() const -> CompileOptions const& {
    return impl()->options;
}

auto ShaderCompiler::compile(codec::ModulePath const& module_path) const -> Expected<CompiledShader, std::string> {
    return impl()->compile(module_path);
}

}
