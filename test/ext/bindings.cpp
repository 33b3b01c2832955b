#include <gtest/gtest.h>
#include <shadertree/build/build.hpp>
#include <shadertree/ext/bindings.hpp>
#include <shadertree/ext/minifier.hpp>

#include "../common.hpp"

using namespace st;

namespace {

constexpr std::string_view triangle_shader = R"(struct Uniforms {
    color: vec4<f32>,
}

@group(0) @binding(0) var<uniform> uniforms: Uniforms;

@vertex
fn vs_main(@builtin(vertex_index) index: u32) -> @builtin(position) vec4<f32> {
    return vec4<f32>(f32(index), 0.0, 0.0, 1.0);
}

@fragment
fn fs_main() -> @location(0) vec4<f32> {
    return uniforms.color;
}
)";

auto contains(std::string const& text, std::string_view part) -> bool {
    return text.find(part) != std::string::npos;
}

auto build_with_bindings(test::TempDir const& dir, build::ExtensionRegistry& extensions) {
    return build::build_shader_dir({.shader_root = dir / "shaders", .output_dir = dir / "out"}, extensions);
}

}

TEST(Bindings, IndexListsShadersBeforeModules) {
    test::TempDir dir{};
    dir.write("shaders/a.wesl", test::simple_shader);
    dir.write("shaders/sub/b.wesl", test::simple_shader);
    dir.mkdir("out");

    build::ExtensionRegistry extensions{};
    extensions.push_back(Box<ext::BindingsExtension>::make(dir / "bindings"));
    auto result = build_with_bindings(dir, extensions);
    ASSERT_TRUE(result.has_value()) << result.error().to_string();

    auto root_index = dir.read("bindings/mod.hpp");
    auto shader_pos = root_index.find("#include \"a.hpp\"");
    auto module_pos = root_index.find("#include \"sub/mod.hpp\"");
    ASSERT_NE(shader_pos, std::string::npos);
    ASSERT_NE(module_pos, std::string::npos);
    EXPECT_LT(shader_pos, module_pos);

    EXPECT_TRUE(contains(dir.read("bindings/sub/mod.hpp"), "#include \"b.hpp\""));
    EXPECT_TRUE(contains(dir.read("bindings/sub/b.hpp"), "namespace shaders::sub::b {"));
}

TEST(Bindings, ParentIndexStaysWritableAfterExitingModule) {
    test::TempDir dir{};
    dir.write("shaders/sub1/x.wesl", test::simple_shader);
    dir.write("shaders/sub2/y.wesl", test::simple_shader);
    dir.mkdir("out");

    build::ExtensionRegistry extensions{};
    extensions.push_back(Box<ext::BindingsExtension>::make(dir / "bindings"));
    auto result = build_with_bindings(dir, extensions);
    ASSERT_TRUE(result.has_value()) << result.error().to_string();

    auto root_index = dir.read("bindings/mod.hpp");
    EXPECT_TRUE(contains(root_index, "#include \"sub1/mod.hpp\""));
    EXPECT_TRUE(contains(root_index, "#include \"sub2/mod.hpp\""));
    EXPECT_TRUE(std::filesystem::is_regular_file(dir / "bindings/sub1/x.hpp"));
    EXPECT_TRUE(std::filesystem::is_regular_file(dir / "bindings/sub2/y.hpp"));
}

TEST(Bindings, HeaderDescribesCompiledShader) {
    test::TempDir dir{};
    dir.write("shaders/a.wesl", triangle_shader);
    dir.mkdir("out");

    build::ExtensionRegistry extensions{};
    extensions.push_back(Box<ext::BindingsExtension>::make(dir / "bindings"));
    auto result = build_with_bindings(dir, extensions);
    ASSERT_TRUE(result.has_value()) << result.error().to_string();

    auto header = dir.read("bindings/a.hpp");
    EXPECT_TRUE(contains(header, "#pragma once"));
    EXPECT_TRUE(contains(header, "namespace shaders::a {"));
    EXPECT_TRUE(contains(header, "inline constexpr std::string_view module_path = \"package::a\";"));
    EXPECT_TRUE(contains(header, "inline constexpr std::string_view artifact_name = \"package_1a\";"));
    EXPECT_TRUE(contains(header, "inline constexpr std::string_view source =\n"));
    EXPECT_TRUE(contains(header, "std::array<EntryPoint, 2> entry_points"));
    EXPECT_TRUE(contains(header, "{\"vs_main\", \"vertex\"},"));
    EXPECT_TRUE(contains(header, "{\"fs_main\", \"fragment\"},"));
    EXPECT_TRUE(contains(header, "namespace decl {"));
    EXPECT_TRUE(contains(header, "inline constexpr std::string_view Uniforms = \"Uniforms\";"));
    EXPECT_TRUE(contains(header, "inline constexpr std::string_view uniforms = \"uniforms\";"));
}

TEST(Bindings, ErrorsPointAtShaderSource) {
    test::TempDir dir{};
    dir.write("shaders/bad.wesl", "fn f() {\n    return;\n}\n}\n");
    dir.mkdir("out");

    build::ExtensionRegistry extensions{};
    extensions.push_back(Box<ext::BindingsExtension>::make(dir / "bindings"));
    auto result = build_with_bindings(dir, extensions);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, build::BuildErrorKind::extension);
    EXPECT_EQ(result.error().extension_name, "bindings");
    EXPECT_EQ(result.error().stage, build::LifecycleStage::post_build);
    EXPECT_TRUE(contains(result.error().message, "bad.wesl:"));
    EXPECT_TRUE(contains(result.error().message, "unmatched '}'"));
}

TEST(Bindings, ShaderNamedAfterIndexFileIsRejected) {
    test::TempDir dir{};
    dir.write("shaders/mod.wesl", test::simple_shader);
    dir.mkdir("out");

    build::ExtensionRegistry extensions{};
    extensions.push_back(Box<ext::BindingsExtension>::make(dir / "bindings"));
    auto result = build_with_bindings(dir, extensions);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(contains(result.error().message, "index file 'mod.hpp'"));
}

TEST(Bindings, ClashingNamespacesAreSuffixed) {
    test::TempDir dir{};
    dir.write("shaders/a-b.wesl", test::simple_shader);
    dir.write("shaders/a.wesl", test::simple_shader);
    dir.write("shaders/a_b.wesl", test::simple_shader);
    dir.write("shaders/a/source.wesl", test::simple_shader);
    dir.write("shaders/a/module_path.wesl", test::simple_shader);
    dir.mkdir("out");

    build::ExtensionRegistry extensions{};
    extensions.push_back(Box<ext::BindingsExtension>::make(dir / "bindings"));
    auto result = build_with_bindings(dir, extensions);
    ASSERT_TRUE(result.has_value()) << result.error().to_string();

    EXPECT_TRUE(contains(dir.read("bindings/a-b.hpp"), "namespace shaders::a_b {"));
    EXPECT_TRUE(contains(dir.read("bindings/a_b.hpp"), "namespace shaders::a_b_ {"));
    EXPECT_TRUE(contains(dir.read("bindings/a.hpp"), "namespace shaders::a {"));
    EXPECT_TRUE(contains(dir.read("bindings/a/source.hpp"), "namespace shaders::a::source_ {"));
    EXPECT_TRUE(contains(dir.read("bindings/a/module_path.hpp"), "namespace shaders::a::module_path_ {"));
}

TEST(Bindings, DirectoryNameThatCannotBeIncludedIsRejected) {
    test::TempDir dir{};
    dir.write("shaders/we\"ird/a.wesl", test::simple_shader);
    dir.mkdir("out");

    build::ExtensionRegistry extensions{};
    extensions.push_back(Box<ext::BindingsExtension>::make(dir / "bindings"));
    auto result = build_with_bindings(dir, extensions);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, build::BuildErrorKind::extension);
    EXPECT_EQ(result.error().stage, build::LifecycleStage::enter_module);
    EXPECT_TRUE(contains(result.error().message, "cannot be used in an #include"));
}

TEST(Bindings, EmbedsSourceBeforeMinifier) {
    test::TempDir dir{};
    dir.write("shaders/a.wesl", test::simple_shader);
    dir.mkdir("out");

    build::ExtensionRegistry extensions{};
    extensions.push_back(Box<ext::BindingsExtension>::make(
        dir / "bindings", ext::BindingsOptions{.root_namespace = "game"}
    ));
    extensions.push_back(Box<ext::MinifierExtension>::make(ext::MinifierOptions{.profile = "release"}));
    auto result = build_with_bindings(dir, extensions);
    ASSERT_TRUE(result.has_value()) << result.error().to_string();

    auto header = dir.read("bindings/a.hpp");
    EXPECT_TRUE(contains(header, "namespace game::a {"));
    EXPECT_TRUE(contains(header, "return 1.0;\\n\""));
    EXPECT_EQ(dir.read("out/package_1a.wgsl"), "fn value()->f32{return 1.0;}\n");
}

TEST(BindingGenerator, CppIdentifiers) {
    EXPECT_EQ(ext::to_cpp_identifier("color"), "color");
    EXPECT_EQ(ext::to_cpp_identifier("class"), "class_");
    EXPECT_EQ(ext::to_cpp_identifier("1st"), "_1st");
    EXPECT_EQ(ext::to_cpp_identifier("my dir"), "my_dir");
}

TEST(BindingGenerator, DemangledDeclarationsAreGrouped) {
    auto path = ext::demangle_declaration("package_3sub1b");
    EXPECT_EQ(path, (ext::TypePath{{"sub"}, "b"}));
    EXPECT_EQ(ext::demangle_declaration("Uniforms"), (ext::TypePath{{}, "Uniforms"}));

    ext::CppBindingGenerator generator{};
    auto generated = generator.generate(
        "fn package_3sub1b() {}\nconst sub = 1;\n", "ref", {.emit_source = false}, ext::demangle_declaration
    );
    ASSERT_TRUE(generated.has_value()) << generated.error().message;
    EXPECT_TRUE(contains(generated.value(), "namespace decl::sub {\ninline constexpr std::string_view b = \"package_3sub1b\";"));
    EXPECT_TRUE(contains(generated.value(), "inline constexpr std::string_view sub_ = \"sub\";"));
    EXPECT_FALSE(contains(generated.value(), "// ref"));
}

TEST(BindingGenerator, ClashingDeclarationNamesAreSuffixed) {
    ext::CppBindingGenerator generator{};
    auto generated = generator.generate(
        "fn package_3sub1b() {}\nconst sub = 1;\nconst sub_ = 2;\n", "ref", {.emit_source = false},
        ext::demangle_declaration
    );
    ASSERT_TRUE(generated.has_value()) << generated.error().message;
    EXPECT_TRUE(contains(generated.value(), "inline constexpr std::string_view sub_ = \"sub\";"));
    EXPECT_TRUE(contains(generated.value(), "inline constexpr std::string_view sub__ = \"sub_\";"));
}
