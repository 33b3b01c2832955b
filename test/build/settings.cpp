#include <cstdlib>

#include <gtest/gtest.h>
#include <shadertree/build/publisher.hpp>
#include <shadertree/build/settings.hpp>
#include <shadertree/project/project.hpp>

#include "../common.hpp"

using namespace st;

namespace {

constexpr std::string_view full_project = R"(
[build]
shader_root = "shaders"
output_dir = "out/shaders"
profile = "release"
manifest = "out/manifest.toml"
depfile = "out/shaders.d"
publish_environment = false

[compile]
use_sourcemap = false
defines = { USE_FOG = 1, QUALITY = "high", DEBUG_VIEW = true }

[log]
level = "debug"
file = "shadertree.log"

[extensions.bindings]
enabled = true
output_dir = "generated"
namespace = "game_shaders"

[extensions.minifier]
enabled = true
release_only = false

[extensions.size_report]
enabled = true
)";

}

TEST(BuildSettings, ReadsEverySection) {
    auto result = build::BuildSettings::from_toml(full_project, "/project");
    ASSERT_TRUE(result.has_value()) << result.error();
    auto const& settings = result.value();

    EXPECT_EQ(settings.shader_root, std::filesystem::path{"/project/shaders"});
    EXPECT_EQ(settings.output_dir, std::filesystem::path{"/project/out/shaders"});
    EXPECT_EQ(settings.profile, "release");
    EXPECT_EQ(settings.manifest_path.value(), std::filesystem::path{"/project/out/manifest.toml"});
    EXPECT_EQ(settings.depfile_path.value(), std::filesystem::path{"/project/out/shaders.d"});
    EXPECT_FALSE(settings.publish_environment);

    EXPECT_FALSE(settings.compile_options.use_sourcemap);
    EXPECT_EQ(settings.compile_options.defines.at("USE_FOG"), "1");
    EXPECT_EQ(settings.compile_options.defines.at("QUALITY"), "high");
    EXPECT_EQ(settings.compile_options.defines.at("DEBUG_VIEW"), "1");

    EXPECT_EQ(settings.log_level, rt::LogLevel::debug);
    EXPECT_EQ(settings.log_file.value(), std::filesystem::path{"/project/shadertree.log"});

    EXPECT_TRUE(settings.bindings.enabled);
    EXPECT_EQ(settings.bindings.output_dir, std::filesystem::path{"/project/generated"});
    EXPECT_EQ(settings.bindings.root_namespace, "game_shaders");
    EXPECT_EQ(settings.bindings.index_file, "mod.hpp");
    EXPECT_TRUE(settings.minifier.enabled);
    EXPECT_FALSE(settings.minifier.release_only);
    EXPECT_TRUE(settings.size_report.enabled);
}

TEST(BuildSettings, DefaultsForOptionalKeys) {
    auto result = build::BuildSettings::from_toml(
        "[build]\nshader_root = \"/abs/shaders\"\noutput_dir = \"out\"\n", "/project"
    );
    ASSERT_TRUE(result.has_value()) << result.error();
    auto const& settings = result.value();

    EXPECT_EQ(settings.shader_root, std::filesystem::path{"/abs/shaders"});
    EXPECT_EQ(settings.profile, "debug");
    EXPECT_FALSE(settings.manifest_path.has_value());
    EXPECT_TRUE(settings.publish_environment);
    EXPECT_TRUE(settings.compile_options.use_sourcemap);
    EXPECT_EQ(settings.log_level, rt::LogLevel::info);
    EXPECT_FALSE(settings.bindings.enabled);
    EXPECT_FALSE(settings.minifier.enabled);
    EXPECT_TRUE(settings.minifier.release_only);
}

TEST(BuildSettings, OutputDirFromEnvironment) {
    setenv(build::output_dir_env_var, "/host/out", 1);
    auto result = build::BuildSettings::from_toml("[build]\nshader_root = \"shaders\"\n", "/project");
    unsetenv(build::output_dir_env_var);

    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(result.value().output_dir, std::filesystem::path{"/host/out"});
}

TEST(BuildSettings, ReportsInvalidProjects) {
    unsetenv(build::output_dir_env_var);
    EXPECT_FALSE(build::BuildSettings::from_toml("[build]\noutput_dir = \"out\"\n", "/project").has_value());
    EXPECT_FALSE(build::BuildSettings::from_toml("[build]\nshader_root = \"s\"\n", "/project").has_value());
    EXPECT_FALSE(build::BuildSettings::from_toml("[build\nshader_root = ", "/project").has_value());

    auto bad_level = build::BuildSettings::from_toml(
        "[build]\nshader_root = \"s\"\noutput_dir = \"o\"\n[log]\nlevel = \"loud\"\n", "/project"
    );
    ASSERT_FALSE(bad_level.has_value());
    EXPECT_NE(bad_level.error().find("loud"), std::string::npos);

    auto bad_define = build::BuildSettings::from_toml(
        "[build]\nshader_root = \"s\"\noutput_dir = \"o\"\n[compile]\ndefines = { X = 1.5 }\n", "/project"
    );
    ASSERT_FALSE(bad_define.has_value());

    auto bindings_without_dir = build::BuildSettings::from_toml(
        "[build]\nshader_root = \"s\"\noutput_dir = \"o\"\n[extensions.bindings]\nenabled = true\n", "/project"
    );
    ASSERT_FALSE(bindings_without_dir.has_value());
}

TEST(BuildSettings, LoadsProjectFile) {
    test::TempDir dir{};
    auto project_file = dir.write("project.toml", "[build]\nshader_root = \"shaders\"\noutput_dir = \"out\"\n");

    auto result = build::BuildSettings::load(project_file);
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(result.value().shader_root, dir / "shaders");

    auto missing = build::BuildSettings::load(dir / "missing.toml");
    ASSERT_FALSE(missing.has_value());
}

TEST(Project, ExtensionsAreRegisteredInDocumentedOrder) {
    auto result = build::BuildSettings::from_toml(full_project, "/project");
    ASSERT_TRUE(result.has_value()) << result.error();

    auto extensions = make_extensions(result.value());
    ASSERT_EQ(extensions.size(), 3u);
    EXPECT_EQ(extensions[0]->name(), "bindings");
    EXPECT_EQ(extensions[1]->name(), "minifier");
    EXPECT_EQ(extensions[2]->name(), "size_report");

    auto publishers = make_publishers(result.value());
    ASSERT_EQ(publishers.size(), 2u);
    EXPECT_EQ(publishers[0]->name(), "manifest");
    EXPECT_EQ(publishers[1]->name(), "depfile");
}

TEST(Project, RunsBuildDescribedByProjectFile) {
    test::TempDir dir{};
    dir.write("shaders/a.wesl", "@fragment\nfn fs_main() -> @location(0) vec4<f32> {\n    return vec4<f32>(1.0);\n}\n");
    auto project_file = dir.write("project.toml", R"(
[build]
shader_root = "shaders"
output_dir = "build/shaders"
manifest = "build/manifest.toml"
publish_environment = false

[extensions.bindings]
enabled = true
output_dir = "build/bindings"
)");

    auto settings = build::BuildSettings::load(project_file);
    ASSERT_TRUE(settings.has_value()) << settings.error();
    auto output = run_project(settings.value());
    ASSERT_TRUE(output.has_value()) << output.error().to_string();

    EXPECT_TRUE(std::filesystem::is_regular_file(dir / "build/shaders/package_1a.wgsl"));
    EXPECT_TRUE(std::filesystem::is_regular_file(dir / "build/manifest.toml"));
    EXPECT_TRUE(std::filesystem::is_regular_file(dir / "build/bindings/a.hpp"));
}
