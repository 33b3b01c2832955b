#include <cstdlib>

#include <gtest/gtest.h>
#include <toml++/toml.h>
#include <shadertree/build/publisher.hpp>

#include "../common.hpp"

using namespace st;

namespace {

auto build_two_shaders(test::TempDir const& dir, Span<Box<build::BuildPublisher>> publishers)
    -> Expected<build::BuildOutput, build::BuildError> {
    dir.write("shaders/common.wesl", "fn helper() {}\n");
    dir.write("shaders/a.wesl", "#include \"common.wesl\"\nfn a() {}\n");
    dir.write("shaders/my dir/b.wesl", "fn b() {}\n");
    auto out = dir.mkdir("out");
    return build::build_shader_dir({.shader_root = dir / "shaders", .output_dir = out}, {}, publishers);
}

}

TEST(Publisher, EnvironmentPublishesShaderRoot) {
    test::TempDir dir{};
    unsetenv(build::root_path_env_var);
    unsetenv(build::output_dir_env_var);

    std::vector<Box<build::BuildPublisher>> publishers{};
    publishers.push_back(Box<build::EnvironmentPublisher>::make());
    auto result = build_two_shaders(dir, publishers);
    ASSERT_TRUE(result.has_value()) << result.error().to_string();

    auto value = std::getenv(build::root_path_env_var);
    ASSERT_NE(value, nullptr);
    EXPECT_EQ(std::filesystem::path{value}, dir / "shaders");
    auto out_value = std::getenv(build::output_dir_env_var);
    ASSERT_NE(out_value, nullptr);
    EXPECT_EQ(std::filesystem::path{out_value}, dir / "out");

    unsetenv(build::root_path_env_var);
    unsetenv(build::output_dir_env_var);
}

TEST(Publisher, FailedBuildPublishesNothing) {
    test::TempDir dir{};
    unsetenv(build::root_path_env_var);
    dir.write("shaders/broken.wesl", "#include \"missing.wesl\"\n");
    auto out = dir.mkdir("out");

    std::vector<Box<build::BuildPublisher>> publishers{};
    publishers.push_back(Box<build::EnvironmentPublisher>::make());
    auto result = build::build_shader_dir({.shader_root = dir / "shaders", .output_dir = out}, {}, publishers);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(std::getenv(build::root_path_env_var), nullptr);
}

TEST(Publisher, ManifestListsArtifacts) {
    test::TempDir dir{};
    std::vector<Box<build::BuildPublisher>> publishers{};
    publishers.push_back(Box<build::ManifestPublisher>::make(dir / "manifest.toml"));
    auto result = build_two_shaders(dir, publishers);
    ASSERT_TRUE(result.has_value()) << result.error().to_string();

    auto manifest = toml::parse(dir.read("manifest.toml"));
    EXPECT_EQ(manifest["shader_root"].value<std::string>(), (dir / "shaders").generic_string());
    auto artifacts = manifest["artifacts"].as_array();
    ASSERT_NE(artifacts, nullptr);
    ASSERT_EQ(artifacts->size(), 3u);
    auto const& first = *artifacts->get(0)->as_table();
    EXPECT_EQ(first["module"].value<std::string>(), "package::a");
    EXPECT_EQ(first["name"].value<std::string>(), "package_1a");
    auto const& last = *artifacts->get(2)->as_table();
    EXPECT_EQ(last["module"].value<std::string>(), "package::my dir::b");
    EXPECT_EQ(last["name"].value<std::string>(), "package_8my_20dir1b");
}

TEST(Publisher, DepfileListsTouchedFiles) {
    test::TempDir dir{};
    std::vector<Box<build::BuildPublisher>> publishers{};
    publishers.push_back(Box<build::DepfilePublisher>::make(dir / "shaders.d", "shaders.stamp"));
    auto result = build_two_shaders(dir, publishers);
    ASSERT_TRUE(result.has_value()) << result.error().to_string();

    auto depfile = dir.read("shaders.d");
    EXPECT_TRUE(depfile.starts_with("shaders.stamp:"));
    EXPECT_NE(depfile.find((dir / "shaders/common.wesl").generic_string()), std::string::npos);
    EXPECT_NE(depfile.find("my\\ dir/b.wesl"), std::string::npos);
}

TEST(Publisher, ErrorsNameThePublisher) {
    test::TempDir dir{};
    std::vector<Box<build::BuildPublisher>> publishers{};
    publishers.push_back(Box<build::ManifestPublisher>::make(dir / "missing_dir/manifest.toml"));
    auto result = build_two_shaders(dir, publishers);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, build::BuildErrorKind::io);
    EXPECT_EQ(result.error().path, dir / "missing_dir/manifest.toml");
    EXPECT_EQ(result.error().message.rfind("publisher 'manifest': ", 0), 0u) << result.error().message;
}
