#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <gtest/gtest.h>
#include <shadertree/runtime/text_file.hpp>

namespace st::test {

// A scratch directory named after the running test, removed again when the test ends.
struct TempDir final {
    TempDir() {
        auto const* info = ::testing::UnitTest::GetInstance()->current_test_info();
        path_ = std::filesystem::temp_directory_path()
            / fmt::format("shadertree-{}-{}", info->test_suite_name(), info->name());
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(TempDir const&) = delete;
    auto operator=(TempDir const&) -> TempDir& = delete;

    auto path() const -> std::filesystem::path const& { return path_; }

    auto operator/(std::string_view rel_path) const -> std::filesystem::path { return path_ / rel_path; }

    auto write(std::string_view rel_path, std::string_view content) const -> std::filesystem::path {
        auto file_path = path_ / rel_path;
        std::filesystem::create_directories(file_path.parent_path());
        EXPECT_TRUE(rt::write_text_file(file_path, content)) << file_path;
        return file_path;
    }

    auto mkdir(std::string_view rel_path) const -> std::filesystem::path {
        auto dir_path = path_ / rel_path;
        std::filesystem::create_directories(dir_path);
        return dir_path;
    }

    auto read(std::string_view rel_path) const -> std::string {
        return rt::read_text_file(path_ / rel_path).value_or("");
    }

private:
    std::filesystem::path path_;
};

inline constexpr std::string_view simple_shader = "fn value() -> f32 {\n    return 1.0;\n}\n";

}
