#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <shadertree/build/extension.hpp>
#include <shadertree/gfx/shader_compiler.hpp>

namespace st::test {

using CallLog = std::shared_ptr<std::vector<std::string>>;

// Appends "<name>.<hook>(<argument>)" to a log shared by all extensions of a build.
struct RecordingExtension final : build::BuildExtension {
    RecordingExtension(std::string name, CallLog calls, Option<build::LifecycleStage> fail_on = {})
        : name_(std::move(name)), calls_(std::move(calls)), fail_on_(fail_on) {}

    auto name() const -> std::string_view override { return name_; }

    auto init_root(std::filesystem::path const& shader_root, gfx::ShaderCompiler& compiler) -> build::ExtensionResult override {
        if (on_init_root) { on_init_root(compiler); }
        return record(build::LifecycleStage::init_root, "");
    }

    auto enter_module(std::filesystem::path const& dir_path) -> build::ExtensionResult override {
        return record(build::LifecycleStage::enter_module, dir_path.filename().string());
    }

    auto exit_module(std::filesystem::path const& dir_path) -> build::ExtensionResult override {
        return record(build::LifecycleStage::exit_module, dir_path.filename().string());
    }

    auto post_build(
        codec::ModulePath const& module_path,
        std::filesystem::path const& artifact_path,
        Option<gfx::SourceMap> const& source_map
    ) -> build::ExtensionResult override {
        if (on_post_build) { on_post_build(module_path, artifact_path); }
        return record(build::LifecycleStage::post_build, module_path.to_string());
    }

    auto exit_root(std::filesystem::path const& shader_root, gfx::ShaderCompiler const& compiler) -> build::ExtensionResult override {
        return record(build::LifecycleStage::exit_root, "");
    }

    std::function<void(gfx::ShaderCompiler&)> on_init_root;
    std::function<void(codec::ModulePath const&, std::filesystem::path const&)> on_post_build;

private:
    auto record(build::LifecycleStage stage, std::string_view argument) -> build::ExtensionResult {
        calls_->push_back(fmt::format("{}.{}({})", name_, build::to_string(stage), argument));
        if (fail_on_ && fail_on_.value() == stage) {
            return fmt::format("{} failed on purpose", name_);
        }
        return {};
    }

    std::string name_;
    CallLog calls_;
    Option<build::LifecycleStage> fail_on_;
};

inline auto make_call_log() -> CallLog {
    return std::make_shared<std::vector<std::string>>();
}

}
